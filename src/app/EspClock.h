#pragma once

#include <Arduino.h>

#include "matrix/Clock.h"

// Clock backed by millis() and the console queue. A blocking wait wakes on
// Ctrl-C, `stop`, `reset`, or (when the caller accepts one) `activate`.
class EspClock : public Clock {
public:
  // Geometry used to decode `activate` lines that arrive mid-wait.
  void setRequestGeometry(const MatrixGeometry& g) { geometry_ = g; }

  uint32_t nowMs() override { return millis(); }
  void delayMicros(uint32_t us) override { delayMicroseconds(us); }
  WaitOutcome waitFor(uint32_t maxMs, ActivationRequest* request) override;

  // True once if the last interrupt was a `reset` command.
  bool takeResetRequest();

private:
  static constexpr uint32_t kSliceMs = 250;

  MatrixGeometry geometry_{};
  bool resetRequested_ = false;
};
