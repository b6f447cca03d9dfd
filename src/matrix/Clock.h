#pragma once

#include <stdint.h>

#include "matrix/MatrixTypes.h"

struct ActivationRequest {
  Position position{};
  uint32_t duration_ms = 0;
};

enum class WaitOutcome { elapsed, interrupted, request };

static inline const char* toString(WaitOutcome w) {
  switch (w) {
    case WaitOutcome::elapsed:     return "elapsed";
    case WaitOutcome::interrupted: return "interrupted";
    case WaitOutcome::request:     return "request";
    default:                       return "unknown";
  }
}

// Time source plus the cancellable wait used by every blocking path.
class Clock {
public:
  virtual ~Clock() = default;

  virtual uint32_t nowMs() = 0;
  virtual void delayMicros(uint32_t us) = 0;

  // Blocks for up to maxMs. Returns early on an interrupt, or, when `request`
  // is non-null, on a new activation request which is written to it.
  virtual WaitOutcome waitFor(uint32_t maxMs, ActivationRequest* request) = 0;
};

static inline bool reached(uint32_t nowMs, uint32_t deadlineMs) {
  return (int32_t)(nowMs - deadlineMs) >= 0;
}
