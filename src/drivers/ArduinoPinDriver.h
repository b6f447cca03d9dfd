#pragma once

#include <Arduino.h>

#include "drivers/PinDriver.h"

// PinDriver over the Arduino-ESP32 GPIO calls. Every configured pin is
// claimed; claiming a pin twice is reported as busy.
class ArduinoPinDriver : public PinDriver {
public:
  MatrixError configure(uint8_t pin, PinDirection dir, PullMode pull) override;
  MatrixError setLevel(uint8_t pin, PinLevel level) override;
  MatrixError readLevel(uint8_t pin, PinLevel& out) override;
  void release(uint8_t pin) override;

  uint8_t claimedCount() const;

private:
  static constexpr uint8_t kMaxPins = 64;

  uint64_t claimed_ = 0;
  uint64_t outputs_ = 0;

  static bool bit_(uint64_t mask, uint8_t pin) { return (mask >> pin) & 1u; }
};
