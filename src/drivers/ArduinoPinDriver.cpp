#include "drivers/ArduinoPinDriver.h"

#include <driver/gpio.h>

MatrixError ArduinoPinDriver::configure(uint8_t pin, PinDirection dir, PullMode pull) {
  if (pin >= kMaxPins || !GPIO_IS_VALID_GPIO(pin)) {
    Serial.printf("[GPIO] pin %u is not a GPIO on this chip\n", (unsigned)pin);
    return MatrixError::hardware;
  }
  if (bit_(claimed_, pin)) {
    Serial.printf("[GPIO] pin %u busy\n", (unsigned)pin);
    return MatrixError::hardware;
  }

  // Input-only pads have neither an output driver nor internal pulls.
  const bool canOutput = GPIO_IS_VALID_OUTPUT_GPIO(pin);
  if (dir == PinDirection::output) {
    if (!canOutput) {
      Serial.printf("[GPIO] pin %u is input only\n", (unsigned)pin);
      return MatrixError::hardware;
    }
    pinMode(pin, OUTPUT);
    outputs_ |= (1ull << pin);
  } else {
    if (pull != PullMode::none && !canOutput) {
      Serial.printf("[GPIO] pin %u has no internal pull resistor\n", (unsigned)pin);
      return MatrixError::hardware;
    }
    switch (pull) {
      case PullMode::up:   pinMode(pin, INPUT_PULLUP); break;
      case PullMode::down: pinMode(pin, INPUT_PULLDOWN); break;
      case PullMode::none:
      default:             pinMode(pin, INPUT); break;
    }
    outputs_ &= ~(1ull << pin);
  }

  claimed_ |= (1ull << pin);
  return MatrixError::none;
}

MatrixError ArduinoPinDriver::setLevel(uint8_t pin, PinLevel level) {
  if (pin >= kMaxPins || !bit_(claimed_, pin) || !bit_(outputs_, pin)) return MatrixError::hardware;
  digitalWrite(pin, level == PinLevel::high ? HIGH : LOW);
  return MatrixError::none;
}

MatrixError ArduinoPinDriver::readLevel(uint8_t pin, PinLevel& out) {
  if (pin >= kMaxPins || !bit_(claimed_, pin)) return MatrixError::hardware;
  out = (digitalRead(pin) == HIGH) ? PinLevel::high : PinLevel::low;
  return MatrixError::none;
}

void ArduinoPinDriver::release(uint8_t pin) {
  if (pin >= kMaxPins || !bit_(claimed_, pin)) return;
  pinMode(pin, INPUT);
  claimed_ &= ~(1ull << pin);
  outputs_ &= ~(1ull << pin);
}

uint8_t ArduinoPinDriver::claimedCount() const {
  uint8_t n = 0;
  for (uint8_t pin = 0; pin < kMaxPins; ++pin) {
    if (bit_(claimed_, pin)) ++n;
  }
  return n;
}
