#pragma once

#include <stdint.h>

#include "matrix/MatrixError.h"
#include "matrix/MatrixTypes.h"

// Exclusive handle on the GPIO pins of one board. The controller and the
// scanner receive it by reference; nothing else drives matrix pins.
class PinDriver {
public:
  virtual ~PinDriver() = default;

  // Claims the pin. MatrixError::hardware if it is invalid for `dir` or busy.
  virtual MatrixError configure(uint8_t pin, PinDirection dir, PullMode pull) = 0;
  virtual MatrixError setLevel(uint8_t pin, PinLevel level) = 0;
  virtual MatrixError readLevel(uint8_t pin, PinLevel& out) = 0;
  virtual void release(uint8_t pin) = 0;
};
