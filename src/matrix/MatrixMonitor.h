#pragma once

#include <stdint.h>

#include "matrix/Clock.h"
#include "matrix/InputScanner.h"
#include "matrix/MatrixError.h"
#include "matrix/MatrixTypes.h"

class MonitorListener {
public:
  virtual ~MonitorListener() = default;
  // changed == cells() for the first frame.
  virtual void onFrame(const InputFrame& frame, uint32_t scanIndex, uint16_t changed) = 0;
};

struct MonitorResult {
  MatrixError error = MatrixError::none;
  uint32_t scans = 0;
  uint32_t reported = 0;
};

// Rescans on a fixed period until interrupted. Read-only: never touches
// the output side.
class MatrixMonitor {
public:
  MatrixMonitor(InputScanner& scanner, Clock& clock) : scanner_(scanner), clock_(clock) {}

  MonitorResult run(uint32_t intervalMs, MonitorListener& listener);

private:
  InputScanner& scanner_;
  Clock& clock_;
};
