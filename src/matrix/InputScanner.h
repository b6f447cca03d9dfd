#pragma once

#include <stdint.h>

#include "drivers/PinDriver.h"
#include "matrix/Clock.h"
#include "matrix/MatrixConfig.h"
#include "matrix/MatrixError.h"
#include "matrix/MatrixTypes.h"

// columns: OUTPUT (select/idle), rows: INPUT with the configured pull.
// Rows are shared by every column, so exactly one column is selected while
// rows are sampled.
class InputScanner {
public:
  InputScanner(PinDriver& pins, Clock& clock, const InputMatrixConfig& cfg, uint32_t settleUs);

  MatrixError begin();

  // One full frame: `cols` select-settle-read cycles, columns idle afterwards.
  MatrixError scan(InputFrame& out);

  void setSettleUs(uint32_t us) { settleUs_ = us; }
  uint32_t settleUs() const { return settleUs_; }
  const MatrixGeometry& geometry() const { return cfg_.pins.geometry; }
  const InputMatrixConfig& config() const { return cfg_; }

private:
  PinDriver& pins_;
  Clock& clock_;
  InputMatrixConfig cfg_;
  uint32_t settleUs_;
  bool ready_ = false;

  MatrixError selectColumn_(uint8_t col);
  MatrixError idleAllColumns_();
};
