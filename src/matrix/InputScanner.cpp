#include "matrix/InputScanner.h"

InputScanner::InputScanner(PinDriver& pins, Clock& clock, const InputMatrixConfig& cfg, uint32_t settleUs)
: pins_(pins), clock_(clock), cfg_(cfg), settleUs_(settleUs) {}

MatrixError InputScanner::begin() {
  const MatrixGeometry& g = cfg_.pins.geometry;
  const uint8_t total = g.cols + g.rows;
  for (uint8_t i = 0; i < total; ++i) {
    MatrixError e;
    if (i < g.cols) {
      e = pins_.configure(cfg_.pins.colPins[i], PinDirection::output, PullMode::none);
    } else {
      e = pins_.configure(cfg_.pins.rowPins[i - g.cols], PinDirection::input, cfg_.pull);
    }
    if (e != MatrixError::none) {
      for (uint8_t j = 0; j < i; ++j) {
        pins_.release((j < g.cols) ? cfg_.pins.colPins[j] : cfg_.pins.rowPins[j - g.cols]);
      }
      return e;
    }
  }
  if (idleAllColumns_() != MatrixError::none) return MatrixError::hardware;
  ready_ = true;
  return MatrixError::none;
}

MatrixError InputScanner::idleAllColumns_() {
  MatrixError first = MatrixError::none;
  for (uint8_t c = 0; c < cfg_.pins.geometry.cols; ++c) {
    const MatrixError e = pins_.setLevel(cfg_.pins.colPins[c], cfg_.idleLevel);
    if (e != MatrixError::none && first == MatrixError::none) first = e;
  }
  return first;
}

MatrixError InputScanner::selectColumn_(uint8_t col) {
  // Release everything first so two columns are never selected together.
  const MatrixError e = idleAllColumns_();
  if (e != MatrixError::none) return e;
  return pins_.setLevel(cfg_.pins.colPins[col], cfg_.selectLevel);
}

MatrixError InputScanner::scan(InputFrame& out) {
  if (!ready_) return MatrixError::hardware;

  const MatrixGeometry& g = cfg_.pins.geometry;
  InputFrame frame(g);

  for (uint8_t c = 0; c < g.cols; ++c) {
    if (selectColumn_(c) != MatrixError::none) {
      (void)idleAllColumns_();
      return MatrixError::sensor_read;
    }
    if (settleUs_ > 0) clock_.delayMicros(settleUs_);

    for (uint8_t r = 0; r < g.rows; ++r) {
      PinLevel lv;
      if (pins_.readLevel(cfg_.pins.rowPins[r], lv) != MatrixError::none) {
        (void)idleAllColumns_();
        return MatrixError::sensor_read;
      }
      frame.set(r, c, lv == cfg_.closedLevel);
    }
  }

  if (idleAllColumns_() != MatrixError::none) return MatrixError::sensor_read;
  out = frame;
  return MatrixError::none;
}
