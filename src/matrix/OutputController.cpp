#include "matrix/OutputController.h"

#include "matrix/PositionCodec.h"

namespace {
// Drops whatever is still active when the blocking wait unwinds.
class ActiveGuard {
public:
  explicit ActiveGuard(OutputController& ctl) : ctl_(ctl) {}
  ~ActiveGuard() {
    if (ctl_.isActive()) ctl_.deactivate(DeactivateReason::error);
  }

private:
  OutputController& ctl_;
};
} // namespace

OutputController::OutputController(PinDriver& pins, Clock& clock, const OutputMatrixConfig& cfg)
: pins_(pins), clock_(clock), cfg_(cfg) {}

OutputController::~OutputController() {
  listener_ = nullptr;
  if (ready_) reset();
}

MatrixError OutputController::begin() {
  const MatrixGeometry& g = cfg_.pins.geometry;
  const uint8_t total = g.rows + g.cols;
  for (uint8_t i = 0; i < total; ++i) {
    const uint8_t pin = (i < g.rows) ? cfg_.pins.rowPins[i] : cfg_.pins.colPins[i - g.rows];
    // A fresh output comes up LOW; with an active-LOW bank it must not stay
    // there while the next pin is claimed.
    MatrixError e = pins_.configure(pin, PinDirection::output, PullMode::none);
    if (e == MatrixError::none) {
      e = pins_.setLevel(pin, cfg_.inactiveLevel);
      if (e != MatrixError::none) pins_.release(pin);
    }
    if (e != MatrixError::none) {
      for (uint8_t j = 0; j < i; ++j) {
        pins_.release((j < g.rows) ? cfg_.pins.rowPins[j] : cfg_.pins.colPins[j - g.rows]);
      }
      return e;
    }
  }
  ready_ = true;
  if (reset() != 0) return MatrixError::hardware;
  return MatrixError::none;
}

void OutputController::setPolicy(bool forceOffOnConflict, uint32_t safetyTimeoutMs) {
  forceOff_ = forceOffOnConflict;
  safetyTimeoutMs_ = safetyTimeoutMs;
}

MatrixError OutputController::drivePair_(const Position& pos, PinLevel level) {
  const MatrixError colErr = pins_.setLevel(cfg_.pins.colPins[pos.col], level);
  if (colErr != MatrixError::none && level == cfg_.activeLevel) return colErr;
  const MatrixError rowErr = pins_.setLevel(cfg_.pins.rowPins[pos.row], level);
  return colErr != MatrixError::none ? colErr : rowErr;
}

void OutputController::clearState_() {
  state_ = OutputState::idle;
  activePos_ = Position();
  activatedAtMs_ = 0;
  deadlineMs_ = 0;
  safetyArmed_ = false;
  safetyDeadlineMs_ = 0;
}

bool OutputController::safetyFirst_() const {
  return safetyArmed_ && (int32_t)(safetyDeadlineMs_ - deadlineMs_) <= 0;
}

uint32_t OutputController::deadlineMs() const {
  return safetyFirst_() ? safetyDeadlineMs_ : deadlineMs_;
}

uint32_t OutputController::remainingMs(uint32_t nowMs) const {
  if (state_ != OutputState::active) return 0;
  const uint32_t until = deadlineMs();
  if (reached(nowMs, until)) return 0;
  return until - nowMs;
}

MatrixError OutputController::arm(const Position& pos, uint32_t durationMs, uint32_t nowMs) {
  if (!ready_) return MatrixError::hardware;
  if (!pos.within(cfg_.pins.geometry)) return MatrixError::invalid_position;
  if (durationMs < PositionCodec::kMinDurationMs || durationMs > PositionCodec::kMaxDurationMs) {
    return MatrixError::invalid_duration;
  }

  if (state_ == OutputState::active) {
    if (!forceOff_) {
      return (pos == activePos_) ? MatrixError::already_active : MatrixError::conflict;
    }
    const MatrixError e = deactivate(DeactivateReason::preempted);
    if (e != MatrixError::none) return e;
  }

  const MatrixError e = drivePair_(pos, cfg_.activeLevel);
  if (e != MatrixError::none) {
    // Report the activation failure, not a secondary one from the rollback.
    (void)drivePair_(pos, cfg_.inactiveLevel);
    clearState_();
    return e;
  }

  state_ = OutputState::active;
  activePos_ = pos;
  activatedAtMs_ = nowMs;
  deadlineMs_ = nowMs + durationMs;
  safetyArmed_ = safetyTimeoutMs_ > 0;
  safetyDeadlineMs_ = safetyArmed_ ? (nowMs + safetyTimeoutMs_) : 0;

  if (listener_) listener_->onActivated(activePos_, durationMs, deadlineMs());
  return MatrixError::none;
}

bool OutputController::service(uint32_t nowMs) {
  if (state_ != OutputState::active) return false;
  if (!reached(nowMs, deadlineMs())) return false;
  deactivate(safetyFirst_() ? DeactivateReason::safety_timeout : DeactivateReason::expired);
  return true;
}

MatrixError OutputController::deactivate(DeactivateReason reason) {
  if (state_ != OutputState::active) return MatrixError::none;
  const Position pos = activePos_;
  const MatrixError e = drivePair_(pos, cfg_.inactiveLevel);
  clearState_();
  if (listener_) listener_->onDeactivated(pos, reason);
  return e;
}

uint8_t OutputController::reset() {
  const bool wasActive = (state_ == OutputState::active);
  const Position pos = activePos_;
  state_ = OutputState::resetting;

  uint8_t failures = 0;
  const MatrixGeometry& g = cfg_.pins.geometry;
  for (uint8_t r = 0; r < g.rows; ++r) {
    if (pins_.setLevel(cfg_.pins.rowPins[r], cfg_.inactiveLevel) != MatrixError::none) ++failures;
  }
  for (uint8_t c = 0; c < g.cols; ++c) {
    if (pins_.setLevel(cfg_.pins.colPins[c], cfg_.inactiveLevel) != MatrixError::none) ++failures;
  }

  clearState_();
  if (wasActive && listener_) listener_->onDeactivated(pos, DeactivateReason::reset);
  return failures;
}

ActivationResult OutputController::activate(const Position& pos, uint32_t durationMs) {
  ActivationResult res;
  res.last = pos;
  res.error = arm(pos, durationMs, clock_.nowMs());
  if (res.error != MatrixError::none) {
    res.end = DeactivateReason::error;
    return res;
  }

  ActiveGuard guard(*this);
  for (;;) {
    const uint32_t nowMs = clock_.nowMs();
    res.last = activePos_;
    if (reached(nowMs, deadlineMs())) {
      res.end = safetyFirst_() ? DeactivateReason::safety_timeout : DeactivateReason::expired;
      res.error = deactivate(res.end);
      return res;
    }

    ActivationRequest req;
    const WaitOutcome w = clock_.waitFor(remainingMs(nowMs), &req);
    if (w == WaitOutcome::interrupted) {
      res.end = DeactivateReason::interrupted;
      res.error = deactivate(res.end);
      return res;
    }
    if (w == WaitOutcome::request) {
      const MatrixError e = arm(req.position, req.duration_ms, clock_.nowMs());
      if (listener_) listener_->onRequestHandled(req, e);
      if (!isActive()) {
        res.end = DeactivateReason::error;
        res.error = e;
        return res;
      }
    }
  }
}
