#pragma once

#include <stdint.h>

#include "drivers/PinDriver.h"
#include "matrix/Clock.h"
#include "matrix/MatrixConfig.h"
#include "matrix/MatrixError.h"
#include "matrix/MatrixTypes.h"

enum class OutputState { idle, active, resetting };

enum class DeactivateReason { expired, safety_timeout, interrupted, preempted, reset, error };

static inline const char* toString(OutputState s) {
  switch (s) {
    case OutputState::idle:      return "IDLE";
    case OutputState::active:    return "ACTIVE";
    case OutputState::resetting: return "RESETTING";
    default:                     return "unknown";
  }
}

static inline const char* toString(DeactivateReason r) {
  switch (r) {
    case DeactivateReason::expired:        return "expired";
    case DeactivateReason::safety_timeout: return "safety_timeout";
    case DeactivateReason::interrupted:    return "interrupted";
    case DeactivateReason::preempted:      return "preempted";
    case DeactivateReason::reset:          return "reset";
    case DeactivateReason::error:          return "error";
    default:                               return "unknown";
  }
}

class OutputListener {
public:
  virtual ~OutputListener() = default;
  virtual void onActivated(const Position& pos, uint32_t durationMs, uint32_t deadlineMs) = 0;
  virtual void onDeactivated(const Position& pos, DeactivateReason reason) = 0;
  // A request that arrived while waiting; err == none if it was armed.
  virtual void onRequestHandled(const ActivationRequest& req, MatrixError err) = 0;
};

struct ActivationResult {
  MatrixError error = MatrixError::none;
  DeactivateReason end = DeactivateReason::expired;
  Position last{};
};

// Single-active-position state machine for the output matrix. At most one
// row/column pair is at the active level at any time; arming a new position
// always releases the previous one first.
class OutputController {
public:
  OutputController(PinDriver& pins, Clock& clock, const OutputMatrixConfig& cfg);
  ~OutputController();

  OutputController(const OutputController&) = delete;
  OutputController& operator=(const OutputController&) = delete;

  // Claims every row and column pin and drives it inactive.
  MatrixError begin();

  void setListener(OutputListener* listener) { listener_ = listener; }

  // safetyTimeoutMs == 0 disables the global ceiling.
  void setPolicy(bool forceOffOnConflict, uint32_t safetyTimeoutMs);

  MatrixError arm(const Position& pos, uint32_t durationMs, uint32_t nowMs);

  // Deactivates on per-call or safety expiry. Returns true if it did.
  bool service(uint32_t nowMs);

  MatrixError deactivate(DeactivateReason reason);

  // All row and column pins inactive, state cleared. Returns the number of
  // pins that could not be driven.
  uint8_t reset();

  // Arms `pos` and blocks on the clock until the activation ends.
  ActivationResult activate(const Position& pos, uint32_t durationMs);

  OutputState state() const { return state_; }
  bool isActive() const { return state_ == OutputState::active; }
  const Position& activePosition() const { return activePos_; }
  uint32_t activatedAtMs() const { return activatedAtMs_; }
  uint32_t deadlineMs() const;
  uint32_t remainingMs(uint32_t nowMs) const;
  const MatrixGeometry& geometry() const { return cfg_.pins.geometry; }
  bool forceOffOnConflict() const { return forceOff_; }
  uint32_t safetyTimeoutMs() const { return safetyTimeoutMs_; }

private:
  PinDriver& pins_;
  Clock& clock_;
  OutputMatrixConfig cfg_;
  OutputListener* listener_ = nullptr;

  bool ready_ = false;
  bool forceOff_ = true;
  uint32_t safetyTimeoutMs_ = 0;

  OutputState state_ = OutputState::idle;
  Position activePos_{};
  uint32_t activatedAtMs_ = 0;
  uint32_t deadlineMs_ = 0;
  bool safetyArmed_ = false;
  uint32_t safetyDeadlineMs_ = 0;

  MatrixError drivePair_(const Position& pos, PinLevel level);
  void clearState_();
  bool safetyFirst_() const;
};
