#include <cstdio>
#include <cstring>
#include <iostream>

#include "FakeHardware.h"
#include "app/Commands.h"
#include "app/Config.h"
#include "matrix/FrameRenderer.h"
#include "matrix/InputScanner.h"
#include "matrix/MatrixConfig.h"
#include "matrix/MatrixMonitor.h"
#include "matrix/OutputController.h"
#include "matrix/PositionCodec.h"

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

constexpr uint8_t kOutRows[] = {1, 2, 3};
constexpr uint8_t kOutCols[] = {4, 5, 6};
constexpr uint8_t kInRows[] = {10, 11, 12};
constexpr uint8_t kInCols[] = {13, 14, 15};

const MatrixGeometry k3x3(3, 3);

OutputMatrixConfig makeOutput(const char* activeLevel) {
  PinMap m;
  OutputMatrixConfig cfg;
  if (MatrixConfig::buildPinMap(kOutRows, 3, kOutCols, 3, m) == MatrixError::none) {
    (void)MatrixConfig::resolveOutput(m, activeLevel, cfg);
  }
  return cfg;
}

InputMatrixConfig makeInput(const char* pull, const char* closed) {
  PinMap m;
  InputMatrixConfig cfg;
  if (MatrixConfig::buildPinMap(kInRows, 3, kInCols, 3, m) == MatrixError::none) {
    (void)MatrixConfig::resolveInput(m, pull, closed, cfg);
  }
  return cfg;
}

class RecordingListener : public OutputListener {
public:
  void onActivated(const Position& pos, uint32_t, uint32_t deadlineMs) override {
    ++activated;
    lastActivated = pos;
    lastDeadlineMs = deadlineMs;
  }
  void onDeactivated(const Position& pos, DeactivateReason reason) override {
    ++deactivated;
    lastDeactivated = pos;
    lastReason = reason;
  }
  void onRequestHandled(const ActivationRequest&, MatrixError err) override {
    ++handled;
    lastHandled = err;
  }

  int activated = 0;
  int deactivated = 0;
  int handled = 0;
  Position lastActivated{};
  Position lastDeactivated{};
  uint32_t lastDeadlineMs = 0;
  DeactivateReason lastReason = DeactivateReason::error;
  MatrixError lastHandled = MatrixError::none;
};

class FrameRecorder : public MonitorListener {
public:
  void onFrame(const InputFrame& frame, uint32_t scanIndex, uint16_t changed) override {
    if (count < 8) {
      indices[count] = scanIndex;
      changes[count] = changed;
      closed[count] = frame.closedCount();
    }
    ++count;
  }

  uint32_t count = 0;
  uint32_t indices[8]{};
  uint16_t changes[8]{};
  uint16_t closed[8]{};
};

bool allOutputsAt(const FakePinDriver& pins, PinLevel level) {
  return pins.countAt(kOutRows, 3, level) == 3 && pins.countAt(kOutCols, 3, level) == 3;
}

// ---------------------------------------------------------------- codec

bool test_position_decode_accepts_both_notations() {
  Position p;
  CHECK(PositionCodec::decode("A1", k3x3, p) == MatrixError::none);
  CHECK(p == Position(0, 0));
  CHECK(PositionCodec::decode(" c3 ", k3x3, p) == MatrixError::none);
  CHECK(p == Position(2, 2));
  CHECK(PositionCodec::decode("b1", k3x3, p) == MatrixError::none);
  CHECK(p == Position(0, 1));

  // "4" is row 1, col 0 on a 3x3 matrix: the same cell as A2.
  CHECK(PositionCodec::decode("4", k3x3, p) == MatrixError::none);
  CHECK(p == Position(1, 0));
  Position q;
  CHECK(PositionCodec::decode("A2", k3x3, q) == MatrixError::none);
  CHECK(p == q);

  char name[PositionCodec::kTokenBufLen];
  CHECK(PositionCodec::encode(p, name, sizeof(name)));
  CHECK(std::strcmp(name, "A2") == 0);
  return true;
}

bool test_position_round_trip_and_numeric_index_law() {
  const MatrixGeometry shapes[] = {MatrixGeometry(1, 1), MatrixGeometry(3, 3),
                                   MatrixGeometry(4, 7), MatrixGeometry(16, 16)};
  for (const MatrixGeometry& g : shapes) {
    for (uint8_t r = 0; r < g.rows; ++r) {
      for (uint8_t c = 0; c < g.cols; ++c) {
        const Position p(r, c);
        char name[PositionCodec::kTokenBufLen];
        CHECK(PositionCodec::encode(p, name, sizeof(name)));
        Position back;
        CHECK(PositionCodec::decode(name, g, back) == MatrixError::none);
        CHECK(back == p);

        char idx[8];
        std::snprintf(idx, sizeof(idx), "%u", (unsigned)PositionCodec::encodeNumeric(p, g));
        CHECK(PositionCodec::decode(idx, g, back) == MatrixError::none);
        CHECK(back == p);
      }
    }

    Position p;
    CHECK(PositionCodec::decode("1", g, p) == MatrixError::none);
    CHECK(p == Position(0, 0));

    char last[8];
    std::snprintf(last, sizeof(last), "%u", (unsigned)g.cells());
    CHECK(PositionCodec::decode(last, g, p) == MatrixError::none);
    CHECK(p == Position(g.rows - 1, g.cols - 1));

    char past[8];
    std::snprintf(past, sizeof(past), "%u", (unsigned)g.cells() + 1u);
    CHECK(PositionCodec::decode(past, g, p) == MatrixError::invalid_position);
    CHECK(PositionCodec::decode("0", g, p) == MatrixError::invalid_position);
  }
  return true;
}

bool test_position_rejects_malformed_tokens() {
  Position p(1, 1);
  const char* bad[] = {"", "   ", "D1", "A0", "A4", "1A", "AA1", "-1", "A-1", "4.0", "99999999"};
  for (const char* t : bad) {
    CHECK(PositionCodec::decode(t, k3x3, p) == MatrixError::invalid_position);
  }
  CHECK(PositionCodec::decode(nullptr, k3x3, p) == MatrixError::invalid_position);
  CHECK(p == Position(1, 1));
  return true;
}

bool test_duration_and_interval_bounds() {
  uint32_t ms = 0;
  CHECK(PositionCodec::parseDuration("0.5", ms) == MatrixError::none);
  CHECK(ms == 500);
  CHECK(PositionCodec::parseDuration("600", ms) == MatrixError::none);
  CHECK(ms == 600000);
  CHECK(PositionCodec::parseDuration("2.0", ms) == MatrixError::none);
  CHECK(ms == 2000);

  CHECK(PositionCodec::parseDuration("0.49", ms) == MatrixError::invalid_duration);
  CHECK(PositionCodec::parseDuration("600.01", ms) == MatrixError::invalid_duration);
  CHECK(PositionCodec::parseDuration("abc", ms) == MatrixError::invalid_duration);
  CHECK(PositionCodec::parseDuration("2s", ms) == MatrixError::invalid_duration);
  CHECK(PositionCodec::parseDuration("nan", ms) == MatrixError::invalid_duration);
  CHECK(PositionCodec::parseDuration("", ms) == MatrixError::invalid_duration);

  CHECK(PositionCodec::parseInterval("0.1", ms) == MatrixError::none);
  CHECK(ms == 100);
  CHECK(PositionCodec::parseInterval("60", ms) == MatrixError::none);
  CHECK(ms == 60000);
  CHECK(PositionCodec::parseInterval("0.05", ms) == MatrixError::usage);
  CHECK(PositionCodec::parseInterval("61", ms) == MatrixError::usage);
  return true;
}

// ---------------------------------------------------------------- output

bool test_output_begin_drives_every_pin_inactive() {
  FakePinDriver pins;
  FakeClock clock;
  OutputController out(pins, clock, makeOutput("LOW"));

  CHECK(out.begin() == MatrixError::none);
  CHECK(out.state() == OutputState::idle);
  for (uint8_t pin : kOutRows) CHECK(pins.claimed(pin));
  for (uint8_t pin : kOutCols) CHECK(pins.claimed(pin));
  CHECK(allOutputsAt(pins, PinLevel::high));
  return true;
}

bool test_output_begin_never_energises_a_cell_while_claiming() {
  FakePinDriver pins;
  FakeClock clock;
  pins.powerOnLevel = PinLevel::low;
  pins.watchCells(kOutRows, 3, kOutCols, 3, PinLevel::low);

  OutputController out(pins, clock, makeOutput("LOW"));
  CHECK(out.begin() == MatrixError::none);
  CHECK(pins.maxActiveCells == 0);
  CHECK(pins.activeCells() == 0);
  CHECK(allOutputsAt(pins, PinLevel::high));

  // Same bank with active HIGH: the power-on level is already inactive.
  FakePinDriver pinsHigh;
  pinsHigh.watchCells(kOutRows, 3, kOutCols, 3, PinLevel::high);
  OutputController outHigh(pinsHigh, clock, makeOutput("HIGH"));
  CHECK(outHigh.begin() == MatrixError::none);
  CHECK(pinsHigh.maxActiveCells == 0);
  return true;
}

bool test_output_begin_releases_pin_it_cannot_drive() {
  FakePinDriver pins;
  FakeClock clock;
  pins.failSetPin = 3;

  OutputController out(pins, clock, makeOutput("LOW"));
  CHECK(out.begin() == MatrixError::hardware);
  CHECK(!pins.claimed(1));
  CHECK(!pins.claimed(2));
  CHECK(!pins.claimed(3));
  CHECK(!pins.claimed(4));
  return true;
}

bool test_output_begin_reports_busy_pin_and_releases_claims() {
  FakePinDriver pins;
  FakeClock clock;
  CHECK(pins.configure(5, PinDirection::input, PullMode::up) == MatrixError::none);

  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::hardware);
  CHECK(!pins.claimed(1));
  CHECK(!pins.claimed(4));
  CHECK(pins.claimed(5));

  Position p(0, 0);
  CHECK(out.arm(p, 1000, clock.nowMs()) == MatrixError::hardware);
  return true;
}

bool test_activate_numeric_position_then_idle() {
  FakePinDriver pins;
  FakeClock clock;
  RecordingListener log;
  OutputController out(pins, clock, makeOutput("HIGH"));
  out.setListener(&log);
  CHECK(out.begin() == MatrixError::none);

  Position p;
  CHECK(PositionCodec::decode("4", out.geometry(), p) == MatrixError::none);
  uint32_t ms = 0;
  CHECK(PositionCodec::parseDuration("2.0", ms) == MatrixError::none);

  const uint32_t start = clock.nowMs();
  const ActivationResult r = out.activate(p, ms);
  CHECK(r.error == MatrixError::none);
  CHECK(r.end == DeactivateReason::expired);
  CHECK(r.last == Position(1, 0));
  CHECK(clock.nowMs() - start >= 2000);
  CHECK(out.state() == OutputState::idle);
  CHECK(allOutputsAt(pins, PinLevel::low));
  CHECK(log.activated == 1);
  CHECK(log.deactivated == 1);
  CHECK(log.lastReason == DeactivateReason::expired);
  return true;
}

bool test_arm_drives_exactly_one_pair_until_deadline() {
  FakePinDriver pins;
  FakeClock clock;
  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::none);

  const uint32_t t0 = clock.nowMs();
  CHECK(out.arm(Position(1, 1), 1000, t0) == MatrixError::none);
  CHECK(out.isActive());
  CHECK(out.deadlineMs() == t0 + 1000);
  CHECK(out.remainingMs(t0 + 400) == 600);
  CHECK(pins.level(2) == PinLevel::high);
  CHECK(pins.level(5) == PinLevel::high);
  CHECK(pins.countAt(kOutRows, 3, PinLevel::high) == 1);
  CHECK(pins.countAt(kOutCols, 3, PinLevel::high) == 1);

  CHECK(!out.service(t0 + 999));
  CHECK(out.isActive());
  CHECK(out.service(t0 + 1000));
  CHECK(!out.isActive());
  CHECK(out.remainingMs(t0 + 1000) == 0);
  CHECK(allOutputsAt(pins, PinLevel::low));
  return true;
}

bool test_strict_policy_reports_already_active_and_conflict() {
  FakePinDriver pins;
  FakeClock clock;
  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::none);
  out.setPolicy(false, 0);

  const uint32_t t0 = clock.nowMs();
  CHECK(out.arm(Position(0, 0), 2000, t0) == MatrixError::none);
  const uint32_t writes = pins.writes;

  const MatrixError same = out.arm(Position(0, 0), 2000, t0 + 100);
  const MatrixError other = out.arm(Position(1, 1), 2000, t0 + 100);
  CHECK(same == MatrixError::already_active);
  CHECK(other == MatrixError::conflict);
  CHECK(resultCode(same) == -3);
  CHECK(resultCode(other) == -3);

  CHECK(pins.writes == writes);
  CHECK(out.activePosition() == Position(0, 0));
  CHECK(out.deadlineMs() == t0 + 2000);
  return true;
}

bool test_force_off_rearms_and_preempts() {
  FakePinDriver pins;
  FakeClock clock;
  RecordingListener log;
  OutputController out(pins, clock, makeOutput("HIGH"));
  out.setListener(&log);
  CHECK(out.begin() == MatrixError::none);
  out.setPolicy(true, 0);
  pins.watchCells(kOutRows, 3, kOutCols, 3, PinLevel::high);

  const uint32_t t0 = clock.nowMs();
  CHECK(out.arm(Position(0, 0), 2000, t0) == MatrixError::none);
  CHECK(out.arm(Position(0, 0), 2000, t0 + 500) == MatrixError::none);
  CHECK(out.deadlineMs() == t0 + 2500);
  CHECK(log.lastReason == DeactivateReason::preempted);

  CHECK(out.arm(Position(2, 2), 1000, t0 + 600) == MatrixError::none);
  CHECK(out.activePosition() == Position(2, 2));
  CHECK(pins.level(1) == PinLevel::low);
  CHECK(pins.level(4) == PinLevel::low);
  CHECK(pins.level(3) == PinLevel::high);
  CHECK(pins.level(6) == PinLevel::high);
  CHECK(pins.countAt(kOutRows, 3, PinLevel::high) == 1);
  CHECK(pins.countAt(kOutCols, 3, PinLevel::high) == 1);
  CHECK(log.activated == 3);
  CHECK(log.deactivated == 2);
  CHECK(pins.maxActiveCells == 1);
  CHECK(pins.activeCells() == 1);
  return true;
}

bool test_rejected_arguments_leave_state_untouched() {
  FakePinDriver pins;
  FakeClock clock;
  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::none);
  const uint32_t writes = pins.writes;
  const uint32_t t0 = clock.nowMs();

  CHECK(out.arm(Position(0, 0), 499, t0) == MatrixError::invalid_duration);
  CHECK(out.arm(Position(0, 0), 600001, t0) == MatrixError::invalid_duration);
  CHECK(out.arm(Position(3, 0), 1000, t0) == MatrixError::invalid_position);
  CHECK(out.arm(Position(0, 3), 1000, t0) == MatrixError::invalid_position);

  const ActivationResult r = out.activate(Position(0, 0), 100);
  CHECK(r.error == MatrixError::invalid_duration);
  CHECK(r.end == DeactivateReason::error);

  CHECK(out.state() == OutputState::idle);
  CHECK(pins.writes == writes);
  CHECK(clock.waits == 0);
  return true;
}

bool test_safety_timeout_caps_activation() {
  FakePinDriver pins;
  FakeClock clock;
  RecordingListener log;
  OutputController out(pins, clock, makeOutput("HIGH"));
  out.setListener(&log);
  CHECK(out.begin() == MatrixError::none);
  out.setPolicy(true, 1000);

  uint32_t start = clock.nowMs();
  ActivationResult r = out.activate(Position(0, 1), 5000);
  CHECK(r.error == MatrixError::none);
  CHECK(r.end == DeactivateReason::safety_timeout);
  CHECK(clock.nowMs() - start == 1000);
  CHECK(log.lastReason == DeactivateReason::safety_timeout);
  CHECK(allOutputsAt(pins, PinLevel::low));

  // A per-call duration shorter than the ceiling still wins.
  start = clock.nowMs();
  r = out.activate(Position(0, 1), 600);
  CHECK(r.end == DeactivateReason::expired);
  CHECK(clock.nowMs() - start == 600);
  return true;
}

bool test_interrupt_during_activation_leaves_pins_inactive() {
  FakePinDriver pins;
  FakeClock clock(1000);
  RecordingListener log;
  OutputController out(pins, clock, makeOutput("LOW"));
  out.setListener(&log);
  CHECK(out.begin() == MatrixError::none);

  clock.interruptAt(1500);
  const ActivationResult r = out.activate(Position(2, 0), 10000);
  CHECK(r.error == MatrixError::none);
  CHECK(r.end == DeactivateReason::interrupted);
  CHECK(clock.nowMs() == 1500);
  CHECK(out.state() == OutputState::idle);
  CHECK(allOutputsAt(pins, PinLevel::high));
  CHECK(log.lastReason == DeactivateReason::interrupted);
  return true;
}

bool test_request_during_activation_follows_conflict_policy() {
  {
    FakePinDriver pins;
    FakeClock clock(1000);
    RecordingListener log;
    OutputController out(pins, clock, makeOutput("HIGH"));
    out.setListener(&log);
    CHECK(out.begin() == MatrixError::none);
    out.setPolicy(false, 0);

    clock.requestAt(1200, Position(1, 1), 1000);
    clock.requestAt(1300, Position(0, 0), 1000);
    const ActivationResult r = out.activate(Position(0, 0), 2000);
    CHECK(log.handled == 2);
    CHECK(log.lastHandled == MatrixError::already_active);
    CHECK(r.error == MatrixError::none);
    CHECK(r.end == DeactivateReason::expired);
    CHECK(r.last == Position(0, 0));
    CHECK(clock.nowMs() == 3000);
  }
  {
    FakePinDriver pins;
    FakeClock clock(1000);
    RecordingListener log;
    OutputController out(pins, clock, makeOutput("HIGH"));
    out.setListener(&log);
    CHECK(out.begin() == MatrixError::none);
    out.setPolicy(true, 0);

    clock.requestAt(1200, Position(1, 1), 1000);
    const ActivationResult r = out.activate(Position(0, 0), 2000);
    CHECK(log.handled == 1);
    CHECK(log.lastHandled == MatrixError::none);
    CHECK(r.error == MatrixError::none);
    CHECK(r.end == DeactivateReason::expired);
    CHECK(r.last == Position(1, 1));
    CHECK(clock.nowMs() == 2200);
    CHECK(allOutputsAt(pins, PinLevel::low));
  }
  return true;
}

bool test_pin_fault_while_arming_rolls_back() {
  FakePinDriver pins;
  FakeClock clock;
  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::none);

  pins.failSetPin = 1;  // row of A1
  const ActivationResult r = out.activate(Position(0, 0), 1000);
  CHECK(r.error == MatrixError::hardware);
  CHECK(r.end == DeactivateReason::error);
  CHECK(out.state() == OutputState::idle);
  CHECK(pins.level(4) == PinLevel::low);
  CHECK(clock.waits == 0);

  CHECK(out.reset() == 1);
  return true;
}

bool test_reset_is_idempotent() {
  FakePinDriver pins;
  FakeClock clock;
  RecordingListener log;
  OutputController out(pins, clock, makeOutput("HIGH"));
  out.setListener(&log);
  CHECK(out.begin() == MatrixError::none);

  CHECK(out.arm(Position(2, 1), 5000, clock.nowMs()) == MatrixError::none);
  CHECK(out.reset() == 0);
  CHECK(out.state() == OutputState::idle);
  CHECK(allOutputsAt(pins, PinLevel::low));
  CHECK(log.lastReason == DeactivateReason::reset);
  CHECK(log.deactivated == 1);

  CHECK(out.reset() == 0);
  CHECK(log.deactivated == 1);
  CHECK(allOutputsAt(pins, PinLevel::low));
  return true;
}

bool test_controller_teardown_drives_outputs_inactive() {
  FakePinDriver pins;
  FakeClock clock;
  {
    OutputController out(pins, clock, makeOutput("HIGH"));
    CHECK(out.begin() == MatrixError::none);
    CHECK(out.arm(Position(1, 2), 5000, clock.nowMs()) == MatrixError::none);
    CHECK(pins.level(2) == PinLevel::high);
  }
  CHECK(allOutputsAt(pins, PinLevel::low));
  return true;
}

bool test_activation_deadline_survives_clock_wraparound() {
  FakePinDriver pins;
  FakeClock clock(0xFFFFFC00u);
  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::none);

  const ActivationResult r = out.activate(Position(0, 0), 2000);
  CHECK(r.end == DeactivateReason::expired);
  CHECK(clock.nowMs() == 0xFFFFFC00u + 2000u);
  CHECK(clock.waits == 1);
  return true;
}

// ---------------------------------------------------------------- input

bool test_scan_selects_one_column_at_a_time() {
  FakePinDriver pins;
  FakeClock clock;
  const InputMatrixConfig cfg = makeInput("UP", "LOW");
  InputScanner scanner(pins, clock, cfg, 50);
  CHECK(scanner.begin() == MatrixError::none);
  CHECK(pins.pull(10) == PullMode::up);
  CHECK(pins.direction(13) == PinDirection::output);

  pins.setSwitch(11, 14, true);
  pins.watchColumns(kInCols, 3, cfg.selectLevel);

  InputFrame frame;
  CHECK(scanner.scan(frame) == MatrixError::none);
  CHECK(frame.at(1, 1));
  CHECK(frame.closedCount() == 1);

  CHECK(pins.selectEdges == 3);
  CHECK(pins.maxSelected == 1);
  CHECK(clock.delays == 3);
  CHECK(clock.delayedUs == 150);
  CHECK(pins.reads == 9);
  CHECK(pins.countAt(kInCols, 3, PinLevel::high) == 3);
  return true;
}

bool test_scan_pull_down_polarity() {
  FakePinDriver pins;
  FakeClock clock;
  const InputMatrixConfig cfg = makeInput("down", "high");
  CHECK(cfg.idleLevel == PinLevel::low);
  CHECK(cfg.selectLevel == PinLevel::high);
  CHECK(!MatrixConfig::closedMatchesIdle(cfg));

  InputScanner scanner(pins, clock, cfg, 0);
  CHECK(scanner.begin() == MatrixError::none);
  CHECK(pins.pull(12) == PullMode::down);

  pins.setSwitch(10, 15, true);
  pins.setSwitch(12, 13, true);
  pins.watchColumns(kInCols, 3, cfg.selectLevel);

  InputFrame frame;
  CHECK(scanner.scan(frame) == MatrixError::none);
  CHECK(frame.at(0, 2));
  CHECK(frame.at(2, 0));
  CHECK(frame.closedCount() == 2);
  CHECK(pins.maxSelected == 1);
  CHECK(clock.delays == 0);
  CHECK(pins.countAt(kInCols, 3, PinLevel::low) == 3);
  return true;
}

bool test_scan_read_failure_restores_columns() {
  FakePinDriver pins;
  FakeClock clock;
  InputScanner scanner(pins, clock, makeInput("UP", "LOW"), 10);
  CHECK(scanner.begin() == MatrixError::none);

  InputFrame frame(k3x3);
  frame.set(0, 0, true);
  pins.failReadPin = 11;
  CHECK(scanner.scan(frame) == MatrixError::sensor_read);
  CHECK(resultCode(MatrixError::sensor_read) == -7);
  CHECK(pins.countAt(kInCols, 3, PinLevel::high) == 3);
  CHECK(frame.at(0, 0));
  return true;
}

bool test_scan_needs_begin() {
  FakePinDriver pins;
  FakeClock clock;
  InputScanner scanner(pins, clock, makeInput("UP", "LOW"), 10);
  InputFrame frame;
  CHECK(scanner.scan(frame) == MatrixError::hardware);
  CHECK(pins.reads == 0);
  return true;
}

bool test_input_and_output_cannot_share_a_pin() {
  FakePinDriver pins;
  FakeClock clock;
  OutputController out(pins, clock, makeOutput("HIGH"));
  CHECK(out.begin() == MatrixError::none);

  const uint8_t rows[] = {1, 11};
  const uint8_t cols[] = {13};
  PinMap m;
  CHECK(MatrixConfig::buildPinMap(rows, 2, cols, 1, m) == MatrixError::none);
  InputMatrixConfig cfg;
  CHECK(MatrixConfig::resolveInput(m, "UP", "LOW", cfg) == MatrixError::none);

  InputScanner scanner(pins, clock, cfg, 0);
  CHECK(scanner.begin() == MatrixError::hardware);
  CHECK(!pins.claimed(13));
  CHECK(pins.claimed(1));
  return true;
}

bool test_monitor_reports_first_frame_and_changes() {
  FakePinDriver pins;
  FakeClock clock(1000);
  clock.attach(&pins);
  InputScanner scanner(pins, clock, makeInput("UP", "LOW"), 0);
  CHECK(scanner.begin() == MatrixError::none);

  clock.switchAt(1250, 11, 14, true);
  clock.switchAt(2250, 11, 14, false);
  clock.interruptAt(3100);

  MatrixMonitor monitor(scanner, clock);
  FrameRecorder rec;
  const MonitorResult r = monitor.run(500, rec);
  CHECK(r.error == MatrixError::none);
  CHECK(r.scans == 5);
  CHECK(r.reported == 3);
  CHECK(rec.count == 3);
  CHECK(rec.indices[0] == 0 && rec.changes[0] == 9 && rec.closed[0] == 0);
  CHECK(rec.indices[1] == 1 && rec.changes[1] == 1 && rec.closed[1] == 1);
  CHECK(rec.indices[2] == 3 && rec.changes[2] == 1 && rec.closed[2] == 0);
  CHECK(clock.nowMs() == 3100);
  return true;
}

bool test_monitor_stops_on_read_failure() {
  FakePinDriver pins;
  FakeClock clock;
  InputScanner scanner(pins, clock, makeInput("UP", "LOW"), 0);
  CHECK(scanner.begin() == MatrixError::none);
  pins.failReadPin = 12;

  MatrixMonitor monitor(scanner, clock);
  FrameRecorder rec;
  const MonitorResult r = monitor.run(100, rec);
  CHECK(r.error == MatrixError::sensor_read);
  CHECK(r.scans == 0);
  CHECK(rec.count == 0);
  CHECK(clock.waits == 0);
  return true;
}

// ---------------------------------------------------------------- rendering

bool test_render_json_and_grid() {
  InputFrame frame(k3x3);
  frame.set(0, 0, true);
  frame.set(2, 1, true);

  char json[FrameRenderer::kJsonBufLen];
  CHECK(FrameRenderer::renderJson(frame, json, sizeof(json)));
  CHECK(std::strcmp(json,
                    "{\"matrix\":[[\"on\",\"off\",\"off\"],"
                    "[\"off\",\"off\",\"off\"],"
                    "[\"off\",\"on\",\"off\"]]}") == 0);

  char grid[FrameRenderer::kGridBufLen];
  CHECK(FrameRenderer::renderGrid(frame, grid, sizeof(grid)));
  CHECK(std::strcmp(grid,
                    "     A   B   C \n"
                    "1   [X] [ ] [ ]\n"
                    "2   [ ] [ ] [ ]\n"
                    "3   [ ] [X] [ ]\n") == 0);

  char tiny[8];
  CHECK(!FrameRenderer::renderJson(frame, tiny, sizeof(tiny)));
  CHECK(!FrameRenderer::renderGrid(frame, tiny, sizeof(tiny)));
  return true;
}

bool test_render_mixed_frame() {
  InputFrame frame(k3x3);
  frame.set(0, 0, true);
  frame.set(1, 2, true);
  frame.set(2, 1, true);

  char json[FrameRenderer::kJsonBufLen];
  CHECK(FrameRenderer::renderJson(frame, json, sizeof(json)));
  CHECK(std::strcmp(json,
                    "{\"matrix\":[[\"on\",\"off\",\"off\"],"
                    "[\"off\",\"off\",\"on\"],"
                    "[\"off\",\"on\",\"off\"]]}") == 0);

  char grid[FrameRenderer::kGridBufLen];
  CHECK(FrameRenderer::renderGrid(frame, grid, sizeof(grid)));
  CHECK(std::strcmp(grid,
                    "     A   B   C \n"
                    "1   [X] [ ] [ ]\n"
                    "2   [ ] [ ] [X]\n"
                    "3   [ ] [X] [ ]\n") == 0);
  CHECK(frame.closedCount() == 3);
  return true;
}

bool test_render_sixteen_square_fits() {
  InputFrame frame(MatrixGeometry(16, 16));
  for (uint8_t i = 0; i < 16; ++i) frame.set(i, i, true);

  char json[FrameRenderer::kJsonBufLen];
  char grid[FrameRenderer::kGridBufLen];
  CHECK(FrameRenderer::renderJson(frame, json, sizeof(json)));
  CHECK(FrameRenderer::renderGrid(frame, grid, sizeof(grid)));
  CHECK(std::strncmp(grid + 3, "  A   B ", 8) == 0);
  CHECK(std::strstr(grid, "\n9   [ ]") != nullptr);
  CHECK(std::strstr(grid, "\n10  [ ]") != nullptr);
  CHECK(std::strstr(grid, "\n16  [ ]") != nullptr);
  const size_t len = std::strlen(grid);
  CHECK(len > 5 && std::strcmp(grid + len - 5, " [X]\n") == 0);
  return true;
}

// ---------------------------------------------------------------- config

bool test_pin_map_validation() {
  PinMap m;
  const uint8_t rows[] = {1, 2};
  const uint8_t cols[] = {3, 4};
  const uint8_t dup[] = {2, 5};
  const uint8_t unused[] = {MatrixConfig::kPinUnused};
  uint8_t many[17];
  for (uint8_t i = 0; i < 17; ++i) many[i] = (uint8_t)(20 + i);

  CHECK(MatrixConfig::buildPinMap(rows, 0, cols, 2, m) == MatrixError::config_missing);
  CHECK(MatrixConfig::buildPinMap(rows, 2, dup, 2, m) == MatrixError::config_missing);
  CHECK(MatrixConfig::buildPinMap(rows, 2, unused, 1, m) == MatrixError::config_missing);
  CHECK(MatrixConfig::buildPinMap(many, 17, cols, 2, m) == MatrixError::config_missing);
  CHECK(MatrixConfig::buildPinMap(rows, 2, cols, 2, m) == MatrixError::none);
  CHECK(m.geometry.rows == 2 && m.geometry.cols == 2);

  OutputMatrixConfig out;
  CHECK(MatrixConfig::resolveOutput(m, "MID", out) == MatrixError::config_missing);
  CHECK(MatrixConfig::resolveOutput(m, "low", out) == MatrixError::none);
  CHECK(out.activeLevel == PinLevel::low && out.inactiveLevel == PinLevel::high);

  InputMatrixConfig in;
  CHECK(MatrixConfig::resolveInput(m, "SIDEWAYS", "LOW", in) == MatrixError::config_missing);
  CHECK(MatrixConfig::resolveInput(m, "UP", "", in) == MatrixError::config_missing);
  CHECK(MatrixConfig::resolveInput(m, "UP", "HIGH", in) == MatrixError::none);
  CHECK(MatrixConfig::closedMatchesIdle(in));

  PinMap empty;
  CHECK(MatrixConfig::resolveOutput(empty, "HIGH", out) == MatrixError::config_missing);
  CHECK(resultCode(MatrixError::config_missing) == -6);
  return true;
}

bool test_parse_console_commands() {
  Command cmd;
  CHECK(parseCommand("activate A1 2", cmd) == MatrixError::none);
  CHECK(cmd.type == CommandType::activate);
  CHECK(std::strcmp(cmd.arg1, "A1") == 0 && std::strcmp(cmd.arg2, "2") == 0);

  CHECK(parseCommand("  WRITE b2 0.5\r", cmd) == MatrixError::none);
  CHECK(cmd.type == CommandType::activate);
  CHECK(std::strcmp(cmd.arg1, "b2") == 0);

  CHECK(parseCommand("activate A1", cmd) == MatrixError::usage);
  CHECK(parseCommand("reset", cmd) == MatrixError::none && cmd.type == CommandType::reset);
  CHECK(parseCommand("reset now", cmd) == MatrixError::usage);
  CHECK(parseCommand("read", cmd) == MatrixError::none && cmd.type == CommandType::read);
  CHECK(parseCommand("status", cmd) == MatrixError::none && cmd.type == CommandType::status);
  CHECK(parseCommand("?", cmd) == MatrixError::none && cmd.type == CommandType::help);

  CHECK(parseCommand("monitor", cmd) == MatrixError::none);
  CHECK(cmd.type == CommandType::monitor && !cmd.hasArg1);
  CHECK(parseCommand("monitor 0.2", cmd) == MatrixError::none);
  CHECK(cmd.hasArg1 && std::strcmp(cmd.arg1, "0.2") == 0);
  CHECK(parseCommand("monitor 1 2", cmd) == MatrixError::usage);

  CHECK(parseCommand("config", cmd) == MatrixError::none && cmd.type == CommandType::config_show);
  CHECK(parseCommand("config CLEAR", cmd) == MatrixError::none && cmd.type == CommandType::config_clear);
  CHECK(parseCommand("config set Safety_Timeout 5", cmd) == MatrixError::none);
  CHECK(cmd.type == CommandType::config_set);
  CHECK(std::strcmp(cmd.arg1, "safety_timeout") == 0 && std::strcmp(cmd.arg2, "5") == 0);
  CHECK(parseCommand("config set x", cmd) == MatrixError::usage);

  const char ctrlC[] = {kInterruptByte, '\0'};
  CHECK(parseCommand(ctrlC, cmd) == MatrixError::none && cmd.type == CommandType::stop);
  CHECK(parseCommand("", cmd) == MatrixError::none && cmd.type == CommandType::none);
  CHECK(parseCommand("   ", cmd) == MatrixError::none && cmd.type == CommandType::none);
  CHECK(parseCommand("bogus", cmd) == MatrixError::usage);
  CHECK(parseCommand("activate A1 2 extra", cmd) == MatrixError::usage);
  CHECK(parseCommand("activate A1 2 extra more", cmd) == MatrixError::usage);
  return true;
}

bool test_apply_setting_validates_values() {
  Config cfg;
  CHECK(cfg.force_off_on_conflict);
  CHECK(cfg.safety_timeout_ms == 0);
  CHECK(cfg.monitor_interval_ms == 500);

  CHECK(applySetting(cfg, kKeySafetyTimeout, "5") == MatrixError::none);
  CHECK(cfg.safety_timeout_ms == 5000);
  CHECK(applySetting(cfg, kKeySafetyTimeout, "0.4") == MatrixError::usage);
  CHECK(applySetting(cfg, kKeySafetyTimeout, "3601") == MatrixError::usage);
  CHECK(applySetting(cfg, kKeySafetyTimeout, "-1") == MatrixError::usage);
  CHECK(cfg.safety_timeout_ms == 5000);
  CHECK(applySetting(cfg, kKeySafetyTimeout, "0") == MatrixError::none);
  CHECK(cfg.safety_timeout_ms == 0);

  CHECK(applySetting(cfg, kKeyForceOff, "off") == MatrixError::none);
  CHECK(!cfg.force_off_on_conflict);
  CHECK(applySetting(cfg, kKeyForceOff, "maybe") == MatrixError::usage);
  CHECK(!cfg.force_off_on_conflict);
  CHECK(applySetting(cfg, kKeyForceOff, "1") == MatrixError::none);
  CHECK(cfg.force_off_on_conflict);

  CHECK(applySetting(cfg, kKeyMonitorInterval, "2") == MatrixError::none);
  CHECK(cfg.monitor_interval_ms == 2000);
  CHECK(applySetting(cfg, kKeyMonitorInterval, "0.05") == MatrixError::usage);
  CHECK(cfg.monitor_interval_ms == 2000);

  CHECK(applySetting(cfg, "geometry", "4") == MatrixError::usage);
  return true;
}

bool test_result_codes_are_stable() {
  CHECK(resultCode(MatrixError::none) == 0);
  CHECK(resultCode(MatrixError::usage) == -1);
  CHECK(resultCode(MatrixError::invalid_position) == -2);
  CHECK(resultCode(MatrixError::already_active) == -3);
  CHECK(resultCode(MatrixError::conflict) == -3);
  CHECK(resultCode(MatrixError::invalid_duration) == -4);
  CHECK(resultCode(MatrixError::hardware) == -5);
  CHECK(resultCode(MatrixError::config_missing) == -6);
  CHECK(resultCode(MatrixError::sensor_read) == -7);
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_position_decode_accepts_both_notations();
  ok &= test_position_round_trip_and_numeric_index_law();
  ok &= test_position_rejects_malformed_tokens();
  ok &= test_duration_and_interval_bounds();

  ok &= test_output_begin_drives_every_pin_inactive();
  ok &= test_output_begin_never_energises_a_cell_while_claiming();
  ok &= test_output_begin_releases_pin_it_cannot_drive();
  ok &= test_output_begin_reports_busy_pin_and_releases_claims();
  ok &= test_activate_numeric_position_then_idle();
  ok &= test_arm_drives_exactly_one_pair_until_deadline();
  ok &= test_strict_policy_reports_already_active_and_conflict();
  ok &= test_force_off_rearms_and_preempts();
  ok &= test_rejected_arguments_leave_state_untouched();
  ok &= test_safety_timeout_caps_activation();
  ok &= test_interrupt_during_activation_leaves_pins_inactive();
  ok &= test_request_during_activation_follows_conflict_policy();
  ok &= test_pin_fault_while_arming_rolls_back();
  ok &= test_reset_is_idempotent();
  ok &= test_controller_teardown_drives_outputs_inactive();
  ok &= test_activation_deadline_survives_clock_wraparound();

  ok &= test_scan_selects_one_column_at_a_time();
  ok &= test_scan_pull_down_polarity();
  ok &= test_scan_read_failure_restores_columns();
  ok &= test_scan_needs_begin();
  ok &= test_input_and_output_cannot_share_a_pin();
  ok &= test_monitor_reports_first_frame_and_changes();
  ok &= test_monitor_stops_on_read_failure();

  ok &= test_render_json_and_grid();
  ok &= test_render_mixed_frame();
  ok &= test_render_sixteen_square_fits();

  ok &= test_pin_map_validation();
  ok &= test_parse_console_commands();
  ok &= test_apply_setting_validates_values();
  ok &= test_result_codes_are_stable();

  if (!ok) return 1;

  std::cout << "native_flow tests passed\n";
  return 0;
}
