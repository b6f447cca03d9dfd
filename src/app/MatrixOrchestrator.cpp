#include "app/MatrixOrchestrator.h"

#include "app/HardwareConfig.h"
#include "matrix/FrameRenderer.h"
#include "matrix/PositionCodec.h"
#include "rtos/Tasks.h"
#include "services/Console.h"

namespace {
static MatrixError loadOutputConfig(OutputMatrixConfig& out) {
  PinMap pins;
  const MatrixError e = MatrixConfig::buildPinMap(HwCfg::OUT_ROW_PINS, HwCfg::OUT_ROWS,
                                                  HwCfg::OUT_COL_PINS, HwCfg::OUT_COLS, pins);
  if (e != MatrixError::none) return e;
  return MatrixConfig::resolveOutput(pins, HwCfg::OUT_ACTIVE_LEVEL, out);
}

static MatrixError loadInputConfig(InputMatrixConfig& out) {
  PinMap pins;
  const MatrixError e = MatrixConfig::buildPinMap(HwCfg::IN_ROW_PINS, HwCfg::IN_ROWS,
                                                  HwCfg::IN_COL_PINS, HwCfg::IN_COLS, pins);
  if (e != MatrixError::none) return e;
  return MatrixConfig::resolveInput(pins, HwCfg::IN_PULL_MODE, HwCfg::IN_CLOSED_STATE, out);
}

static void printSeconds(const char* label, uint32_t ms) {
  Serial.printf("%s%lu.%03lus", label, (unsigned long)(ms / 1000u), (unsigned long)(ms % 1000u));
}
} // namespace

MatrixOrchestrator::MatrixOrchestrator()
  : outCfgErr_(loadOutputConfig(outCfg_)),
    inCfgErr_(loadInputConfig(inCfg_)),
    output_(pins_, clock_, outCfg_),
    scanner_(pins_, clock_, inCfg_, cfg_.scan_settle_us),
    monitor_(scanner_, clock_) {}

void MatrixOrchestrator::applyPolicy() {
  output_.setPolicy(cfg_.force_off_on_conflict, cfg_.safety_timeout_ms);
}

void MatrixOrchestrator::begin() {
  logger_.begin();

  if (settings_.begin()) settings_.load(cfg_);

  if (!RtosTasks::start()) {
    Serial.println("[RTOS] console task failed to start");
  }

  // Output side first: every output pin must be inactive before anything else
  // can claim a GPIO.
  if (outCfgErr_ != MatrixError::none) {
    Serial.printf("[CFG] output matrix unavailable: %s\n", toString(outCfgErr_));
    outReady_ = outCfgErr_;
  } else {
    output_.setListener(&logger_);
    applyPolicy();
    outReady_ = output_.begin();
    if (outReady_ == MatrixError::none) {
      clock_.setRequestGeometry(outCfg_.pins.geometry);
      Serial.printf("[OUT] %ux%u ready, active=%s\n",
                    (unsigned)outCfg_.pins.geometry.rows,
                    (unsigned)outCfg_.pins.geometry.cols,
                    toString(outCfg_.activeLevel));
    } else {
      Serial.printf("[OUT] init failed: %s\n", toString(outReady_));
    }
  }

  if (inCfgErr_ != MatrixError::none) {
    Serial.printf("[CFG] input matrix unavailable: %s\n", toString(inCfgErr_));
    inReady_ = inCfgErr_;
  } else {
    if (MatrixConfig::closedMatchesIdle(inCfg_)) {
      Serial.println("[CFG] warning: closed state equals idle level; switches will read closed");
    }
    inReady_ = scanner_.begin();
    if (inReady_ == MatrixError::none) {
      Serial.printf("[IN] %ux%u ready, pull=%s closed=%s\n",
                    (unsigned)inCfg_.pins.geometry.rows,
                    (unsigned)inCfg_.pins.geometry.cols,
                    toString(inCfg_.pull),
                    toString(inCfg_.closedLevel));
    } else {
      Serial.printf("[IN] init failed: %s\n", toString(inReady_));
    }
  }

  Serial.println("READY");
  printHelp();
}

void MatrixOrchestrator::tick(uint32_t nowMs) {
  // No-op unless an activation outlived its command.
  (void)output_.service(nowMs);

  RtosQueues::LineMsg msg;
  if (!RtosTasks::dequeueLine(msg, cfg_.console_poll_ms)) return;

  // Ctrl-C with nothing running.
  if (msg.kind == RtosQueues::LineKind::interrupt) {
    (void)RtosTasks::takeInterrupt();
    return;
  }

  Command cmd;
  MatrixError result = parseCommand(msg.text, cmd);
  if (result != MatrixError::none) {
    Console::error(result, "unrecognised command '%s' (try help)", msg.text);
  } else {
    result = dispatch(cmd);
  }
  logger_.logCommand(cmd, result);
}

MatrixError MatrixOrchestrator::dispatch(const Command& cmd) {
  switch (cmd.type) {
    case CommandType::none:
      return MatrixError::none;
    case CommandType::help:
      printHelp();
      Console::ok("help");
      return MatrixError::none;
    case CommandType::activate:     return runActivate(cmd);
    case CommandType::reset:        return runReset();
    case CommandType::read:         return runRead();
    case CommandType::monitor:      return runMonitor(cmd);
    case CommandType::status:       return runStatus();
    case CommandType::config_show:
      printConfig();
      Console::ok("config");
      return MatrixError::none;
    case CommandType::config_set:   return runConfigSet(cmd);
    case CommandType::config_clear: return runConfigClear();
    case CommandType::stop:
      Console::ok("nothing running");
      return MatrixError::none;
    default:
      Console::error(MatrixError::usage, "unsupported command");
      return MatrixError::usage;
  }
}

MatrixError MatrixOrchestrator::runActivate(const Command& cmd) {
  if (outReady_ != MatrixError::none) {
    Console::error(outReady_, "output matrix not available");
    return outReady_;
  }

  Position pos;
  MatrixError e = PositionCodec::decode(cmd.arg1, outCfg_.pins.geometry, pos);
  if (e != MatrixError::none) {
    Console::error(e, "position '%s' outside %ux%u", cmd.arg1,
                   (unsigned)outCfg_.pins.geometry.rows, (unsigned)outCfg_.pins.geometry.cols);
    return e;
  }

  uint32_t durationMs = 0;
  e = PositionCodec::parseDuration(cmd.arg2, durationMs);
  if (e != MatrixError::none) {
    Console::error(e, "duration '%s' must be 0.5..600 s", cmd.arg2);
    return e;
  }

  // A Ctrl-C typed before this command must not cancel it.
  (void)RtosTasks::takeInterrupt();

  const ActivationResult r = output_.activate(pos, durationMs);

  char name[PositionCodec::kTokenBufLen];
  (void)PositionCodec::encode(r.last, name, sizeof(name));
  if (r.error != MatrixError::none) {
    Console::error(r.error, "%s activation failed", name);
  } else {
    Console::ok("%s off (%s)", name, toString(r.end));
  }

  if (clock_.takeResetRequest()) (void)runReset();
  return r.error;
}

MatrixError MatrixOrchestrator::runReset() {
  if (outReady_ != MatrixError::none) {
    Console::error(outReady_, "output matrix not available");
    return outReady_;
  }

  const uint8_t failed = output_.reset();
  if (failed > 0) {
    Serial.printf("[OUT] reset: %u pin(s) could not be driven inactive\n", (unsigned)failed);
  }
  Console::ok("reset");
  return MatrixError::none;
}

MatrixError MatrixOrchestrator::runRead() {
  if (inReady_ != MatrixError::none) {
    Console::error(inReady_, "input matrix not available");
    return inReady_;
  }

  InputFrame frame;
  const MatrixError e = scanner_.scan(frame);
  if (e != MatrixError::none) {
    Console::error(e, "scan failed");
    return e;
  }

  static char json[FrameRenderer::kJsonBufLen];
  if (!FrameRenderer::renderJson(frame, json, sizeof(json))) {
    Console::error(MatrixError::usage, "frame too large to render");
    return MatrixError::usage;
  }
  Serial.println(json);
  Console::ok("read closed=%u", (unsigned)frame.closedCount());
  return MatrixError::none;
}

MatrixError MatrixOrchestrator::runMonitor(const Command& cmd) {
  if (inReady_ != MatrixError::none) {
    Console::error(inReady_, "input matrix not available");
    return inReady_;
  }

  uint32_t intervalMs = cfg_.monitor_interval_ms;
  if (cmd.hasArg1) {
    const MatrixError e = PositionCodec::parseInterval(cmd.arg1, intervalMs);
    if (e != MatrixError::none) {
      Console::error(e, "interval '%s' must be 0.1..60 s", cmd.arg1);
      return e;
    }
  }

  (void)RtosTasks::takeInterrupt();
  Serial.printf("[IN] monitor every %lu ms, Ctrl-C or 'stop' to end\n", (unsigned long)intervalMs);

  const MonitorResult r = monitor_.run(intervalMs, logger_);
  if (r.error != MatrixError::none) {
    Console::error(r.error, "monitor stopped after %lu scans", (unsigned long)r.scans);
  } else {
    Console::ok("monitor stopped scans=%lu reported=%lu",
                (unsigned long)r.scans, (unsigned long)r.reported);
  }

  if (clock_.takeResetRequest()) (void)runReset();
  return r.error;
}

MatrixError MatrixOrchestrator::runStatus() {
  const RtosTasks::Stats st = RtosTasks::stats();

  if (outReady_ == MatrixError::none) {
    Serial.printf("[OUT] state=%s", toString(output_.state()));
    if (output_.isActive()) {
      char name[PositionCodec::kTokenBufLen];
      (void)PositionCodec::encode(output_.activePosition(), name, sizeof(name));
      Serial.printf(" position=%s", name);
      printSeconds(" remaining=", output_.remainingMs(clock_.nowMs()));
    }
    Serial.println();
  } else {
    Serial.printf("[OUT] unavailable: %s\n", toString(outReady_));
  }

  if (inReady_ == MatrixError::none) {
    Serial.printf("[IN] ready settle=%luus\n", (unsigned long)scanner_.settleUs());
  } else {
    Serial.printf("[IN] unavailable: %s\n", toString(inReady_));
  }

  Serial.printf("[RTOS] drops=%lu overlong=%lu interrupts=%lu claimed=%u\n",
                (unsigned long)st.lineDrops,
                (unsigned long)st.overlongLines,
                (unsigned long)st.interrupts,
                (unsigned)pins_.claimedCount());

  Console::ok("status %s", toString(output_.state()));
  return MatrixError::none;
}

MatrixError MatrixOrchestrator::runConfigSet(const Command& cmd) {
  const MatrixError e = applySetting(cfg_, cmd.arg1, cmd.arg2);
  if (e != MatrixError::none) {
    Console::error(e, "cannot set %s to '%s'", cmd.arg1, cmd.arg2);
    return e;
  }
  applyPolicy();

  if (!settings_.save(cfg_)) {
    Serial.println("[CFG] not persisted; value applies until restart");
  }
  Console::ok("%s=%s", cmd.arg1, cmd.arg2);
  return MatrixError::none;
}

MatrixError MatrixOrchestrator::runConfigClear() {
  if (settings_.ready() && !settings_.clear()) {
    Serial.println("[CFG] NVS clear failed");
  }
  cfg_ = Config();
  applyPolicy();
  Console::ok("config defaults restored");
  return MatrixError::none;
}

void MatrixOrchestrator::printConfig() const {
  printSeconds("[CFG] safety_timeout=", cfg_.safety_timeout_ms);
  Serial.println(cfg_.safety_timeout_ms == 0 ? " (disabled)" : "");
  Serial.printf("[CFG] force_off_on_conflict=%s\n", cfg_.force_off_on_conflict ? "true" : "false");
  printSeconds("[CFG] monitor_interval=", cfg_.monitor_interval_ms);
  Serial.println();
  Serial.printf("[CFG] nvs=%s\n", settings_.ready() ? "ok" : "unavailable");
}

void MatrixOrchestrator::printHelp() const {
  Serial.println("Commands:");
  Serial.println("  activate <pos> <seconds>   energise one cell (pos: A1 or 1-based index)");
  Serial.println("  reset                      all outputs inactive");
  Serial.println("  read                       one input frame as JSON");
  Serial.println("  monitor [seconds]          print input changes until Ctrl-C / stop");
  Serial.println("  status                     controller state");
  Serial.println("  config | config set <key> <value> | config clear");
  Serial.println("    keys: safety_timeout (s, 0=off), force_off_on_conflict, monitor_interval (s)");
}
