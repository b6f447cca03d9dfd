#include "app/Config.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

#include "matrix/PositionCodec.h"

namespace {
bool parseBool(const char* s, bool& out) {
  if (std::strcmp(s, "1") == 0 || std::strcmp(s, "true") == 0 || std::strcmp(s, "on") == 0) {
    out = true;
    return true;
  }
  if (std::strcmp(s, "0") == 0 || std::strcmp(s, "false") == 0 || std::strcmp(s, "off") == 0) {
    out = false;
    return true;
  }
  return false;
}

bool parseSafetySeconds(const char* s, uint32_t& outMs) {
  char* end = nullptr;
  const double secs = std::strtod(s, &end);
  if (end == s || *end != '\0' || !std::isfinite(secs)) return false;
  if (secs < 0.0) return false;
  if (secs == 0.0) {
    outMs = 0;
    return true;
  }
  const double ms = secs * 1000.0 + 0.5;
  if (ms < PositionCodec::kMinDurationMs || ms > kMaxSafetyTimeoutMs) return false;
  outMs = (uint32_t)ms;
  return true;
}
} // namespace

MatrixError applySetting(Config& cfg, const char* key, const char* value) {
  if (!key || !value) return MatrixError::usage;

  if (std::strcmp(key, kKeySafetyTimeout) == 0) {
    uint32_t ms = 0;
    if (!parseSafetySeconds(value, ms)) return MatrixError::usage;
    cfg.safety_timeout_ms = ms;
    return MatrixError::none;
  }

  if (std::strcmp(key, kKeyForceOff) == 0) {
    bool on = false;
    if (!parseBool(value, on)) return MatrixError::usage;
    cfg.force_off_on_conflict = on;
    return MatrixError::none;
  }

  if (std::strcmp(key, kKeyMonitorInterval) == 0) {
    uint32_t ms = 0;
    const MatrixError e = PositionCodec::parseInterval(value, ms);
    if (e != MatrixError::none) return e;
    cfg.monitor_interval_ms = ms;
    return MatrixError::none;
  }

  return MatrixError::usage;
}
