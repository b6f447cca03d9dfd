#pragma once

#include <stdint.h>

#include "matrix/MatrixError.h"

#ifndef FORCE_OFF_ON_CONFLICT_DEFAULT
#define FORCE_OFF_ON_CONFLICT_DEFAULT 1
#endif

// Runtime policy. Matrix geometry and pin maps live in HardwareConfig.h and
// are never changed at runtime; these three may be overridden from NVS.
struct Config {
  uint32_t safety_timeout_ms = 0;  // 0 = disabled
  bool force_off_on_conflict = (FORCE_OFF_ON_CONFLICT_DEFAULT != 0);
  uint32_t monitor_interval_ms = 500;

  uint32_t scan_settle_us = 50;
  uint32_t console_poll_ms = 50;
};

constexpr uint32_t kMaxSafetyTimeoutMs = 3600000;

// Keys accepted by `config set`.
constexpr const char* kKeySafetyTimeout = "safety_timeout";
constexpr const char* kKeyForceOff = "force_off_on_conflict";
constexpr const char* kKeyMonitorInterval = "monitor_interval";

// Parses `value` (seconds or boolean) into the field named by `key`.
// MatrixError::usage for unknown keys or malformed values; cfg untouched then.
MatrixError applySetting(Config& cfg, const char* key, const char* value);
