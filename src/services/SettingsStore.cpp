#include "services/SettingsStore.h"

#include "matrix/PositionCodec.h"

namespace {
constexpr const char* kNamespace = "swmx";
constexpr const char* kSafety = "safety_ms";
constexpr const char* kForceOff = "force_off";
constexpr const char* kInterval = "monitor_ms";
} // namespace

bool SettingsStore::begin() {
  ready_ = pref_.begin(kNamespace, false);
  if (!ready_) Serial.println("[CFG] NVS unavailable; using compiled defaults");
  return ready_;
}

void SettingsStore::load(Config& cfg) {
  if (!ready_) return;

  if (pref_.isKey(kSafety)) {
    const uint32_t v = pref_.getULong(kSafety, cfg.safety_timeout_ms);
    if (v == 0 || (v >= PositionCodec::kMinDurationMs && v <= kMaxSafetyTimeoutMs)) {
      cfg.safety_timeout_ms = v;
    } else {
      Serial.printf("[CFG] ignoring stored %s=%lu\n", kSafety, (unsigned long)v);
    }
  }
  if (pref_.isKey(kForceOff)) {
    cfg.force_off_on_conflict = pref_.getBool(kForceOff, cfg.force_off_on_conflict);
  }
  if (pref_.isKey(kInterval)) {
    const uint32_t v = pref_.getULong(kInterval, cfg.monitor_interval_ms);
    if (v >= PositionCodec::kMinIntervalMs && v <= PositionCodec::kMaxIntervalMs) {
      cfg.monitor_interval_ms = v;
    } else {
      Serial.printf("[CFG] ignoring stored %s=%lu\n", kInterval, (unsigned long)v);
    }
  }
}

bool SettingsStore::save(const Config& cfg) {
  if (!ready_) return false;
  bool ok = pref_.putULong(kSafety, cfg.safety_timeout_ms) > 0;
  ok = (pref_.putBool(kForceOff, cfg.force_off_on_conflict) > 0) && ok;
  ok = (pref_.putULong(kInterval, cfg.monitor_interval_ms) > 0) && ok;
  return ok;
}

bool SettingsStore::clear() {
  if (!ready_) return false;
  return pref_.clear();
}
