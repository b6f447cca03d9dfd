#pragma once

#include <Arduino.h>
#include <Preferences.h>

#include "app/Config.h"

// NVS-backed overrides of the runtime policy in Config. Geometry and pin
// maps are not stored here.
class SettingsStore {
public:
  bool begin();
  bool ready() const { return ready_; }

  // Applies stored overrides on top of `cfg`. Unreadable entries are skipped.
  void load(Config& cfg);

  bool save(const Config& cfg);
  bool clear();

private:
  Preferences pref_;
  bool ready_ = false;
};
