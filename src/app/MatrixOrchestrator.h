#pragma once

#include <Arduino.h>

#include "app/Commands.h"
#include "app/Config.h"
#include "app/EspClock.h"
#include "drivers/ArduinoPinDriver.h"
#include "matrix/InputScanner.h"
#include "matrix/MatrixConfig.h"
#include "matrix/MatrixMonitor.h"
#include "matrix/OutputController.h"
#include "services/Logger.h"
#include "services/SettingsStore.h"

class MatrixOrchestrator {
public:
  MatrixOrchestrator();

  void begin();
  void tick(uint32_t nowMs);

private:
  // Declaration order matters: the resolved configs feed the controller and
  // scanner constructors below.
  Config cfg_;
  OutputMatrixConfig outCfg_;
  MatrixError outCfgErr_;
  InputMatrixConfig inCfg_;
  MatrixError inCfgErr_;

  ArduinoPinDriver pins_;
  EspClock clock_;
  OutputController output_;
  InputScanner scanner_;
  MatrixMonitor monitor_;

  Logger logger_;
  SettingsStore settings_;

  MatrixError outReady_ = MatrixError::config_missing;
  MatrixError inReady_ = MatrixError::config_missing;

  void applyPolicy();
  void printHelp() const;
  void printConfig() const;

  MatrixError dispatch(const Command& cmd);
  MatrixError runActivate(const Command& cmd);
  MatrixError runReset();
  MatrixError runRead();
  MatrixError runMonitor(const Command& cmd);
  MatrixError runStatus();
  MatrixError runConfigSet(const Command& cmd);
  MatrixError runConfigClear();
};
