#pragma once
#include <Arduino.h>

#include "app/Commands.h"
#include "matrix/MatrixMonitor.h"
#include "matrix/OutputController.h"

class Logger : public OutputListener, public MonitorListener {
public:
  void begin();

  void logCommand(const Command& cmd, MatrixError result);

  void onActivated(const Position& pos, uint32_t durationMs, uint32_t deadlineMs) override;
  void onDeactivated(const Position& pos, DeactivateReason reason) override;
  void onRequestHandled(const ActivationRequest& req, MatrixError err) override;

  void onFrame(const InputFrame& frame, uint32_t scanIndex, uint16_t changed) override;
};
