#pragma once

#include <Arduino.h>

#include "rtos/Queues.h"

namespace RtosTasks {

struct Stats {
  uint32_t lineDrops = 0;
  uint32_t overlongLines = 0;
  uint32_t interrupts = 0;
};

// Starts the console reader. Lines and Ctrl-C are forwarded to consoleQ;
// command handling stays on the Arduino loop task.
bool start();

Stats stats();

// Waits up to timeoutMs for the next console message.
bool dequeueLine(RtosQueues::LineMsg& out, uint32_t timeoutMs);

// Consumes a Ctrl-C seen since the last call, even if its queue slot was dropped.
bool takeInterrupt();

} // namespace RtosTasks
