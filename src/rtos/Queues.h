#pragma once

#include <Arduino.h>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace RtosQueues {

enum class LineKind : uint8_t {
  line,
  interrupt
};

struct LineMsg {
  LineKind kind = LineKind::line;
  char text[64]{};
};

extern QueueHandle_t consoleQ;

bool init();

} // namespace RtosQueues
