#include "rtos/Tasks.h"

#include <cstring>

#include <freertos/task.h>

#include "app/Commands.h"

namespace RtosTasks {

static TaskHandle_t hConsole = nullptr;
static bool started = false;

static volatile uint32_t gLineDrops = 0;
static volatile uint32_t gOverlong = 0;
static volatile uint32_t gInterrupts = 0;
static volatile bool gInterruptPending = false;
// Set on the console core, consumed on the loop core.
static portMUX_TYPE gInterruptMux = portMUX_INITIALIZER_UNLOCKED;

static void pushLine(const char* text) {
  RtosQueues::LineMsg msg{};
  msg.kind = RtosQueues::LineKind::line;
  std::strncpy(msg.text, text, sizeof(msg.text) - 1);
  msg.text[sizeof(msg.text) - 1] = '\0';
  if (xQueueSend(RtosQueues::consoleQ, &msg, 0) != pdTRUE) {
    ++gLineDrops;
  }
}

static void pushInterrupt() {
  ++gInterrupts;
  portENTER_CRITICAL(&gInterruptMux);
  gInterruptPending = true;
  portEXIT_CRITICAL(&gInterruptMux);
  RtosQueues::LineMsg msg{};
  msg.kind = RtosQueues::LineKind::interrupt;
  if (xQueueSendToFront(RtosQueues::consoleQ, &msg, 0) != pdTRUE) {
    ++gLineDrops;
  }
}

static void consoleTask(void*) {
  char line[sizeof(RtosQueues::LineMsg::text)];
  size_t len = 0;
  bool discarding = false;

  const TickType_t period = pdMS_TO_TICKS(5);
  for (;;) {
    while (Serial.available() > 0) {
      const char c = (char)Serial.read();
      if (c == kInterruptByte) {
        pushInterrupt();
        len = 0;
        discarding = false;
        continue;
      }
      if (c == '\r') continue;
      if (c == '\n') {
        if (!discarding && len > 0) {
          line[len] = '\0';
          pushLine(line);
        }
        len = 0;
        discarding = false;
        continue;
      }
      if (discarding) continue;
      if (len + 1 >= sizeof(line)) {
        ++gOverlong;
        discarding = true;
        continue;
      }
      line[len++] = c;
    }
    vTaskDelay(period);
  }
}

bool start() {
  if (started) return true;
  if (!RtosQueues::init()) return false;

  if (xTaskCreatePinnedToCore(consoleTask, "console", 3072, nullptr, 2, &hConsole, 0) != pdPASS) {
    return false;
  }
  started = true;
  return true;
}

Stats stats() {
  Stats s{};
  s.lineDrops = gLineDrops;
  s.overlongLines = gOverlong;
  s.interrupts = gInterrupts;
  return s;
}

bool dequeueLine(RtosQueues::LineMsg& out, uint32_t timeoutMs) {
  if (!RtosQueues::consoleQ) return false;
  return xQueueReceive(RtosQueues::consoleQ, &out, pdMS_TO_TICKS(timeoutMs)) == pdTRUE;
}

bool takeInterrupt() {
  portENTER_CRITICAL(&gInterruptMux);
  const bool pending = gInterruptPending;
  gInterruptPending = false;
  portEXIT_CRITICAL(&gInterruptMux);
  return pending;
}

} // namespace RtosTasks
