#include "rtos/Queues.h"

namespace RtosQueues {

QueueHandle_t consoleQ = nullptr;

bool init() {
  if (!consoleQ) consoleQ = xQueueCreate(8, sizeof(LineMsg));
  return consoleQ != nullptr;
}

} // namespace RtosQueues
