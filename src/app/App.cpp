#include "app/App.h"

#include "app/MatrixOrchestrator.h"

static MatrixOrchestrator orchestrator;

void App::begin() {
  orchestrator.begin();
}

void App::tick(uint32_t nowMs) {
  orchestrator.tick(nowMs);
}
