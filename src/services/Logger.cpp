#include "services/Logger.h"

#include "matrix/FrameRenderer.h"
#include "matrix/PositionCodec.h"
#include "services/Console.h"

void Logger::begin() {}

void Logger::logCommand(const Command& cmd, MatrixError result) {
  if (cmd.type == CommandType::none) return;
  Serial.print("[LOG] command="); Serial.print(toString(cmd.type));
  Serial.print(" result="); Serial.println(resultCode(result));
}

void Logger::onActivated(const Position& pos, uint32_t durationMs, uint32_t deadlineMs) {
  char name[PositionCodec::kTokenBufLen];
  (void)PositionCodec::encode(pos, name, sizeof(name));
  Serial.printf("[OUT] %s ON for %lu.%03lus deadline=%lu\n",
                name,
                (unsigned long)(durationMs / 1000u),
                (unsigned long)(durationMs % 1000u),
                (unsigned long)deadlineMs);
}

void Logger::onDeactivated(const Position& pos, DeactivateReason reason) {
  char name[PositionCodec::kTokenBufLen];
  (void)PositionCodec::encode(pos, name, sizeof(name));
  Serial.printf("[OUT] %s OFF (%s)\n", name, toString(reason));
}

void Logger::onRequestHandled(const ActivationRequest& req, MatrixError err) {
  char name[PositionCodec::kTokenBufLen];
  (void)PositionCodec::encode(req.position, name, sizeof(name));
  if (err == MatrixError::none) {
    Console::ok("%s armed", name);
  } else {
    Console::error(err, "%s rejected while another activation is running", name);
  }
}

void Logger::onFrame(const InputFrame& frame, uint32_t scanIndex, uint16_t changed) {
  static char grid[FrameRenderer::kGridBufLen];
  Serial.printf("[IN] scan=%lu changed=%u closed=%u\n",
                (unsigned long)scanIndex, (unsigned)changed, (unsigned)frame.closedCount());
  if (FrameRenderer::renderGrid(frame, grid, sizeof(grid))) {
    Serial.print(grid);
  } else {
    Serial.println("[IN] grid too large to render");
  }
}
