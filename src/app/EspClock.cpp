#include "app/EspClock.h"

#include "app/Commands.h"
#include "matrix/PositionCodec.h"
#include "rtos/Tasks.h"
#include "services/Console.h"

WaitOutcome EspClock::waitFor(uint32_t maxMs, ActivationRequest* request) {
  const uint32_t startMs = millis();

  for (;;) {
    if (RtosTasks::takeInterrupt()) return WaitOutcome::interrupted;

    const uint32_t elapsed = millis() - startMs;
    if (elapsed >= maxMs) return WaitOutcome::elapsed;
    uint32_t slice = maxMs - elapsed;
    if (slice > kSliceMs) slice = kSliceMs;

    RtosQueues::LineMsg msg;
    if (!RtosTasks::dequeueLine(msg, slice)) continue;
    // The flag is cleared by whoever saw the Ctrl-C first; a queued copy
    // without it is stale.
    if (msg.kind == RtosQueues::LineKind::interrupt) {
      if (RtosTasks::takeInterrupt()) return WaitOutcome::interrupted;
      continue;
    }

    Command cmd;
    const MatrixError perr = parseCommand(msg.text, cmd);
    if (perr != MatrixError::none) {
      Console::error(perr, "unrecognised command '%s'", msg.text);
      continue;
    }

    switch (cmd.type) {
      case CommandType::none:
        break;

      case CommandType::stop:
        return WaitOutcome::interrupted;

      case CommandType::reset:
        resetRequested_ = true;
        return WaitOutcome::interrupted;

      case CommandType::activate: {
        if (!request) {
          Console::error(MatrixError::usage, "busy: activate not available now");
          break;
        }
        ActivationRequest req;
        MatrixError e = PositionCodec::decode(cmd.arg1, geometry_, req.position);
        if (e != MatrixError::none) {
          Console::error(e, "position '%s'", cmd.arg1);
          break;
        }
        e = PositionCodec::parseDuration(cmd.arg2, req.duration_ms);
        if (e != MatrixError::none) {
          Console::error(e, "duration '%s' must be 0.5..600 s", cmd.arg2);
          break;
        }
        *request = req;
        return WaitOutcome::request;
      }

      default:
        Console::error(MatrixError::usage, "busy: %s not available now", toString(cmd.type));
        break;
    }
  }
}

bool EspClock::takeResetRequest() {
  const bool r = resetRequested_;
  resetRequested_ = false;
  return r;
}
