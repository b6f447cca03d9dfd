#include "matrix/MatrixMonitor.h"

MonitorResult MatrixMonitor::run(uint32_t intervalMs, MonitorListener& listener) {
  MonitorResult res;
  InputFrame last;
  uint32_t nextMs = clock_.nowMs();

  for (;;) {
    InputFrame frame;
    res.error = scanner_.scan(frame);
    if (res.error != MatrixError::none) return res;

    const uint16_t changed = (res.scans == 0) ? frame.geometry().cells() : frame.diff(last);
    if (changed > 0) {
      listener.onFrame(frame, res.scans, changed);
      ++res.reported;
    }
    last = frame;
    ++res.scans;

    // Fixed period measured from the previous slot; resync after an overrun.
    nextMs += intervalMs;
    const uint32_t nowMs = clock_.nowMs();
    uint32_t waitMs = 0;
    if (reached(nowMs, nextMs)) {
      nextMs = nowMs;
    } else {
      waitMs = nextMs - nowMs;
    }
    if (clock_.waitFor(waitMs, nullptr) == WaitOutcome::interrupted) return res;
  }
}
