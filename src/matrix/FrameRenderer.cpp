#include "matrix/FrameRenderer.h"

#include <cstdio>

namespace FrameRenderer {

namespace {
class Writer {
public:
  Writer(char* out, size_t len) : out_(out), len_(len) {
    if (out_ && len_ > 0) out_[0] = '\0';
  }

  void put(const char* s) {
    while (*s) putc(*s++);
  }

  void putc(char c) {
    if (!out_ || pos_ + 1 >= len_) {
      overflow_ = true;
      return;
    }
    out_[pos_++] = c;
    out_[pos_] = '\0';
  }

  void putUnsigned(unsigned v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%u", v);
    put(buf);
  }

  bool ok() const { return out_ && !overflow_; }

private:
  char* out_;
  size_t len_;
  size_t pos_ = 0;
  bool overflow_ = false;
};
} // namespace

bool renderJson(const InputFrame& frame, char* out, size_t outLen) {
  Writer w(out, outLen);
  const MatrixGeometry& g = frame.geometry();

  w.put("{\"matrix\":[");
  for (uint8_t r = 0; r < g.rows; ++r) {
    if (r > 0) w.putc(',');
    w.putc('[');
    for (uint8_t c = 0; c < g.cols; ++c) {
      if (c > 0) w.putc(',');
      w.put(frame.at(r, c) ? "\"on\"" : "\"off\"");
    }
    w.putc(']');
  }
  w.put("]}");
  return w.ok();
}

bool renderGrid(const InputFrame& frame, char* out, size_t outLen) {
  Writer w(out, outLen);
  const MatrixGeometry& g = frame.geometry();

  w.put("   ");
  for (uint8_t c = 0; c < g.cols; ++c) {
    w.put("  ");
    w.putc((char)('A' + c));
    w.putc(' ');
  }
  w.putc('\n');

  for (uint8_t r = 0; r < g.rows; ++r) {
    const unsigned label = (unsigned)r + 1u;
    w.putUnsigned(label);
    w.put(label < 10 ? "  " : " ");
    for (uint8_t c = 0; c < g.cols; ++c) {
      w.put(frame.at(r, c) ? " [X]" : " [ ]");
    }
    w.putc('\n');
  }
  return w.ok();
}

} // namespace FrameRenderer
