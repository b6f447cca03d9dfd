#include "services/Console.h"

#include <cstdarg>
#include <cstdio>

namespace Console {

namespace {
constexpr size_t kLineLen = 128;
} // namespace

void ok(const char* fmt, ...) {
  char buf[kLineLen];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  Serial.print("OK ");
  Serial.println(buf);
}

void error(MatrixError e, const char* fmt, ...) {
  char buf[kLineLen];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  Serial.printf("ERR %d %s: ", resultCode(e), toString(e));
  Serial.println(buf);
}

} // namespace Console
