#include "matrix/PositionCodec.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace PositionCodec {

namespace {
constexpr size_t kMaxTokenLen = 8;

bool isDigit(char c) { return c >= '0' && c <= '9'; }
bool isUpperAlpha(char c) { return c >= 'A' && c <= 'Z'; }
bool isSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Trimmed, upper-cased copy of `token`; false if empty or too long.
bool normalize(const char* token, char* out, size_t outLen) {
  if (!token) return false;
  while (isSpace(*token)) ++token;
  size_t n = 0;
  while (token[n] != '\0') ++n;
  while (n > 0 && isSpace(token[n - 1])) --n;
  if (n == 0 || n >= outLen) return false;
  for (size_t i = 0; i < n; ++i) {
    char c = token[i];
    if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    out[i] = c;
  }
  out[n] = '\0';
  return true;
}

bool allDigits(const char* s) {
  if (*s == '\0') return false;
  for (; *s; ++s) {
    if (!isDigit(*s)) return false;
  }
  return true;
}

// Saturates at 0xFFFF; anything that large is out of range for any geometry.
uint16_t parseIndex(const char* s) {
  uint32_t v = 0;
  for (; *s; ++s) {
    v = v * 10u + (uint32_t)(*s - '0');
    if (v > 0xFFFFu) return 0xFFFFu;
  }
  return (uint16_t)v;
}

MatrixError parseSeconds(const char* text, double minS, double maxS,
                         MatrixError err, uint32_t& outMs) {
  if (!text) return err;
  while (isSpace(*text)) ++text;
  if (*text == '\0') return err;

  char* end = nullptr;
  const double s = std::strtod(text, &end);
  if (end == text) return err;
  while (isSpace(*end)) ++end;
  if (*end != '\0') return err;
  if (!std::isfinite(s)) return err;
  if (s < minS || s > maxS) return err;

  outMs = (uint32_t)(s * 1000.0 + 0.5);
  return MatrixError::none;
}
} // namespace

MatrixError decode(const char* token, const MatrixGeometry& geometry, Position& out) {
  char buf[kMaxTokenLen + 1];
  if (!normalize(token, buf, sizeof(buf))) return MatrixError::invalid_position;

  if (isUpperAlpha(buf[0]) && allDigits(buf + 1)) {
    const uint16_t rowNum = parseIndex(buf + 1);
    const uint8_t col = (uint8_t)(buf[0] - 'A');
    if (rowNum < 1 || rowNum > geometry.rows) return MatrixError::invalid_position;
    if (col >= geometry.cols) return MatrixError::invalid_position;
    out = Position((uint8_t)(rowNum - 1), col);
    return MatrixError::none;
  }

  if (allDigits(buf)) {
    const uint16_t n = parseIndex(buf);
    if (n < 1 || n > geometry.cells()) return MatrixError::invalid_position;
    const uint16_t idx = n - 1;
    out = Position((uint8_t)(idx / geometry.cols), (uint8_t)(idx % geometry.cols));
    return MatrixError::none;
  }

  return MatrixError::invalid_position;
}

bool encode(const Position& pos, char* out, size_t outLen) {
  if (!out || outLen == 0) return false;
  const int n = std::snprintf(out, outLen, "%c%u", (char)('A' + pos.col), (unsigned)pos.row + 1u);
  return n > 0 && (size_t)n < outLen;
}

uint16_t encodeNumeric(const Position& pos, const MatrixGeometry& geometry) {
  return (uint16_t)((uint16_t)pos.row * geometry.cols + pos.col + 1u);
}

MatrixError parseDuration(const char* text, uint32_t& outMs) {
  return parseSeconds(text, kMinDurationMs / 1000.0, kMaxDurationMs / 1000.0,
                      MatrixError::invalid_duration, outMs);
}

MatrixError parseInterval(const char* text, uint32_t& outMs) {
  return parseSeconds(text, kMinIntervalMs / 1000.0, kMaxIntervalMs / 1000.0,
                      MatrixError::usage, outMs);
}

} // namespace PositionCodec
