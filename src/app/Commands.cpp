#include "app/Commands.h"

#include <cstring>

namespace {
constexpr uint8_t kMaxTokens = 4;

bool isSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Splits `line` on whitespace. Returns token count, or kMaxTokens + 1 if
// there are too many or one does not fit.
uint8_t tokenize(const char* line, char tokens[][kCommandArgLen]) {
  uint8_t n = 0;
  const char* p = line;
  for (;;) {
    while (isSpace(*p)) ++p;
    if (*p == '\0') return n;
    if (n >= kMaxTokens) return kMaxTokens + 1;

    size_t len = 0;
    while (p[len] != '\0' && !isSpace(p[len])) ++len;
    if (len >= kCommandArgLen) return kMaxTokens + 1;

    std::memcpy(tokens[n], p, len);
    tokens[n][len] = '\0';
    ++n;
    p += len;
  }
}

void toLower(char* s) {
  for (; *s; ++s) {
    if (*s >= 'A' && *s <= 'Z') *s = (char)(*s - 'A' + 'a');
  }
}

void setArg(char* dst, const char* src) {
  std::strncpy(dst, src, kCommandArgLen - 1);
  dst[kCommandArgLen - 1] = '\0';
}
} // namespace

MatrixError parseCommand(const char* line, Command& out) {
  out = Command{};
  if (!line) return MatrixError::none;
  if (std::strchr(line, kInterruptByte)) {
    out.type = CommandType::stop;
    return MatrixError::none;
  }

  char tok[kMaxTokens][kCommandArgLen];
  const uint8_t n = tokenize(line, tok);
  if (n == 0) return MatrixError::none;
  if (n > kMaxTokens) return MatrixError::usage;

  char* verb = tok[0];
  toLower(verb);

  if (std::strcmp(verb, "help") == 0 || std::strcmp(verb, "?") == 0) {
    if (n != 1) return MatrixError::usage;
    out.type = CommandType::help;
    return MatrixError::none;
  }

  if (std::strcmp(verb, "activate") == 0 || std::strcmp(verb, "write") == 0) {
    if (n != 3) return MatrixError::usage;
    out.type = CommandType::activate;
    setArg(out.arg1, tok[1]);
    setArg(out.arg2, tok[2]);
    out.hasArg1 = true;
    out.hasArg2 = true;
    return MatrixError::none;
  }

  CommandType bare = CommandType::none;
  if (std::strcmp(verb, "reset") == 0) bare = CommandType::reset;
  else if (std::strcmp(verb, "read") == 0) bare = CommandType::read;
  else if (std::strcmp(verb, "status") == 0) bare = CommandType::status;
  else if (std::strcmp(verb, "stop") == 0) bare = CommandType::stop;
  if (bare != CommandType::none) {
    if (n != 1) return MatrixError::usage;
    out.type = bare;
    return MatrixError::none;
  }

  if (std::strcmp(verb, "monitor") == 0) {
    if (n > 2) return MatrixError::usage;
    out.type = CommandType::monitor;
    if (n == 2) {
      setArg(out.arg1, tok[1]);
      out.hasArg1 = true;
    }
    return MatrixError::none;
  }

  if (std::strcmp(verb, "config") == 0) {
    if (n == 1) {
      out.type = CommandType::config_show;
      return MatrixError::none;
    }
    toLower(tok[1]);
    if (n == 2 && std::strcmp(tok[1], "clear") == 0) {
      out.type = CommandType::config_clear;
      return MatrixError::none;
    }
    if (n == 4 && std::strcmp(tok[1], "set") == 0) {
      toLower(tok[2]);
      out.type = CommandType::config_set;
      setArg(out.arg1, tok[2]);
      setArg(out.arg2, tok[3]);
      out.hasArg1 = true;
      out.hasArg2 = true;
      return MatrixError::none;
    }
    return MatrixError::usage;
  }

  return MatrixError::usage;
}
