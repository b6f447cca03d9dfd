#pragma once

#include <stddef.h>
#include <stdint.h>

#include "matrix/MatrixError.h"

enum class CommandType {
  none,
  help,
  activate,
  reset,
  read,
  monitor,
  status,
  config_show,
  config_set,
  config_clear,
  stop
};

static inline const char* toString(CommandType t) {
  switch (t) {
    case CommandType::none:         return "none";
    case CommandType::help:         return "help";
    case CommandType::activate:     return "activate";
    case CommandType::reset:        return "reset";
    case CommandType::read:         return "read";
    case CommandType::monitor:      return "monitor";
    case CommandType::status:       return "status";
    case CommandType::config_show:  return "config";
    case CommandType::config_set:   return "config_set";
    case CommandType::config_clear: return "config_clear";
    case CommandType::stop:         return "stop";
    default:                        return "unknown";
  }
}

constexpr size_t kCommandArgLen = 24;

struct Command {
  CommandType type = CommandType::none;
  char arg1[kCommandArgLen]{}; // position token or setting key
  char arg2[kCommandArgLen]{}; // seconds or setting value
  bool hasArg1 = false;
  bool hasArg2 = false;
};

// Ctrl-C on the console.
constexpr char kInterruptByte = 0x03;

// Blank lines parse to CommandType::none; anything unrecognised is a usage error.
MatrixError parseCommand(const char* line, Command& out);
