#pragma once

#include <stdint.h>

enum class MatrixError : uint8_t {
  none,
  usage,
  invalid_position,
  invalid_duration,
  already_active,
  conflict,
  hardware,
  config_missing,
  sensor_read
};

static inline const char* toString(MatrixError e) {
  switch (e) {
    case MatrixError::none:             return "ok";
    case MatrixError::usage:            return "usage";
    case MatrixError::invalid_position: return "invalid_position";
    case MatrixError::invalid_duration: return "invalid_duration";
    case MatrixError::already_active:   return "already_active";
    case MatrixError::conflict:         return "conflict";
    case MatrixError::hardware:         return "hardware";
    case MatrixError::config_missing:   return "config_missing";
    case MatrixError::sensor_read:      return "sensor_read";
    default:                            return "unknown";
  }
}

// Stable codes printed on the console result line. Scripts branch on these.
static inline int resultCode(MatrixError e) {
  switch (e) {
    case MatrixError::none:             return 0;
    case MatrixError::usage:            return -1;
    case MatrixError::invalid_position: return -2;
    case MatrixError::already_active:   return -3;
    case MatrixError::conflict:         return -3;
    case MatrixError::invalid_duration: return -4;
    case MatrixError::hardware:         return -5;
    case MatrixError::config_missing:   return -6;
    case MatrixError::sensor_read:      return -7;
    default:                            return -1;
  }
}
