#include "matrix/MatrixConfig.h"

namespace MatrixConfig {

namespace {
bool eqIgnoreCase(const char* a, const char* b) {
  if (!a || !b) return false;
  for (; *a && *b; ++a, ++b) {
    char ca = *a;
    char cb = *b;
    if (ca >= 'a' && ca <= 'z') ca = (char)(ca - 'a' + 'A');
    if (cb >= 'a' && cb <= 'z') cb = (char)(cb - 'a' + 'A');
    if (ca != cb) return false;
  }
  return *a == '\0' && *b == '\0';
}

bool contains(const uint8_t* pins, uint8_t n, uint8_t pin) {
  for (uint8_t i = 0; i < n; ++i) {
    if (pins[i] == pin) return true;
  }
  return false;
}
} // namespace

bool parseLevel(const char* text, PinLevel& out) {
  if (eqIgnoreCase(text, "HIGH")) { out = PinLevel::high; return true; }
  if (eqIgnoreCase(text, "LOW"))  { out = PinLevel::low;  return true; }
  return false;
}

bool parsePull(const char* text, PullMode& out) {
  if (eqIgnoreCase(text, "UP"))   { out = PullMode::up;   return true; }
  if (eqIgnoreCase(text, "DOWN")) { out = PullMode::down; return true; }
  return false;
}

MatrixError buildPinMap(const uint8_t* rowPins, size_t nRows,
                        const uint8_t* colPins, size_t nCols,
                        PinMap& out) {
  if (!rowPins || !colPins) return MatrixError::config_missing;
  if (nRows == 0 || nCols == 0) return MatrixError::config_missing;
  if (nRows > kMaxMatrixRows || nCols > kMaxMatrixCols) return MatrixError::config_missing;

  PinMap m;
  uint8_t seen[kMaxMatrixRows + kMaxMatrixCols];
  uint8_t nSeen = 0;

  for (size_t r = 0; r < nRows; ++r) {
    const uint8_t pin = rowPins[r];
    if (pin == kPinUnused || contains(seen, nSeen, pin)) return MatrixError::config_missing;
    m.rowPins[r] = pin;
    seen[nSeen++] = pin;
  }
  for (size_t c = 0; c < nCols; ++c) {
    const uint8_t pin = colPins[c];
    if (pin == kPinUnused || contains(seen, nSeen, pin)) return MatrixError::config_missing;
    m.colPins[c] = pin;
    seen[nSeen++] = pin;
  }

  m.geometry = MatrixGeometry((uint8_t)nRows, (uint8_t)nCols);
  out = m;
  return MatrixError::none;
}

MatrixError resolveOutput(const PinMap& pins, const char* activeLevel, OutputMatrixConfig& out) {
  if (!pins.geometry.valid()) return MatrixError::config_missing;
  PinLevel active;
  if (!parseLevel(activeLevel, active)) return MatrixError::config_missing;

  out.pins = pins;
  out.activeLevel = active;
  out.inactiveLevel = opposite(active);
  return MatrixError::none;
}

MatrixError resolveInput(const PinMap& pins,
                         const char* pullMode,
                         const char* closedState,
                         InputMatrixConfig& out) {
  if (!pins.geometry.valid()) return MatrixError::config_missing;
  PullMode pull;
  PinLevel closed;
  if (!parsePull(pullMode, pull)) return MatrixError::config_missing;
  if (!parseLevel(closedState, closed)) return MatrixError::config_missing;

  out.pins = pins;
  out.pull = pull;
  out.idleLevel = (pull == PullMode::up) ? PinLevel::high : PinLevel::low;
  out.selectLevel = opposite(out.idleLevel);
  out.closedLevel = closed;
  return MatrixError::none;
}

bool closedMatchesIdle(const InputMatrixConfig& cfg) {
  return cfg.closedLevel == cfg.idleLevel;
}

} // namespace MatrixConfig
