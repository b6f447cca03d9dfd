#pragma once

#include <stddef.h>
#include <stdint.h>

#include "matrix/MatrixError.h"
#include "matrix/MatrixTypes.h"

struct PinMap {
  uint8_t rowPins[kMaxMatrixRows]{};
  uint8_t colPins[kMaxMatrixCols]{};
  MatrixGeometry geometry{};
};

// Output polarity resolved once at startup.
struct OutputMatrixConfig {
  PinMap pins{};
  PinLevel activeLevel = PinLevel::high;
  PinLevel inactiveLevel = PinLevel::low;
};

// Input polarity resolved once at startup. Pull-up rows idle HIGH, so a column
// is selected by pulling it LOW; pull-down wiring is the mirror image.
struct InputMatrixConfig {
  PinMap pins{};
  PullMode pull = PullMode::up;
  PinLevel selectLevel = PinLevel::low;
  PinLevel idleLevel = PinLevel::high;
  PinLevel closedLevel = PinLevel::low;
};

namespace MatrixConfig {

constexpr uint8_t kPinUnused = 255;

bool parseLevel(const char* text, PinLevel& out);
bool parsePull(const char* text, PullMode& out);

MatrixError buildPinMap(const uint8_t* rowPins, size_t nRows,
                        const uint8_t* colPins, size_t nCols,
                        PinMap& out);

MatrixError resolveOutput(const PinMap& pins, const char* activeLevel, OutputMatrixConfig& out);
MatrixError resolveInput(const PinMap& pins,
                         const char* pullMode,
                         const char* closedState,
                         InputMatrixConfig& out);

// True when `closedLevel` equals the level the rows idle at, i.e. a closed
// switch could never be told apart from an open one.
bool closedMatchesIdle(const InputMatrixConfig& cfg);

} // namespace MatrixConfig
