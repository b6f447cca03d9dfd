#pragma once

#include <stddef.h>
#include <stdint.h>

#include "matrix/MatrixError.h"
#include "matrix/MatrixTypes.h"

// Position notation used on the console:
//
//        A   B   C
//    1  [1] [2] [3]
//    2  [4] [5] [6]
//    3  [7] [8] [9]
//
// "B1" and "2" name the same cell (row 0, col 1).
namespace PositionCodec {

constexpr uint32_t kMinDurationMs = 500;
constexpr uint32_t kMaxDurationMs = 600000;
constexpr uint32_t kMinIntervalMs = 100;
constexpr uint32_t kMaxIntervalMs = 60000;

// Longest canonical token is a letter plus two digits.
constexpr size_t kTokenBufLen = 4;

MatrixError decode(const char* token, const MatrixGeometry& geometry, Position& out);

// Canonical alphanumeric form, e.g. "C2". Returns false if `out` is too small.
bool encode(const Position& pos, char* out, size_t outLen);

uint16_t encodeNumeric(const Position& pos, const MatrixGeometry& geometry);

MatrixError parseDuration(const char* text, uint32_t& outMs);
MatrixError parseInterval(const char* text, uint32_t& outMs);

} // namespace PositionCodec
