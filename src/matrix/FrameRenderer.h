#pragma once

#include <stddef.h>

#include "matrix/MatrixTypes.h"

namespace FrameRenderer {

constexpr size_t kJsonBufLen = 2048;
constexpr size_t kGridBufLen = 1536;

// {"matrix":[["on","off",...],...]} rows outer, one line.
bool renderJson(const InputFrame& frame, char* out, size_t outLen);

//     A   B   C
// 1  [X] [ ] [ ]
bool renderGrid(const InputFrame& frame, char* out, size_t outLen);

} // namespace FrameRenderer
