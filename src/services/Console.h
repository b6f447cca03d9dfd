#pragma once

#include <Arduino.h>

#include "matrix/MatrixError.h"

// Result lines for console commands. One per command:
//   OK <detail>
//   ERR <code> <kind>: <detail>
namespace Console {

void ok(const char* fmt, ...);
void error(MatrixError e, const char* fmt, ...);

} // namespace Console
