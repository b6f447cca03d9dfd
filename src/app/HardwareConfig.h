#pragma once

#include <stddef.h>
#include <stdint.h>

namespace HwCfg {

constexpr uint8_t PIN_UNUSED = 255;

constexpr uint32_t CONSOLE_BAUD = 115200;

// ============================
// Output matrix (relay / LED bank)
// ============================
// Cell (r, c) is energised by driving OUT_ROW_PINS[r] and OUT_COL_PINS[c]
// to OUT_ACTIVE_LEVEL together.
constexpr uint8_t OUT_ROW_PINS[] = {25, 26, 27};
constexpr uint8_t OUT_COL_PINS[] = {32, 33, 13};
constexpr const char* OUT_ACTIVE_LEVEL = "HIGH";

// ============================
// Input matrix (reed switches / keypad)
// ============================
// Rows are sensed, columns are driven one at a time. GPIO 34-39 are input
// only and have no internal pulls on ESP32; keep rows off them when
// IN_PULL_MODE relies on the internal resistor.
constexpr uint8_t IN_ROW_PINS[] = {16, 17, 18};
constexpr uint8_t IN_COL_PINS[] = {19, 21, 22};
constexpr const char* IN_PULL_MODE = "UP";
constexpr const char* IN_CLOSED_STATE = "LOW";

constexpr size_t OUT_ROWS = sizeof(OUT_ROW_PINS) / sizeof(OUT_ROW_PINS[0]);
constexpr size_t OUT_COLS = sizeof(OUT_COL_PINS) / sizeof(OUT_COL_PINS[0]);
constexpr size_t IN_ROWS = sizeof(IN_ROW_PINS) / sizeof(IN_ROW_PINS[0]);
constexpr size_t IN_COLS = sizeof(IN_COL_PINS) / sizeof(IN_COL_PINS[0]);

} // namespace HwCfg
