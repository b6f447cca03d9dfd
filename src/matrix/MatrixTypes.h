#pragma once

#include <stdint.h>

constexpr uint8_t kMaxMatrixRows = 16;
constexpr uint8_t kMaxMatrixCols = 16;

enum class PinLevel : uint8_t { low = 0, high = 1 };
enum class PinDirection : uint8_t { output, input };
enum class PullMode : uint8_t { none, up, down };

static inline PinLevel opposite(PinLevel lv) {
  return lv == PinLevel::high ? PinLevel::low : PinLevel::high;
}

static inline const char* toString(PinLevel lv) {
  switch (lv) {
    case PinLevel::low:  return "LOW";
    case PinLevel::high: return "HIGH";
    default:             return "unknown";
  }
}

static inline const char* toString(PullMode p) {
  switch (p) {
    case PullMode::none: return "NONE";
    case PullMode::up:   return "UP";
    case PullMode::down: return "DOWN";
    default:             return "unknown";
  }
}

struct MatrixGeometry {
  uint8_t rows = 0;
  uint8_t cols = 0;

  MatrixGeometry() = default;
  constexpr MatrixGeometry(uint8_t r, uint8_t c) : rows(r), cols(c) {}

  bool valid() const {
    return rows > 0 && cols > 0 && rows <= kMaxMatrixRows && cols <= kMaxMatrixCols;
  }
  uint16_t cells() const { return (uint16_t)rows * cols; }
};

struct Position {
  uint8_t row = 0;
  uint8_t col = 0;

  Position() = default;
  constexpr Position(uint8_t r, uint8_t c) : row(r), col(c) {}

  bool within(const MatrixGeometry& g) const { return row < g.rows && col < g.cols; }
};

static inline bool operator==(const Position& a, const Position& b) {
  return a.row == b.row && a.col == b.col;
}

static inline bool operator!=(const Position& a, const Position& b) {
  return !(a == b);
}

// Row-major snapshot of one full scan. true = switch closed.
class InputFrame {
public:
  InputFrame() = default;
  explicit InputFrame(const MatrixGeometry& g) : geometry_(g) {}

  const MatrixGeometry& geometry() const { return geometry_; }

  bool at(uint8_t row, uint8_t col) const { return cells_[row][col]; }
  void set(uint8_t row, uint8_t col, bool closed) { cells_[row][col] = closed; }

  uint16_t closedCount() const {
    uint16_t n = 0;
    for (uint8_t r = 0; r < geometry_.rows; ++r) {
      for (uint8_t c = 0; c < geometry_.cols; ++c) {
        if (cells_[r][c]) ++n;
      }
    }
    return n;
  }

  // Number of cells that differ; frames of different shape differ everywhere.
  uint16_t diff(const InputFrame& other) const {
    if (geometry_.rows != other.geometry_.rows || geometry_.cols != other.geometry_.cols) {
      return geometry_.cells();
    }
    uint16_t n = 0;
    for (uint8_t r = 0; r < geometry_.rows; ++r) {
      for (uint8_t c = 0; c < geometry_.cols; ++c) {
        if (cells_[r][c] != other.cells_[r][c]) ++n;
      }
    }
    return n;
  }

private:
  MatrixGeometry geometry_{};
  bool cells_[kMaxMatrixRows][kMaxMatrixCols]{};
};
