#pragma once
#include <cstdint>

namespace puzzlehub {

enum class Direction : uint8_t { Left = 0, Up = 1, Right = 2, Down = 3 };

enum class Difficulty : uint8_t { Easy = 0, Medium = 1, Hard = 2 };

using Score = int;

constexpr int MERGE_N = 4;
constexpr int SUDOKU_N = 9;
constexpr int REGION_N = 3;
constexpr int SUDOKU_CELLS = SUDOKU_N * SUDOKU_N;

constexpr Direction ALL_DIRECTIONS[4] = {
  Direction::Left, Direction::Up, Direction::Right, Direction::Down
};

struct CellPos {
  int row = -1;
  int col = -1;
};

inline bool operator==(const CellPos& a, const CellPos& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const CellPos& a, const CellPos& b) {
  return !(a == b);
}

} // namespace puzzlehub
