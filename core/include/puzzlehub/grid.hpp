#pragma once
#include "puzzlehub/types.hpp"
#include <array>
#include <cstddef>

namespace puzzlehub {

// Square board stored row-major.
template <class T, int N>
class Grid {
public:
  static constexpr int SIZE = N;

  Grid() { fill(T{}); }

  int size() const { return N; }

  bool in_bounds(int row, int col) const {
    return row >= 0 && row < N && col >= 0 && col < N;
  }

  T& at(int row, int col) { return cells_[row * N + col]; }
  const T& at(int row, int col) const { return cells_[row * N + col]; }

  T& operator[](std::size_t idx) { return cells_[idx]; }
  const T& operator[](std::size_t idx) const { return cells_[idx]; }

  void fill(const T& value) { cells_.fill(value); }

  typename std::array<T, N * N>::iterator begin() { return cells_.begin(); }
  typename std::array<T, N * N>::iterator end() { return cells_.end(); }
  typename std::array<T, N * N>::const_iterator begin() const { return cells_.begin(); }
  typename std::array<T, N * N>::const_iterator end() const { return cells_.end(); }

  bool operator==(const Grid& other) const { return cells_ == other.cells_; }
  bool operator!=(const Grid& other) const { return cells_ != other.cells_; }

private:
  std::array<T, N * N> cells_;
};

using MergeGrid = Grid<int, MERGE_N>;
using ConstraintGrid = Grid<int, SUDOKU_N>;
using LockGrid = Grid<bool, SUDOKU_N>;

} // namespace puzzlehub
