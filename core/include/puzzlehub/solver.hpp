#pragma once
#include "puzzlehub/grid.hpp"
#include "puzzlehub/random_source.hpp"
#include <cstdint>
#include <optional>

namespace puzzlehub {

/**
 * Backtracking solver for the 9x9 constraint grid.
 *
 * The whole search runs on one owned buffer: a candidate is written into the
 * first unfilled cell (row-major), the search recurses, and the cell is reset
 * to 0 before the next candidate is tried. Recursion depth is bounded by the
 * number of unfilled cells.
 *
 * Without a RandomSource candidates are tried in ascending order. With one, a
 * fresh permutation of 1..9 is drawn at every cell.
 */
class Solver {
public:
  Solver();
  explicit Solver(RandomSource& random);

  // Completion of `grid`, or nullopt when no completion exists (including
  // givens that already conflict). Throws InvalidInputError on values
  // outside 0..9.
  std::optional<ConstraintGrid> solve(const ConstraintGrid& grid);

  // Number of completions of `grid`, stopping once `limit` is reached.
  int count_solutions(const ConstraintGrid& grid, int limit);

  struct Stats {
    int64_t nodes;
    int64_t backtracks;
    int max_depth;

    void reset() {
      nodes = 0;
      backtracks = 0;
      max_depth = 0;
    }
  };

  const Stats& stats() const { return stats_; }

private:
  bool load(const ConstraintGrid& grid);
  bool search(int depth);
  void count(int depth, int limit, int& found);
  bool next_empty(int& row, int& col) const;
  void candidate_order(int (&out)[9]);

  ConstraintGrid buffer_;
  RandomSource* random_;
  Stats stats_;
};

} // namespace puzzlehub
