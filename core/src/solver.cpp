#include "puzzlehub/solver.hpp"
#include "puzzlehub/constraint_rules.hpp"

namespace puzzlehub {

Solver::Solver() : random_(nullptr) {
  stats_.reset();
}

Solver::Solver(RandomSource& random) : random_(&random) {
  stats_.reset();
}

bool Solver::load(const ConstraintGrid& grid) {
  ConstraintRules::validate_grid(grid);
  stats_.reset();
  buffer_ = grid;
  // the search only checks new placements, so conflicting givens must be
  // rejected up front
  return ConstraintRules::is_rule_valid(buffer_);
}

bool Solver::next_empty(int& row, int& col) const {
  for (int r = 0; r < SUDOKU_N; ++r) {
    for (int c = 0; c < SUDOKU_N; ++c) {
      if (buffer_.at(r, c) == 0) {
        row = r;
        col = c;
        return true;
      }
    }
  }
  return false;
}

void Solver::candidate_order(int (&out)[9]) {
  for (int i = 0; i < 9; ++i) out[i] = i + 1;
  if (!random_) return;
  for (int i = 8; i > 0; --i) {
    const int j = random_->next_index(i + 1);
    const int tmp = out[i];
    out[i] = out[j];
    out[j] = tmp;
  }
}

bool Solver::search(int depth) {
  ++stats_.nodes;
  if (depth > stats_.max_depth) stats_.max_depth = depth;

  int row = 0;
  int col = 0;
  if (!next_empty(row, col)) {
    return true;
  }

  int order[9];
  candidate_order(order);
  for (int value : order) {
    if (!ConstraintRules::is_placement_valid(buffer_, row, col, value)) continue;
    buffer_.at(row, col) = value;
    if (search(depth + 1)) {
      return true;
    }
    buffer_.at(row, col) = 0;
    ++stats_.backtracks;
  }
  return false;
}

void Solver::count(int depth, int limit, int& found) {
  ++stats_.nodes;
  if (depth > stats_.max_depth) stats_.max_depth = depth;

  int row = 0;
  int col = 0;
  if (!next_empty(row, col)) {
    ++found;
    return;
  }

  int order[9];
  candidate_order(order);
  for (int value : order) {
    if (found >= limit) break;
    if (!ConstraintRules::is_placement_valid(buffer_, row, col, value)) continue;
    buffer_.at(row, col) = value;
    count(depth + 1, limit, found);
    buffer_.at(row, col) = 0;
  }
}

std::optional<ConstraintGrid> Solver::solve(const ConstraintGrid& grid) {
  if (!load(grid)) {
    return std::nullopt;
  }
  if (!search(0)) {
    return std::nullopt;
  }
  return buffer_;
}

int Solver::count_solutions(const ConstraintGrid& grid, int limit) {
  if (limit <= 0 || !load(grid)) {
    return 0;
  }
  int found = 0;
  count(0, limit, found);
  return found;
}

} // namespace puzzlehub
