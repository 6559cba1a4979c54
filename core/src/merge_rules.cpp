#include "puzzlehub/merge_rules.hpp"
#include "puzzlehub/errors.hpp"
#include <string>
#include <vector>

namespace puzzlehub {

static constexpr double kTwoProbability = 0.9;

// One counter-clockwise quarter turn: the left column becomes the bottom row,
// so sliding "up" turns into sliding "left".
static MergeGrid rotate_ccw(const MergeGrid& g) {
  constexpr int N = MERGE_N;
  MergeGrid out;
  for (int r = 0; r < N; ++r) {
    for (int c = 0; c < N; ++c) {
      out.at(N - 1 - c, r) = g.at(r, c);
    }
  }
  return out;
}

static MergeGrid rotate_ccw(const MergeGrid& g, int turns) {
  MergeGrid out = g;
  for (int i = 0; i < turns; ++i) out = rotate_ccw(out);
  return out;
}

static bool is_tile_value(int v) {
  return v == 0 || (v >= 2 && (v & (v - 1)) == 0);
}

// compact, merge each pair once, pad with zeros
static Score slide_row_left(MergeGrid& g, int row) {
  int compact[MERGE_N];
  int count = 0;
  for (int c = 0; c < MERGE_N; ++c) {
    if (g.at(row, c) != 0) compact[count++] = g.at(row, c);
  }

  Score points = 0;
  int out = 0;
  for (int i = 0; i < count; ++i) {
    if (i + 1 < count && compact[i] == compact[i + 1]) {
      const int merged = compact[i] * 2;
      g.at(row, out++) = merged;
      points += merged;
      ++i; // the partner is consumed
    } else {
      g.at(row, out++) = compact[i];
    }
  }
  while (out < MERGE_N) g.at(row, out++) = 0;
  return points;
}

MoveResult MergeRules::apply_move(const MergeGrid& grid, Direction dir) {
  validate_grid(grid);

  const int turns = static_cast<int>(dir);
  MergeGrid work = rotate_ccw(grid, turns);

  MoveResult result;
  for (int r = 0; r < MERGE_N; ++r) {
    result.points_gained += slide_row_left(work, r);
  }
  result.grid = rotate_ccw(work, (4 - turns) % 4);
  result.changed = (result.grid != grid);
  return result;
}

bool MergeRules::has_any_legal_move(const MergeGrid& grid) {
  validate_grid(grid);
  for (int r = 0; r < MERGE_N; ++r) {
    for (int c = 0; c < MERGE_N; ++c) {
      const int v = grid.at(r, c);
      if (v == 0) return true;
      if (c + 1 < MERGE_N && v == grid.at(r, c + 1)) return true;
      if (r + 1 < MERGE_N && v == grid.at(r + 1, c)) return true;
    }
  }
  return false;
}

bool MergeRules::spawn_random_tile(MergeGrid& grid, RandomSource& random) {
  validate_grid(grid);

  std::vector<int> empties;
  empties.reserve(MERGE_N * MERGE_N);
  for (int i = 0; i < MERGE_N * MERGE_N; ++i) {
    if (grid[i] == 0) empties.push_back(i);
  }
  if (empties.empty()) return false;

  const int pick = empties[random.next_index(static_cast<int>(empties.size()))];
  grid[pick] = (random.next_unit() < kTwoProbability) ? 2 : 4;
  return true;
}

MergeGrid MergeRules::new_grid(RandomSource& random) {
  MergeGrid g;
  spawn_random_tile(g, random);
  spawn_random_tile(g, random);
  return g;
}

void MergeRules::validate_grid(const MergeGrid& grid) {
  for (int r = 0; r < MERGE_N; ++r) {
    for (int c = 0; c < MERGE_N; ++c) {
      const int v = grid.at(r, c);
      if (!is_tile_value(v)) {
        throw InvalidInputError("Invalid merge tile " + std::to_string(v) + " at (" +
                                std::to_string(r) + "," + std::to_string(c) + ")");
      }
    }
  }
}

int MergeRules::max_tile(const MergeGrid& grid) {
  int best = 0;
  for (int v : grid) {
    if (v > best) best = v;
  }
  return best;
}

long long MergeRules::grid_sum(const MergeGrid& grid) {
  long long sum = 0;
  for (int v : grid) sum += v;
  return sum;
}

const char* direction_name(Direction dir) {
  switch (dir) {
    case Direction::Left:  return "left";
    case Direction::Up:    return "up";
    case Direction::Right: return "right";
    case Direction::Down:  return "down";
  }
  return "?";
}

} // namespace puzzlehub
