#pragma once
#include "puzzlehub/grid.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/types.hpp"

namespace puzzlehub {

struct MoveResult {
  MergeGrid grid;
  Score points_gained = 0;
  bool changed = false;
};

namespace MergeRules {
  // Slides and merges every row toward `dir`. Never spawns a tile.
  MoveResult apply_move(const MergeGrid& grid, Direction dir);

  bool has_any_legal_move(const MergeGrid& grid);

  // Places a 2 (90%) or a 4 (10%) on a uniformly chosen empty cell.
  // Returns false and leaves the grid untouched when it is full.
  bool spawn_random_tile(MergeGrid& grid, RandomSource& random);

  MergeGrid new_grid(RandomSource& random);

  // Throws InvalidInputError unless every cell is 0 or a power of two >= 2.
  void validate_grid(const MergeGrid& grid);

  int max_tile(const MergeGrid& grid);
  long long grid_sum(const MergeGrid& grid);
}

const char* direction_name(Direction dir);

} // namespace puzzlehub
