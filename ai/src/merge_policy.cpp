#include "merge_policy.hpp"
#include "puzzlehub/merge_rules.hpp"

namespace puzzlehub_ai {

using puzzlehub::Direction;
using puzzlehub::MergeGrid;
using puzzlehub::MergeRules::apply_move;

std::vector<Direction> changing_directions(const MergeGrid& grid) {
  std::vector<Direction> dirs;
  for (Direction d : puzzlehub::ALL_DIRECTIONS) {
    if (apply_move(grid, d).changed) dirs.push_back(d);
  }
  return dirs;
}

RandomMergePolicy::RandomMergePolicy(puzzlehub::RandomSource& random)
  : random_(random) {
}

std::optional<Direction> RandomMergePolicy::pick(const MergeGrid& grid) {
  const auto dirs = changing_directions(grid);
  if (dirs.empty()) {
    return std::nullopt; // No legal move
  }
  return dirs[random_.next_index(static_cast<int>(dirs.size()))];
}

GreedyMergePolicy::GreedyMergePolicy(puzzlehub::RandomSource& random)
  : random_(random) {
}

std::optional<Direction> GreedyMergePolicy::pick(const MergeGrid& grid) {
  std::vector<Direction> best;
  int best_points = -1;
  for (Direction d : puzzlehub::ALL_DIRECTIONS) {
    const auto result = apply_move(grid, d);
    if (!result.changed) continue;
    if (result.points_gained > best_points) {
      best_points = result.points_gained;
      best.clear();
    }
    if (result.points_gained == best_points) best.push_back(d);
  }
  if (best.empty()) {
    return std::nullopt;
  }
  return best[random_.next_index(static_cast<int>(best.size()))];
}

} // namespace puzzlehub_ai
