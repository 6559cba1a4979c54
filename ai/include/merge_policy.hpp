#pragma once
#include "puzzlehub/grid.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/types.hpp"
#include <optional>
#include <vector>

namespace puzzlehub_ai {

// Directions that change the board, in Left, Up, Right, Down order.
std::vector<puzzlehub::Direction> changing_directions(const puzzlehub::MergeGrid& grid);

// Uniform pick among the directions that change the board.
class RandomMergePolicy {
public:
  explicit RandomMergePolicy(puzzlehub::RandomSource& random);
  std::optional<puzzlehub::Direction> pick(const puzzlehub::MergeGrid& grid);

private:
  puzzlehub::RandomSource& random_;
};

// Highest immediate points; ties broken uniformly.
class GreedyMergePolicy {
public:
  explicit GreedyMergePolicy(puzzlehub::RandomSource& random);
  std::optional<puzzlehub::Direction> pick(const puzzlehub::MergeGrid& grid);

private:
  puzzlehub::RandomSource& random_;
};

} // namespace puzzlehub_ai
