#pragma once
#include "puzzlehub/grid.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/types.hpp"
#include <optional>
#include <string>

namespace puzzlehub {

struct PuzzleInstance {
  ConstraintGrid clues;
  ConstraintGrid solution;
  LockGrid locked;
};

namespace ConstraintRules {
  bool is_placement_valid(const ConstraintGrid& grid, int row, int col, int value);

  // Ascending candidate order; suited to hint / solve requests.
  std::optional<ConstraintGrid> solve(const ConstraintGrid& grid);
  // Shuffled candidate order at every cell.
  std::optional<ConstraintGrid> solve(const ConstraintGrid& grid, RandomSource& random);

  ConstraintGrid generate_solved_grid(RandomSource& random);

  int removal_count(Difficulty difficulty);

  // Zeroes removal_count(difficulty) cells in a shuffled order. The result is
  // consistent with `solution` but may admit more than one completion.
  ConstraintGrid derive_clue_grid(const ConstraintGrid& solution, Difficulty difficulty,
                                  RandomSource& random);

  // Same walk as derive_clue_grid, skipping any removal that would allow a
  // second completion. May stop short of the removal count.
  ConstraintGrid derive_unique_clue_grid(const ConstraintGrid& solution, Difficulty difficulty,
                                         RandomSource& random);

  LockGrid lock_mask(const ConstraintGrid& clues);

  PuzzleInstance make_puzzle(Difficulty difficulty, RandomSource& random, bool unique = false);

  bool validate(const ConstraintGrid& working, const ConstraintGrid& solution);
  bool is_complete(const ConstraintGrid& working, const ConstraintGrid& solution);

  std::optional<CellPos> find_hint_cell(const ConstraintGrid& working, const LockGrid& locked,
                                        const ConstraintGrid& solution);

  // No digit repeats in any row, column or region. Blanks are ignored.
  bool is_rule_valid(const ConstraintGrid& grid);
  bool is_solved_grid(const ConstraintGrid& grid);
  int filled_count(const ConstraintGrid& grid);

  // Throws InvalidInputError on any value outside 0..9.
  void validate_grid(const ConstraintGrid& grid);
  // Throws InvalidInputError unless the instance is internally consistent.
  void validate_instance(const PuzzleInstance& puzzle);

  // 81 characters, '0' or '.' for blanks. Whitespace is skipped.
  ConstraintGrid parse_grid(const std::string& text);
  std::string format_grid(const ConstraintGrid& grid);
  std::string render_grid(const ConstraintGrid& grid);
}

const char* difficulty_name(Difficulty difficulty);
std::optional<Difficulty> parse_difficulty(const std::string& text);

} // namespace puzzlehub
