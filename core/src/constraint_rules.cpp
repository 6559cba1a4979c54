#include "puzzlehub/constraint_rules.hpp"
#include "puzzlehub/errors.hpp"
#include "puzzlehub/solver.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace puzzlehub {

static constexpr int kRemoveEasy = 36;
static constexpr int kRemoveMedium = 46;
static constexpr int kRemoveHard = 54;

static void check_coords(int row, int col) {
  if (row < 0 || row >= SUDOKU_N || col < 0 || col >= SUDOKU_N) {
    throw InvalidInputError("Cell (" + std::to_string(row) + "," + std::to_string(col) +
                            ") is outside the 9x9 grid");
  }
}

bool ConstraintRules::is_placement_valid(const ConstraintGrid& grid, int row, int col, int value) {
  check_coords(row, col);
  if (value < 1 || value > 9) {
    throw InvalidInputError("Digit must be in 1..9, got " + std::to_string(value));
  }

  for (int i = 0; i < SUDOKU_N; ++i) {
    if (grid.at(row, i) == value) return false;
    if (grid.at(i, col) == value) return false;
  }
  const int br = (row / REGION_N) * REGION_N;
  const int bc = (col / REGION_N) * REGION_N;
  for (int r = br; r < br + REGION_N; ++r) {
    for (int c = bc; c < bc + REGION_N; ++c) {
      if (grid.at(r, c) == value) return false;
    }
  }
  return true;
}

std::optional<ConstraintGrid> ConstraintRules::solve(const ConstraintGrid& grid) {
  Solver solver;
  return solver.solve(grid);
}

std::optional<ConstraintGrid> ConstraintRules::solve(const ConstraintGrid& grid, RandomSource& random) {
  Solver solver(random);
  return solver.solve(grid);
}

ConstraintGrid ConstraintRules::generate_solved_grid(RandomSource& random) {
  auto solved = solve(ConstraintGrid(), random);
  if (!solved) {
    // every empty 9x9 grid has a completion
    throw std::logic_error("Backtracking failed on an empty grid");
  }
  return *solved;
}

int ConstraintRules::removal_count(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:   return kRemoveEasy;
    case Difficulty::Medium: return kRemoveMedium;
    case Difficulty::Hard:   return kRemoveHard;
  }
  return kRemoveMedium;
}

static std::vector<CellPos> shuffled_cells(RandomSource& random) {
  std::vector<CellPos> cells;
  cells.reserve(SUDOKU_CELLS);
  for (int r = 0; r < SUDOKU_N; ++r) {
    for (int c = 0; c < SUDOKU_N; ++c) {
      cells.push_back(CellPos{r, c});
    }
  }
  shuffle_in_place(cells, random);
  return cells;
}

ConstraintGrid ConstraintRules::derive_clue_grid(const ConstraintGrid& solution, Difficulty difficulty,
                                                 RandomSource& random) {
  validate_grid(solution);
  ConstraintGrid clues = solution;
  const int target = removal_count(difficulty);
  int removed = 0;
  for (const CellPos& p : shuffled_cells(random)) {
    if (removed >= target) break;
    clues.at(p.row, p.col) = 0;
    ++removed;
  }
  return clues;
}

ConstraintGrid ConstraintRules::derive_unique_clue_grid(const ConstraintGrid& solution,
                                                        Difficulty difficulty, RandomSource& random) {
  validate_grid(solution);
  ConstraintGrid clues = solution;
  const int target = removal_count(difficulty);
  int removed = 0;
  Solver counter;
  for (const CellPos& p : shuffled_cells(random)) {
    if (removed >= target) break;
    const int backup = clues.at(p.row, p.col);
    clues.at(p.row, p.col) = 0;
    if (counter.count_solutions(clues, 2) != 1) {
      clues.at(p.row, p.col) = backup;
      continue;
    }
    ++removed;
  }
  return clues;
}

LockGrid ConstraintRules::lock_mask(const ConstraintGrid& clues) {
  LockGrid locked;
  for (int i = 0; i < SUDOKU_CELLS; ++i) {
    locked[i] = (clues[i] != 0);
  }
  return locked;
}

PuzzleInstance ConstraintRules::make_puzzle(Difficulty difficulty, RandomSource& random, bool unique) {
  PuzzleInstance puzzle;
  puzzle.solution = generate_solved_grid(random);
  puzzle.clues = unique ? derive_unique_clue_grid(puzzle.solution, difficulty, random)
                        : derive_clue_grid(puzzle.solution, difficulty, random);
  puzzle.locked = lock_mask(puzzle.clues);
  return puzzle;
}

bool ConstraintRules::validate(const ConstraintGrid& working, const ConstraintGrid& solution) {
  validate_grid(working);
  validate_grid(solution);
  for (int i = 0; i < SUDOKU_CELLS; ++i) {
    if (working[i] != 0 && working[i] != solution[i]) return false;
  }
  return true;
}

bool ConstraintRules::is_complete(const ConstraintGrid& working, const ConstraintGrid& solution) {
  validate_grid(working);
  validate_grid(solution);
  return working == solution;
}

std::optional<CellPos> ConstraintRules::find_hint_cell(const ConstraintGrid& working, const LockGrid& locked,
                                                       const ConstraintGrid& solution) {
  validate_grid(working);
  validate_grid(solution);
  for (int r = 0; r < SUDOKU_N; ++r) {
    for (int c = 0; c < SUDOKU_N; ++c) {
      if (locked.at(r, c)) continue;
      if (working.at(r, c) != solution.at(r, c)) return CellPos{r, c};
    }
  }
  return std::nullopt;
}

bool ConstraintRules::is_rule_valid(const ConstraintGrid& grid) {
  validate_grid(grid);
  // bit (d-1) set once digit d has been seen in the unit
  uint16_t rows[SUDOKU_N] = {};
  uint16_t cols[SUDOKU_N] = {};
  uint16_t boxes[SUDOKU_N] = {};
  for (int r = 0; r < SUDOKU_N; ++r) {
    for (int c = 0; c < SUDOKU_N; ++c) {
      const int v = grid.at(r, c);
      if (v == 0) continue;
      const uint16_t bit = static_cast<uint16_t>(1u << (v - 1));
      const int b = (r / REGION_N) * REGION_N + (c / REGION_N);
      if ((rows[r] & bit) || (cols[c] & bit) || (boxes[b] & bit)) return false;
      rows[r] |= bit;
      cols[c] |= bit;
      boxes[b] |= bit;
    }
  }
  return true;
}

bool ConstraintRules::is_solved_grid(const ConstraintGrid& grid) {
  return filled_count(grid) == SUDOKU_CELLS && is_rule_valid(grid);
}

int ConstraintRules::filled_count(const ConstraintGrid& grid) {
  return static_cast<int>(std::count_if(grid.begin(), grid.end(), [](int v) { return v != 0; }));
}

void ConstraintRules::validate_grid(const ConstraintGrid& grid) {
  for (int i = 0; i < SUDOKU_CELLS; ++i) {
    if (grid[i] < 0 || grid[i] > 9) {
      throw InvalidInputError("Invalid cell value " + std::to_string(grid[i]) + " at (" +
                              std::to_string(i / SUDOKU_N) + "," + std::to_string(i % SUDOKU_N) + ")");
    }
  }
}

void ConstraintRules::validate_instance(const PuzzleInstance& puzzle) {
  validate_grid(puzzle.clues);
  if (!is_solved_grid(puzzle.solution)) {
    throw InvalidInputError("Puzzle solution is not a complete valid grid");
  }
  if (!validate(puzzle.clues, puzzle.solution)) {
    throw InvalidInputError("Puzzle clues disagree with the solution");
  }
  if (puzzle.locked != lock_mask(puzzle.clues)) {
    throw InvalidInputError("Locked cells do not match the clues");
  }
}

ConstraintGrid ConstraintRules::parse_grid(const std::string& text) {
  ConstraintGrid grid;
  int idx = 0;
  for (char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch))) continue;
    if (idx >= SUDOKU_CELLS) {
      throw InvalidInputError("Grid text has more than 81 cells");
    }
    if (ch == '.') {
      grid[idx++] = 0;
    } else if (ch >= '0' && ch <= '9') {
      grid[idx++] = ch - '0';
    } else {
      throw InvalidInputError(std::string("Invalid grid character '") + ch + "'");
    }
  }
  if (idx != SUDOKU_CELLS) {
    throw InvalidInputError("Expected 81 cells, got " + std::to_string(idx));
  }
  return grid;
}

std::string ConstraintRules::format_grid(const ConstraintGrid& grid) {
  std::string out;
  out.reserve(SUDOKU_CELLS);
  for (int v : grid) out.push_back(static_cast<char>('0' + v));
  return out;
}

std::string ConstraintRules::render_grid(const ConstraintGrid& grid) {
  std::ostringstream oss;
  for (int r = 0; r < SUDOKU_N; ++r) {
    if (r > 0 && r % 3 == 0) oss << "------+-------+------\n";
    for (int c = 0; c < SUDOKU_N; ++c) {
      if (c > 0 && c % 3 == 0) oss << "| ";
      const int v = grid.at(r, c);
      oss << (v == 0 ? '.' : static_cast<char>('0' + v)) << ' ';
    }
    oss << '\n';
  }
  return oss.str();
}

const char* difficulty_name(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:   return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard:   return "hard";
  }
  return "medium";
}

std::optional<Difficulty> parse_difficulty(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  if (lowered == "easy") return Difficulty::Easy;
  if (lowered == "medium") return Difficulty::Medium;
  if (lowered == "hard") return Difficulty::Hard;
  return std::nullopt;
}

} // namespace puzzlehub
