#include "puzzlehub/sudoku_game.hpp"
#include "puzzlehub/errors.hpp"
#include <algorithm>
#include <string>

namespace puzzlehub {

static constexpr int kBaseEasy = 1200;
static constexpr int kBaseMedium = 1500;
static constexpr int kBaseHard = 2000;
static constexpr int kSecondsPerPoint = 5;
static constexpr int kMistakePenalty = 50;

Score compute_sudoku_score(Difficulty difficulty, int elapsed_seconds, int mistakes) {
  int base = kBaseMedium;
  if (difficulty == Difficulty::Easy) base = kBaseEasy;
  if (difficulty == Difficulty::Hard) base = kBaseHard;
  const int time_penalty = elapsed_seconds / kSecondsPerPoint;
  const int mistake_penalty = mistakes * kMistakePenalty;
  return std::max(0, base - time_penalty - mistake_penalty);
}

SudokuGame::SudokuGame() {
  notes_.fill(0);
}

void SudokuGame::new_game(Difficulty difficulty, RandomSource& random, bool unique) {
  puzzle_ = ConstraintRules::make_puzzle(difficulty, random, unique);
  working_ = puzzle_.clues;
  notes_.fill(0);
  difficulty_ = difficulty;
  elapsed_ = 0;
  running_ = true;
  mistakes_ = 0;
  hints_left_ = DEFAULT_HINTS;
}

void SudokuGame::restore(const SavedState& state) {
  ConstraintRules::validate_instance(state.puzzle);
  ConstraintRules::validate_grid(state.working);
  for (int i = 0; i < SUDOKU_CELLS; ++i) {
    if (state.puzzle.locked[i] && state.working[i] != state.puzzle.clues[i]) {
      throw InvalidInputError("Working grid overwrites clue at index " + std::to_string(i));
    }
    if (state.notes[i] & ~0x1FFu) {
      throw InvalidInputError("Note mask out of range at index " + std::to_string(i));
    }
  }
  if (state.elapsed < 0 || state.mistakes < 0 || state.hints_left < 0) {
    throw InvalidInputError("Negative counters in saved sudoku state");
  }

  puzzle_ = state.puzzle;
  working_ = state.working;
  notes_ = state.notes;
  difficulty_ = state.difficulty;
  elapsed_ = state.elapsed;
  running_ = state.running && !is_complete();
  mistakes_ = state.mistakes;
  hints_left_ = state.hints_left;
}

SudokuGame::SavedState SudokuGame::save() const {
  SavedState state;
  state.puzzle = puzzle_;
  state.working = working_;
  state.notes = notes_;
  state.difficulty = difficulty_;
  state.elapsed = elapsed_;
  state.running = running_;
  state.mistakes = mistakes_;
  state.hints_left = hints_left_;
  return state;
}

void SudokuGame::check_cell(int row, int col) const {
  if (!working_.in_bounds(row, col)) {
    throw InvalidInputError("Cell (" + std::to_string(row) + "," + std::to_string(col) +
                            ") is outside the 9x9 grid");
  }
}

static void check_digit(int value) {
  if (value < 1 || value > 9) {
    throw InvalidInputError("Digit must be in 1..9, got " + std::to_string(value));
  }
}

EntryResult SudokuGame::enter(int row, int col, int value) {
  check_cell(row, col);
  check_digit(value);
  if (puzzle_.locked.at(row, col)) return EntryResult::Locked;

  working_.at(row, col) = value;
  if (value != puzzle_.solution.at(row, col)) {
    ++mistakes_;
    return EntryResult::Mistake;
  }
  finish_if_complete();
  return EntryResult::Correct;
}

bool SudokuGame::clear(int row, int col) {
  check_cell(row, col);
  if (puzzle_.locked.at(row, col)) return false;
  working_.at(row, col) = 0;
  notes_.at(row, col) = 0;
  return true;
}

bool SudokuGame::toggle_note(int row, int col, int value) {
  check_cell(row, col);
  check_digit(value);
  if (puzzle_.locked.at(row, col)) return false;
  notes_.at(row, col) ^= static_cast<uint16_t>(1u << (value - 1));
  return true;
}

bool SudokuGame::has_note(int row, int col, int value) const {
  check_cell(row, col);
  check_digit(value);
  return (notes_.at(row, col) >> (value - 1)) & 1u;
}

std::optional<CellPos> SudokuGame::reveal_hint() {
  if (hints_left_ <= 0) return std::nullopt;
  auto cell = ConstraintRules::find_hint_cell(working_, puzzle_.locked, puzzle_.solution);
  if (!cell) return std::nullopt;

  working_.at(cell->row, cell->col) = puzzle_.solution.at(cell->row, cell->col);
  --hints_left_;
  // a revealed cell costs the same as a wrong entry
  ++mistakes_;
  finish_if_complete();
  return cell;
}

void SudokuGame::solve_now() {
  working_ = puzzle_.solution;
  running_ = false;
}

bool SudokuGame::validate() const {
  return ConstraintRules::validate(working_, puzzle_.solution);
}

bool SudokuGame::is_complete() const {
  return ConstraintRules::is_complete(working_, puzzle_.solution);
}

void SudokuGame::finish_if_complete() {
  if (is_complete()) running_ = false;
}

void SudokuGame::tick(int seconds) {
  if (running_ && seconds > 0) elapsed_ += seconds;
}

void SudokuGame::resume() {
  if (!is_complete()) running_ = true;
}

Score SudokuGame::score() const {
  return compute_sudoku_score(difficulty_, elapsed_, mistakes_);
}

} // namespace puzzlehub
