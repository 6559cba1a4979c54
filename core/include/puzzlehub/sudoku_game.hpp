#pragma once
#include "puzzlehub/constraint_rules.hpp"
#include "puzzlehub/grid.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/types.hpp"
#include <cstdint>
#include <optional>

namespace puzzlehub {

enum class EntryResult : uint8_t { Locked = 0, Correct = 1, Mistake = 2 };

using NoteGrid = Grid<uint16_t, SUDOKU_N>;

constexpr int DEFAULT_HINTS = 3;

class SudokuGame {
public:
  SudokuGame();

  void new_game(Difficulty difficulty, RandomSource& random, bool unique = false);

  struct SavedState {
    PuzzleInstance puzzle;
    ConstraintGrid working;
    NoteGrid notes;
    Difficulty difficulty = Difficulty::Medium;
    int elapsed = 0;
    bool running = false;
    int mistakes = 0;
    int hints_left = DEFAULT_HINTS;
  };

  // Throws InvalidInputError when the saved puzzle is inconsistent.
  void restore(const SavedState& state);
  SavedState save() const;

  EntryResult enter(int row, int col, int value);
  bool clear(int row, int col);
  bool toggle_note(int row, int col, int value);
  bool has_note(int row, int col, int value) const;

  std::optional<CellPos> reveal_hint();
  void solve_now();

  bool validate() const;
  bool is_complete() const;

  void tick(int seconds);
  void pause() { running_ = false; }
  void resume();
  bool running() const { return running_; }

  Score score() const;

  const PuzzleInstance& puzzle() const { return puzzle_; }
  const ConstraintGrid& working() const { return working_; }
  const NoteGrid& notes() const { return notes_; }
  Difficulty difficulty() const { return difficulty_; }
  int elapsed() const { return elapsed_; }
  int mistakes() const { return mistakes_; }
  int hints_left() const { return hints_left_; }

private:
  void check_cell(int row, int col) const;
  void finish_if_complete();

  PuzzleInstance puzzle_;
  ConstraintGrid working_;
  NoteGrid notes_;
  Difficulty difficulty_ = Difficulty::Medium;
  int elapsed_ = 0;
  bool running_ = false;
  int mistakes_ = 0;
  int hints_left_ = DEFAULT_HINTS;
};

Score compute_sudoku_score(Difficulty difficulty, int elapsed_seconds, int mistakes);

} // namespace puzzlehub
