#include <iostream>
#include <optional>
#include <string>
#include "puzzlehub/constraint_rules.hpp"
#include "puzzlehub/errors.hpp"
#include "puzzlehub/merge_game.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/sudoku_game.hpp"

using namespace puzzlehub;

static int failures = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "[SUCCESS] " << what << std::endl;
    } else {
        std::cout << "[FAILED] " << what << std::endl;
        ++failures;
    }
}

static MergeGrid grid_from_rows(const int (&rows)[4][4]) {
    MergeGrid g;
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            g.at(r, c) = rows[r][c];
        }
    }
    return g;
}

static std::optional<CellPos> first_unlocked(const SudokuGame& game) {
    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 9; ++c) {
            if (!game.puzzle().locked.at(r, c)) return CellPos{r, c};
        }
    }
    return std::nullopt;
}

static std::optional<CellPos> first_locked(const SudokuGame& game) {
    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 9; ++c) {
            if (game.puzzle().locked.at(r, c)) return CellPos{r, c};
        }
    }
    return std::nullopt;
}

static void test_merge_game() {
    std::cout << "=== MergeGame ===" << std::endl;

    ScriptedSource first_cells({0}, {0.0});
    MergeGame fresh(first_cells);
    check(MergeRules::grid_sum(fresh.board()) == 4 && fresh.score() == 0, "new game starts with two 2s");
    check(!fresh.can_undo() && !fresh.game_over(), "nothing to undo at start");

    const int rows[4][4] = {{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}};
    MergeGame game;
    game.restore(grid_from_rows(rows), 10, 5);
    check(game.score() == 10 && game.best_score() == 10, "best score is never below score");

    const MergeGrid before = game.board();
    check(game.move(Direction::Left, first_cells), "left merges the pair");
    check(game.board().at(0, 0) == 4 && game.board().at(0, 1) == 2, "merged tile plus spawned 2");
    check(game.score() == 14 && game.best_score() == 14, "score and best updated");
    check(game.moves() == 1 && game.can_undo(), "move counted and undo available");

    check(game.undo(), "undo succeeds");
    check(game.board() == before && game.score() == 10, "undo restores board and score");
    check(game.best_score() == 14, "undo keeps the best score");
    check(!game.undo(), "only one step of undo");

    const int lone[4][4] = {{2, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}};
    game.restore(grid_from_rows(lone), 0, 14);
    ScriptedSource counter({0}, {0.0});
    check(!game.move(Direction::Left, counter), "move without change is ignored");
    check(game.moves() == 0 && counter.index_calls() == 0, "ignored move spawns nothing");
    check(game.move(Direction::Right, counter) && game.board().at(0, 3) == 2, "right slides the lone tile");

    const int blocked[4][4] = {{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, 2, 4}, {4, 2, 4, 2}};
    game.restore(grid_from_rows(blocked), 100, 200);
    check(game.game_over(), "blocked board is game over");
    check(!game.move(Direction::Up, counter), "no moves after game over");

    game.restart(first_cells);
    check(game.score() == 0 && game.best_score() == 200 && !game.game_over(), "restart keeps the best score");
    game.reset_best(first_cells);
    check(game.best_score() == 0, "reset_best clears it");

    MergeGrid bad;
    bad.at(0, 0) = 6;
    bool threw = false;
    try {
        game.restore(bad, 0, 0);
    } catch (const InvalidInputError&) {
        threw = true;
    }
    check(threw, "restore rejects a non power of two");
}

static void test_sudoku_game() {
    std::cout << "\n=== SudokuGame ===" << std::endl;

    check(compute_sudoku_score(Difficulty::Easy, 0, 0) == 1200, "easy base score");
    check(compute_sudoku_score(Difficulty::Medium, 100, 2) == 1500 - 20 - 100, "time and mistake penalties");
    check(compute_sudoku_score(Difficulty::Hard, 20000, 0) == 0, "score floors at zero");

    Mt19937Source random(11);
    SudokuGame game;
    game.new_game(Difficulty::Easy, random);
    const auto& puzzle = game.puzzle();
    check(game.working() == puzzle.clues, "working grid starts from the clues");
    check(ConstraintRules::filled_count(puzzle.clues) == 81 - 36, "easy puzzle has 45 clues");
    check(game.running() && game.hints_left() == DEFAULT_HINTS, "clock running, three hints");

    const auto open = first_unlocked(game);
    const auto fixed = first_locked(game);
    check(open.has_value() && fixed.has_value(), "puzzle has both kinds of cells");
    if (!open || !fixed) return;

    const int answer = puzzle.solution.at(open->row, open->col);
    const int wrong = answer % 9 + 1;
    check(game.enter(open->row, open->col, wrong) == EntryResult::Mistake, "wrong digit is a mistake");
    check(game.working().at(open->row, open->col) == wrong && game.mistakes() == 1, "wrong digit stays on the board");
    check(!game.validate(), "board no longer validates");
    check(game.enter(open->row, open->col, answer) == EntryResult::Correct, "correct digit accepted");
    check(game.validate() && game.mistakes() == 1, "board validates again, mistakes kept");

    const int clue = puzzle.clues.at(fixed->row, fixed->col);
    check(game.enter(fixed->row, fixed->col, clue % 9 + 1) == EntryResult::Locked, "clue cells are locked");
    check(game.working().at(fixed->row, fixed->col) == clue, "clue unchanged");
    check(!game.clear(fixed->row, fixed->col), "clue cells cannot be cleared");

    check(game.toggle_note(open->row, open->col, 4) && game.has_note(open->row, open->col, 4), "note set");
    check(game.toggle_note(open->row, open->col, 4) && !game.has_note(open->row, open->col, 4), "note toggled off");
    check(!game.toggle_note(fixed->row, fixed->col, 4), "no notes on clues");
    game.toggle_note(open->row, open->col, 7);
    check(game.clear(open->row, open->col), "clear an open cell");
    check(game.working().at(open->row, open->col) == 0 && game.notes().at(open->row, open->col) == 0,
          "clear wipes digit and notes");

    game.tick(30);
    game.pause();
    game.tick(30);
    check(game.elapsed() == 30, "paused clock does not advance");
    game.resume();

    const auto hint = game.reveal_hint();
    check(hint.has_value(), "hint revealed");
    if (hint) {
        check(game.working().at(hint->row, hint->col) == puzzle.solution.at(hint->row, hint->col),
              "hint cell holds the solution digit");
    }
    check(game.hints_left() == 2 && game.mistakes() == 2, "hint costs one hint and one mistake");
    game.reveal_hint();
    game.reveal_hint();
    check(game.hints_left() == 0 && !game.reveal_hint(), "no fourth hint");

    const SudokuGame::SavedState saved = game.save();
    SudokuGame copy;
    copy.restore(saved);
    check(copy.working() == game.working() && copy.mistakes() == game.mistakes() &&
              copy.elapsed() == game.elapsed(),
          "save and restore keep the session");

    SudokuGame::SavedState tampered = saved;
    tampered.working.at(fixed->row, fixed->col) = 0;
    bool threw = false;
    try {
        copy.restore(tampered);
    } catch (const InvalidInputError&) {
        threw = true;
    }
    check(threw, "restore rejects an erased clue");

    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 9; ++c) {
            if (!puzzle.locked.at(r, c)) game.enter(r, c, puzzle.solution.at(r, c));
        }
    }
    check(game.is_complete() && !game.running(), "filling every cell completes and stops the clock");
    game.resume();
    check(!game.running(), "completed game stays stopped");
    check(game.score() == compute_sudoku_score(Difficulty::Easy, 30, game.mistakes()), "score from elapsed and mistakes");

    SudokuGame other;
    other.new_game(Difficulty::Hard, random);
    other.solve_now();
    check(other.is_complete() && !other.running(), "solve_now fills the solution");

    threw = false;
    try {
        other.enter(9, 0, 1);
    } catch (const InvalidInputError&) {
        threw = true;
    }
    check(threw, "row 9 rejected");
}

int main() {
    test_merge_game();
    test_sudoku_game();

    if (failures > 0) {
        std::cout << "\n=== " << failures << " check(s) failed ===" << std::endl;
        return 1;
    }
    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
