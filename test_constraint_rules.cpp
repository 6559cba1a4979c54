#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include "puzzlehub/constraint_rules.hpp"
#include "puzzlehub/errors.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/solver.hpp"

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

// Shifted-rows pattern: every row, column and region is a permutation of 1..9.
static ConstraintGrid pattern_grid() {
    ConstraintGrid g;
    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 9; ++c) {
            g.at(r, c) = (r * 3 + r / 3 + c) % 9 + 1;
        }
    }
    return g;
}

static bool units_are_permutations(const ConstraintGrid& g) {
    for (int i = 0; i < 9; ++i) {
        int row_mask = 0;
        int col_mask = 0;
        int box_mask = 0;
        for (int j = 0; j < 9; ++j) {
            const int rv = g.at(i, j);
            const int cv = g.at(j, i);
            const int bv = g.at((i / 3) * 3 + j / 3, (i % 3) * 3 + j % 3);
            if (rv < 1 || cv < 1 || bv < 1) return false;
            row_mask |= 1 << (rv - 1);
            col_mask |= 1 << (cv - 1);
            box_mask |= 1 << (bv - 1);
        }
        if (row_mask != 0x1FF || col_mask != 0x1FF || box_mask != 0x1FF) return false;
    }
    return true;
}

template <class F>
static bool throws_invalid(F&& fn) {
    try {
        fn();
    } catch (const InvalidInputError&) {
        return true;
    }
    return false;
}

int main() {
    const ConstraintGrid full = pattern_grid();

    std::cout << "=== Full grid checks ===" << std::endl;
    {
        check(units_are_permutations(full), "pattern grid is a valid solution");
        check(ConstraintRules::validate(full, full), "full grid validates against itself");
        check(ConstraintRules::is_complete(full, full), "full grid is complete against itself");
        check(ConstraintRules::is_solved_grid(full), "is_solved_grid accepts the pattern");
        check(ConstraintRules::filled_count(full) == 81, "81 filled cells");
    }

    std::cout << "\n=== is_placement_valid ===" << std::endl;
    {
        bool all_blocked = true;
        for (int v = 1; v <= 9; ++v) {
            if (ConstraintRules::is_placement_valid(full, 0, 0, v)) all_blocked = false;
        }
        check(all_blocked, "no digit fits (0,0) of a full grid");

        ConstraintGrid g;
        g.at(0, 5) = 3; // row 0
        g.at(4, 0) = 7; // column 0
        g.at(2, 2) = 9; // top-left region
        g.at(5, 5) = 1; // elsewhere
        check(!ConstraintRules::is_placement_valid(g, 0, 0, 3), "digit in row 0 blocks (0,0)");
        check(!ConstraintRules::is_placement_valid(g, 0, 0, 7), "digit in column 0 blocks (0,0)");
        check(!ConstraintRules::is_placement_valid(g, 0, 0, 9), "digit in the top-left region blocks (0,0)");
        check(ConstraintRules::is_placement_valid(g, 0, 0, 1), "unrelated digit fits (0,0)");

        g.at(0, 0) = 5;
        check(!ConstraintRules::is_placement_valid(g, 0, 0, 5), "the cell's own value counts as a conflict");

        check(throws_invalid([&] { ConstraintRules::is_placement_valid(g, 9, 0, 1); }), "row 9 rejected");
        check(throws_invalid([&] { ConstraintRules::is_placement_valid(g, 0, -1, 1); }), "column -1 rejected");
        check(throws_invalid([&] { ConstraintRules::is_placement_valid(g, 0, 0, 0); }), "digit 0 rejected");
        check(throws_invalid([&] { ConstraintRules::is_placement_valid(g, 0, 0, 10); }), "digit 10 rejected");
    }

    std::cout << "\n=== solve ===" << std::endl;
    {
        auto same = ConstraintRules::solve(full);
        check(same && *same == full, "full valid grid solves to itself");

        ConstraintGrid broken = full;
        std::swap(broken.at(0, 0), broken.at(0, 1));
        check(!ConstraintRules::solve(broken), "full grid with a column clash has no solution");

        ConstraintGrid twins;
        twins.at(3, 1) = 5;
        twins.at(3, 7) = 5;
        check(!ConstraintRules::solve(twins), "conflicting givens are rejected");

        ConstraintGrid puzzle = full;
        for (int i = 0; i < 81; i += 2) puzzle[i] = 0;
        Solver solver;
        auto solved = solver.solve(puzzle);
        bool keeps_givens = solved.has_value();
        if (solved) {
            for (int i = 0; i < 81; ++i) {
                if (puzzle[i] != 0 && (*solved)[i] != puzzle[i]) keeps_givens = false;
            }
        }
        check(solved && ConstraintRules::is_solved_grid(*solved), "half-empty grid is completed");
        check(keeps_givens, "givens are never changed");
        std::cout << "  nodes=" << solver.stats().nodes << " backtracks=" << solver.stats().backtracks
                  << " max_depth=" << solver.stats().max_depth << std::endl;
        check(solver.stats().max_depth <= 41, "recursion depth bounded by empty cells");

        auto from_empty = ConstraintRules::solve(ConstraintGrid());
        check(from_empty && ConstraintRules::is_solved_grid(*from_empty), "empty grid has a completion");
        check(from_empty && from_empty->at(0, 0) == 1 && from_empty->at(0, 8) == 9,
              "ascending order fills row 0 with 1..9");

        check(solver.count_solutions(full, 2) == 1, "full grid has one solution");
        check(solver.count_solutions(ConstraintGrid(), 2) == 2, "count stops at the limit");
        check(solver.count_solutions(broken, 2) == 0, "broken grid has none");
    }

    std::cout << "\n=== Generation ===" << std::endl;
    {
        bool all_valid = true;
        for (uint64_t seed = 1; seed <= 5; ++seed) {
            Mt19937Source random(seed);
            if (!units_are_permutations(ConstraintRules::generate_solved_grid(random))) all_valid = false;
        }
        check(all_valid, "generated grids have all units as permutations");

        Mt19937Source a(42);
        Mt19937Source b(42);
        check(ConstraintRules::generate_solved_grid(a) == ConstraintRules::generate_solved_grid(b),
              "same seed, same grid");

        ScriptedSource scripted;
        auto fixed = ConstraintRules::generate_solved_grid(scripted);
        check(units_are_permutations(fixed), "scripted permutations still yield a valid grid");
        check(scripted.index_calls() > 0, "candidate order is drawn from the source");
    }

    std::cout << "\n=== Clue derivation ===" << std::endl;
    {
        check(ConstraintRules::removal_count(Difficulty::Easy) == 36, "easy removes 36");
        check(ConstraintRules::removal_count(Difficulty::Medium) == 46, "medium removes 46");
        check(ConstraintRules::removal_count(Difficulty::Hard) == 54, "hard removes 54");

        Mt19937Source random(7);
        const ConstraintGrid solution = ConstraintRules::generate_solved_grid(random);
        const Difficulty levels[] = {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard};
        for (Difficulty d : levels) {
            const ConstraintGrid clues = ConstraintRules::derive_clue_grid(solution, d, random);
            check(ConstraintRules::filled_count(clues) == 81 - ConstraintRules::removal_count(d),
                  std::string(difficulty_name(d)) + " clue count");
            check(ConstraintRules::validate(clues, solution), std::string(difficulty_name(d)) + " clues match solution");
        }

        const ConstraintGrid unique = ConstraintRules::derive_unique_clue_grid(solution, Difficulty::Easy, random);
        Solver counter;
        check(counter.count_solutions(unique, 2) == 1, "unique derivation leaves one completion");
        check(ConstraintRules::filled_count(unique) >= 81 - 36, "unique derivation never over-removes");
        check(ConstraintRules::validate(unique, solution), "unique clues match solution");

        PuzzleInstance p = ConstraintRules::make_puzzle(Difficulty::Medium, random);
        check(p.locked == ConstraintRules::lock_mask(p.clues), "locked mask follows the clues");
        check(!throws_invalid([&] { ConstraintRules::validate_instance(p); }), "made puzzle is consistent");

        PuzzleInstance tampered = p;
        for (int i = 0; i < 81; ++i) {
            if (tampered.clues[i] != 0) {
                tampered.clues[i] = tampered.clues[i] % 9 + 1;
                break;
            }
        }
        check(throws_invalid([&] { ConstraintRules::validate_instance(tampered); }),
              "clue disagreeing with the solution is rejected");
    }

    std::cout << "\n=== Working grid checks ===" << std::endl;
    {
        ConstraintGrid clues = full;
        clues.at(0, 0) = 0;
        clues.at(4, 4) = 0;
        const LockGrid locked = ConstraintRules::lock_mask(clues);

        ConstraintGrid working = clues;
        check(ConstraintRules::validate(working, full), "blanks are not errors");
        check(!ConstraintRules::is_complete(working, full), "blanks keep the grid incomplete");

        auto hint = ConstraintRules::find_hint_cell(working, locked, full);
        check(hint && *hint == (CellPos{0, 0}), "first hint is (0,0)");

        working.at(0, 0) = full.at(0, 0);
        hint = ConstraintRules::find_hint_cell(working, locked, full);
        check(hint && *hint == (CellPos{4, 4}), "next hint is (4,4)");

        working.at(4, 4) = full.at(4, 4) % 9 + 1;
        check(!ConstraintRules::validate(working, full), "wrong digit fails validation");
        hint = ConstraintRules::find_hint_cell(working, locked, full);
        check(hint && *hint == (CellPos{4, 4}), "wrong digit is hinted");

        working.at(4, 4) = full.at(4, 4);
        check(!ConstraintRules::find_hint_cell(working, locked, full), "no hint once solved");
        check(ConstraintRules::is_complete(working, full), "complete once every cell matches");
    }

    std::cout << "\n=== Text form ===" << std::endl;
    {
        const std::string text = ConstraintRules::format_grid(full);
        check(text.size() == 81 && text.substr(0, 9) == "123456789", "format_grid writes 81 digits");
        check(ConstraintRules::parse_grid(text) == full, "parse_grid reads it back");

        std::string dotted = text;
        dotted[0] = '.';
        dotted[80] = '0';
        const ConstraintGrid parsed = ConstraintRules::parse_grid(dotted);
        check(parsed.at(0, 0) == 0 && parsed.at(8, 8) == 0, "'.' and '0' are blanks");

        check(throws_invalid([&] { ConstraintRules::parse_grid(text.substr(0, 80)); }), "80 cells rejected");
        check(throws_invalid([&] { ConstraintRules::parse_grid(text + "1"); }), "82 cells rejected");
        check(throws_invalid([&] { ConstraintRules::parse_grid("x" + text.substr(1)); }), "letters rejected");

        ConstraintGrid bad;
        bad.at(2, 2) = 12;
        check(throws_invalid([&] { ConstraintRules::validate_grid(bad); }), "cell value 12 rejected");

        check(parse_difficulty("HARD") == Difficulty::Hard, "difficulty names are case-insensitive");
        check(!parse_difficulty("extreme"), "unknown difficulty");
    }

    if (failures > 0) {
        std::cout << "\n=== " << failures << " check(s) failed ===" << std::endl;
        return 1;
    }
    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
