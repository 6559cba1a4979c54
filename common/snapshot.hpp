#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <istream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "puzzlehub/constraint_rules.hpp"
#include "puzzlehub/errors.hpp"
#include "puzzlehub/grid.hpp"
#include "puzzlehub/memory_game.hpp"
#include "puzzlehub/merge_game.hpp"
#include "puzzlehub/sudoku_game.hpp"

// Session snapshots as text blocks:
//
//   MERGE | SUDOKU | MEMORY
//   key=value
//   ...
//   END
//
// Unknown keys are skipped. Restored values go back through the engines'
// own validation, so a snapshot can never smuggle in an illegal board.
namespace snapshot {

struct SnapshotError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline constexpr char MERGE_HEADER[] = "MERGE";
inline constexpr char SUDOKU_HEADER[] = "SUDOKU";
inline constexpr char MEMORY_HEADER[] = "MEMORY";
inline constexpr char END_MARKER[] = "END";

inline std::string trim(const std::string& text) {
    auto first = std::find_if(text.begin(), text.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto last = std::find_if(text.rbegin(), text.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

inline std::vector<std::string> split(const std::string& text, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delim)) {
        parts.push_back(item);
    }
    return parts;
}

inline int parse_int(const std::string& key, const std::string& value) {
    try {
        std::size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw SnapshotError("Trailing characters in " + key + ": " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw SnapshotError("Expected an integer for " + key + ", got: " + value);
    } catch (const std::out_of_range&) {
        throw SnapshotError("Integer out of range for " + key + ": " + value);
    }
}

inline bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true") return true;
    if (value == "0" || value == "false") return false;
    throw SnapshotError("Expected 0/1 for " + key + ", got: " + value);
}

inline std::string join_ints(const std::vector<int>& values) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << values[i];
    }
    return oss.str();
}

inline std::vector<int> parse_ints(const std::string& key, const std::string& text) {
    std::vector<int> values;
    if (text.empty()) {
        return values;
    }
    for (const auto& item : split(text, ',')) {
        values.push_back(parse_int(key, trim(item)));
    }
    return values;
}

// Lines between `header` and END, exclusive. Blank lines and '#' comments are
// dropped.
inline std::vector<std::string> read_block(std::istream& in, const std::string& header) {
    std::string line;
    bool inside = false;
    std::vector<std::string> lines;
    while (std::getline(in, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (!inside) {
            if (trimmed != header) {
                throw SnapshotError("Expected " + header + " block, got: " + trimmed);
            }
            inside = true;
            continue;
        }
        if (trimmed == END_MARKER) {
            return lines;
        }
        lines.push_back(trimmed);
    }
    throw SnapshotError(inside ? "Missing END marker in " + header + " block"
                               : "Empty snapshot, expected " + header + " block");
}

class KeyValues {
public:
    explicit KeyValues(const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            const auto eq = line.find('=');
            if (eq == std::string::npos) {
                throw SnapshotError("Malformed snapshot line: " + line);
            }
            entries_.emplace_back(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
        }
    }

    std::optional<std::string> find(const std::string& key) const {
        for (const auto& [k, v] : entries_) {
            if (k == key) return v;
        }
        return std::nullopt;
    }

    std::string require(const std::string& key) const {
        auto value = find(key);
        if (!value) {
            throw SnapshotError("Snapshot is missing key: " + key);
        }
        return *value;
    }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

template <class T, int N>
std::vector<int> grid_values(const puzzlehub::Grid<T, N>& grid) {
    std::vector<int> values;
    values.reserve(N * N);
    for (const auto& v : grid) {
        values.push_back(static_cast<int>(v));
    }
    return values;
}

template <class T, int N>
puzzlehub::Grid<T, N> grid_from_values(const std::string& key, const std::vector<int>& values) {
    if (values.size() != static_cast<std::size_t>(N * N)) {
        throw SnapshotError(key + " must hold " + std::to_string(N * N) + " cells, got " +
                            std::to_string(values.size()));
    }
    puzzlehub::Grid<T, N> grid;
    for (int i = 0; i < N * N; ++i) {
        grid[i] = static_cast<T>(values[i]);
    }
    return grid;
}

inline puzzlehub::ConstraintGrid parse_sudoku_cells(const std::string& key, const std::string& text) {
    try {
        return puzzlehub::ConstraintRules::parse_grid(text);
    } catch (const puzzlehub::InvalidInputError& ex) {
        throw SnapshotError(key + ": " + ex.what());
    }
}

// ---------------------------------------------------------------- merge

inline std::string build_merge_snapshot(const puzzlehub::MergeGame& game) {
    std::ostringstream oss;
    oss << MERGE_HEADER << "\n";
    oss << "board=" << join_ints(grid_values(game.board())) << "\n";
    oss << "score=" << game.score() << "\n";
    oss << "best=" << game.best_score() << "\n";
    oss << END_MARKER << "\n";
    return oss.str();
}

inline puzzlehub::MergeGame parse_merge_snapshot(const std::vector<std::string>& lines) {
    const KeyValues kv(lines);
    const auto board = grid_from_values<int, puzzlehub::MERGE_N>(
        "board", parse_ints("board", kv.require("board")));
    const int score = parse_int("score", kv.require("score"));
    const int best = kv.find("best") ? parse_int("best", *kv.find("best")) : score;

    puzzlehub::MergeGame game;
    game.restore(board, score, best);
    return game;
}

// ---------------------------------------------------------------- sudoku

inline std::string build_sudoku_snapshot(const puzzlehub::SudokuGame& game) {
    using puzzlehub::ConstraintRules::format_grid;
    const auto state = game.save();
    std::ostringstream oss;
    oss << SUDOKU_HEADER << "\n";
    oss << "difficulty=" << puzzlehub::difficulty_name(state.difficulty) << "\n";
    oss << "clues=" << format_grid(state.puzzle.clues) << "\n";
    oss << "solution=" << format_grid(state.puzzle.solution) << "\n";
    oss << "board=" << format_grid(state.working) << "\n";
    oss << "notes=" << join_ints(grid_values(state.notes)) << "\n";
    oss << "time=" << state.elapsed << "\n";
    oss << "running=" << (state.running ? 1 : 0) << "\n";
    oss << "mistakes=" << state.mistakes << "\n";
    oss << "hints=" << state.hints_left << "\n";
    oss << END_MARKER << "\n";
    return oss.str();
}

inline puzzlehub::SudokuGame parse_sudoku_snapshot(const std::vector<std::string>& lines) {
    const KeyValues kv(lines);
    puzzlehub::SudokuGame::SavedState state;

    const std::string level = kv.require("difficulty");
    const auto difficulty = puzzlehub::parse_difficulty(level);
    if (!difficulty) {
        throw SnapshotError("Unknown difficulty: " + level);
    }
    state.difficulty = *difficulty;
    state.puzzle.clues = parse_sudoku_cells("clues", kv.require("clues"));
    state.puzzle.solution = parse_sudoku_cells("solution", kv.require("solution"));
    state.puzzle.locked = puzzlehub::ConstraintRules::lock_mask(state.puzzle.clues);
    state.working = parse_sudoku_cells("board", kv.require("board"));
    if (auto notes = kv.find("notes")) {
        state.notes = grid_from_values<uint16_t, puzzlehub::SUDOKU_N>("notes", parse_ints("notes", *notes));
    } else {
        state.notes.fill(0);
    }
    state.elapsed = parse_int("time", kv.require("time"));
    state.running = kv.find("running") ? parse_bool("running", *kv.find("running")) : false;
    state.mistakes = parse_int("mistakes", kv.require("mistakes"));
    state.hints_left = kv.find("hints") ? parse_int("hints", *kv.find("hints")) : puzzlehub::DEFAULT_HINTS;

    puzzlehub::SudokuGame game;
    game.restore(state);
    return game;
}

// ---------------------------------------------------------------- memory

inline char card_state_char(puzzlehub::CardState state) {
    // open cards are saved closed, the pending pair is not persisted
    return state == puzzlehub::CardState::Matched ? 'm' : 'c';
}

inline std::string build_memory_snapshot(const puzzlehub::MemoryGame& game) {
    std::vector<int> symbols;
    std::string states;
    for (const auto& card : game.cards()) {
        symbols.push_back(card.symbol);
        states.push_back(card_state_char(card.state));
    }
    std::ostringstream oss;
    oss << MEMORY_HEADER << "\n";
    oss << "deck=" << join_ints(symbols) << "\n";
    oss << "states=" << states << "\n";
    oss << "moves=" << game.moves() << "\n";
    oss << "time=" << game.elapsed() << "\n";
    oss << "running=" << (game.running() ? 1 : 0) << "\n";
    oss << "best_moves=" << (game.best().least_moves ? std::to_string(*game.best().least_moves) : "-") << "\n";
    oss << "best_time=" << (game.best().best_time ? std::to_string(*game.best().best_time) : "-") << "\n";
    oss << END_MARKER << "\n";
    return oss.str();
}

inline std::optional<int> parse_optional_int(const std::string& key, const std::optional<std::string>& value) {
    if (!value || *value == "-" || value->empty()) {
        return std::nullopt;
    }
    return parse_int(key, *value);
}

inline puzzlehub::MemoryGame parse_memory_snapshot(const std::vector<std::string>& lines) {
    const KeyValues kv(lines);
    const auto symbols = parse_ints("deck", kv.require("deck"));
    const std::string states = kv.require("states");
    if (states.size() != symbols.size()) {
        throw SnapshotError("states must have one entry per card");
    }

    std::vector<puzzlehub::Card> cards;
    cards.reserve(symbols.size());
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        puzzlehub::Card card;
        card.symbol = symbols[i];
        if (states[i] == 'm') {
            card.state = puzzlehub::CardState::Matched;
        } else if (states[i] == 'c') {
            card.state = puzzlehub::CardState::Closed;
        } else {
            throw SnapshotError(std::string("Unknown card state: ") + states[i]);
        }
        cards.push_back(card);
    }

    puzzlehub::BestRecord best;
    best.least_moves = parse_optional_int("best_moves", kv.find("best_moves"));
    best.best_time = parse_optional_int("best_time", kv.find("best_time"));

    const int moves = parse_int("moves", kv.require("moves"));
    const int elapsed = parse_int("time", kv.require("time"));
    const bool running = kv.find("running") ? parse_bool("running", *kv.find("running")) : true;

    puzzlehub::MemoryGame game;
    game.restore(cards, moves, elapsed, running, best);
    return game;
}

}  // namespace snapshot
