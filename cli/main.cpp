#include "puzzlehub/constraint_rules.hpp"
#include "puzzlehub/memory_game.hpp"
#include "puzzlehub/merge_game.hpp"
#include "puzzlehub/merge_rules.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/solver.hpp"
#include "puzzlehub/sudoku_game.hpp"
#include "merge_policy.hpp"
#include "memory_policy.hpp"
#include "snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace puzzlehub;
using namespace puzzlehub_ai;

namespace {

constexpr int kDefaultMergeGames = 100;
constexpr int kDefaultMemoryGames = 100;
constexpr int kMaxMergeMoves = 100000;

inline bool debug_mode()  { return std::getenv("PUZZLEHUB_DEBUG") != nullptr; }
inline bool silent_mode() { return std::getenv("PUZZLEHUB_SILENT") != nullptr; }

void log_line(const std::string& tag, const std::string& message) {
  if (silent_mode()) return;
  std::cerr << "[" << tag << "] " << message << "\n";
}

void debug_line(const std::string& tag, const std::string& message) {
  if (!debug_mode() || silent_mode()) return;
  std::cerr << "[" << tag << "] " << message << "\n";
}

std::string to_lower_copy(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return lowered;
}

bool is_number_string(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

std::optional<uint64_t> parse_seed_string(const std::string& value) {
  if (!is_number_string(value)) return std::nullopt;
  try {
    return static_cast<uint64_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

int parse_count(const std::string& value, int fallback) {
  if (!is_number_string(value)) return fallback;
  try {
    return std::max(1, std::stoi(value));
  } catch (const std::out_of_range&) {
    return fallback;
  }
}

struct CliArgs {
  std::string command;
  std::vector<std::string> positional;
  std::map<std::string, std::string> options; // --key=value, bare --flag maps to "1"
};

CliArgs parse_args(int argc, char** argv) {
  CliArgs args;
  if (argc > 1) args.command = to_lower_copy(argv[1]);
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      const auto eq = arg.find('=');
      if (eq == std::string::npos) {
        args.options[arg.substr(2)] = "1";
      } else {
        args.options[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
      }
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

std::optional<std::string> option(const CliArgs& args, const std::string& key) {
  const auto it = args.options.find(key);
  if (it == args.options.end()) return std::nullopt;
  return it->second;
}

void warn_unknown(const CliArgs& args, const std::vector<std::string>& known) {
  for (const auto& [key, value] : args.options) {
    if (std::find(known.begin(), known.end(), key) == known.end()) {
      std::cerr << "Unknown argument: --" << key << "\n";
    }
  }
}

// Priority: --seed > env PUZZLEHUB_SEED > steady clock
uint64_t resolve_seed(const CliArgs& args) {
  if (auto flag = option(args, "seed")) {
    if (auto seed = parse_seed_string(*flag)) return *seed;
    std::cerr << "Ignoring malformed --seed=" << *flag << "\n";
  }
  if (const char* env = std::getenv("PUZZLEHUB_SEED")) {
    if (auto seed = parse_seed_string(env)) return *seed;
  }
  return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

void print_merge_grid(const MergeGrid& grid) {
  for (int r = 0; r < MERGE_N; ++r) {
    for (int c = 0; c < MERGE_N; ++c) {
      const int v = grid.at(r, c);
      std::string cell = v == 0 ? "." : std::to_string(v);
      std::cout << std::string(6 - std::min<std::size_t>(cell.size(), 6), ' ') << cell;
    }
    std::cout << "\n";
  }
}

void print_usage() {
  std::cout << "Usage: puzzlehub <command> [options]\n"
            << "  merge-sim [games] [--policy=random|greedy] [--seed=N]\n"
            << "  sudoku-gen [--difficulty=easy|medium|hard] [--unique] [--seed=N] [--out=FILE]\n"
            << "  sudoku-solve <81 chars, 0 or . for blanks>\n"
            << "  sudoku-hint <snapshot FILE>\n"
            << "  memory-sim [games] [--pairs=N] [--seed=N]\n"
            << "Environment: PUZZLEHUB_SEED, PUZZLEHUB_DEBUG, PUZZLEHUB_SILENT\n";
}

// ---------------------------------------------------------------- merge-sim

struct MergeGameOutcome {
  Score score = 0;
  int max_tile = 0;
  int moves = 0;
};

MergeGameOutcome play_merge_game(const std::function<std::optional<Direction>(const MergeGrid&)>& pick,
                                 RandomSource& random, bool verbose) {
  MergeGame game(random);
  if (verbose) {
    std::cout << "\nInitial board:\n";
    print_merge_grid(game.board());
  }
  while (!game.game_over() && game.moves() < kMaxMergeMoves) {
    const auto dir = pick(game.board());
    if (!dir) break;
    if (!game.move(*dir, random)) {
      throw std::logic_error("Policy picked a direction that changes nothing");
    }
  }
  if (verbose) {
    std::cout << "\nFinal board after " << game.moves() << " moves:\n";
    print_merge_grid(game.board());
  }
  return MergeGameOutcome{game.score(), MergeRules::max_tile(game.board()), game.moves()};
}

int run_merge_sim(const CliArgs& args) {
  warn_unknown(args, {"policy", "seed"});
  const int games = args.positional.empty() ? kDefaultMergeGames
                                            : parse_count(args.positional[0], kDefaultMergeGames);
  const std::string policy_name = to_lower_copy(option(args, "policy").value_or("greedy"));
  const uint64_t seed = resolve_seed(args);
  log_line("SEED", std::to_string(seed));

  Mt19937Source random(seed);
  RandomMergePolicy random_policy(random);
  GreedyMergePolicy greedy_policy(random);

  std::function<std::optional<Direction>(const MergeGrid&)> pick;
  if (policy_name == "random" || policy_name == "rand") {
    pick = [&random_policy](const MergeGrid& g) { return random_policy.pick(g); };
  } else if (policy_name == "greedy") {
    pick = [&greedy_policy](const MergeGrid& g) { return greedy_policy.pick(g); };
  } else {
    throw std::invalid_argument("Unsupported policy type: " + policy_name);
  }

  std::cout << "\n======================================\n";
  std::cout << "Merge simulation: " << games << " games, policy=" << policy_name << "\n";
  std::cout << "======================================\n";

  long long total_score = 0;
  long long total_moves = 0;
  Score best_score = 0;
  std::map<int, int> max_tiles;
  for (int i = 0; i < games; ++i) {
    const auto outcome = play_merge_game(pick, random, i == 0 && debug_mode());
    total_score += outcome.score;
    total_moves += outcome.moves;
    best_score = std::max(best_score, outcome.score);
    ++max_tiles[outcome.max_tile];
    debug_line("SIM", "game " + std::to_string(i + 1) + " score=" + std::to_string(outcome.score) +
                          " max_tile=" + std::to_string(outcome.max_tile));
  }

  std::cout << "Results after " << games << " games:\n";
  std::cout << "  Average score: " << static_cast<double>(total_score) / games << "\n";
  std::cout << "  Best score: " << best_score << "\n";
  std::cout << "  Average moves: " << static_cast<double>(total_moves) / games << "\n";
  std::cout << "  Max tile distribution:\n";
  for (const auto& [tile, count] : max_tiles) {
    std::cout << "    " << tile << ": " << count << " (" << (100.0 * count / games) << "%)\n";
  }
  std::cout << "======================================\n";
  return 0;
}

// ---------------------------------------------------------------- sudoku

int run_sudoku_gen(const CliArgs& args) {
  warn_unknown(args, {"difficulty", "unique", "seed", "out"});
  const std::string level = option(args, "difficulty").value_or("medium");
  const auto difficulty = parse_difficulty(level);
  if (!difficulty) {
    throw std::invalid_argument("Unsupported difficulty: " + level);
  }
  const bool unique = option(args, "unique").has_value();
  const uint64_t seed = resolve_seed(args);
  log_line("SEED", std::to_string(seed));

  Mt19937Source random(seed);
  const auto start = std::chrono::steady_clock::now();
  SudokuGame game;
  game.new_game(*difficulty, random, unique);
  const auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();

  const auto& puzzle = game.puzzle();
  const int clues = ConstraintRules::filled_count(puzzle.clues);
  debug_line("GEN", "generated in " + std::to_string(elapsed_us) + " us, clues=" + std::to_string(clues));

  std::cout << "Puzzle (" << difficulty_name(*difficulty) << ", " << clues << " clues"
            << (unique ? ", unique" : "") << "):\n";
  std::cout << ConstraintRules::render_grid(puzzle.clues);
  std::cout << "\nSolution:\n";
  std::cout << ConstraintRules::render_grid(puzzle.solution);
  std::cout << "\nclues=" << ConstraintRules::format_grid(puzzle.clues) << "\n";

  if (auto out = option(args, "out")) {
    std::ofstream file(*out);
    if (!file) {
      throw std::runtime_error("Could not open " + *out + " for writing");
    }
    file << snapshot::build_sudoku_snapshot(game);
    log_line("SAVE", "wrote " + *out);
  }
  return 0;
}

int run_sudoku_solve(const CliArgs& args) {
  warn_unknown(args, {});
  if (args.positional.empty()) {
    std::cerr << "sudoku-solve needs an 81 character grid\n";
    return 1;
  }
  std::string text;
  for (const auto& part : args.positional) text += part;
  const ConstraintGrid grid = ConstraintRules::parse_grid(text);

  Solver solver;
  const auto start = std::chrono::steady_clock::now();
  const auto solved = solver.solve(grid);
  const auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
  debug_line("SOLVER", "nodes=" + std::to_string(solver.stats().nodes) +
                           " backtracks=" + std::to_string(solver.stats().backtracks) +
                           " depth=" + std::to_string(solver.stats().max_depth) +
                           " time_us=" + std::to_string(elapsed_us));

  std::cout << "Puzzle:\n" << ConstraintRules::render_grid(grid);
  if (!solved) {
    std::cout << "\nStatus: Unsolvable\n";
    std::cerr << "Could not solve the grid (invalid configuration)\n";
    return 1;
  }
  std::cout << "\nStatus: Solved\n" << ConstraintRules::render_grid(*solved);
  std::cout << "\nsolution=" << ConstraintRules::format_grid(*solved) << "\n";
  return 0;
}

int run_sudoku_hint(const CliArgs& args) {
  warn_unknown(args, {});
  if (args.positional.empty()) {
    std::cerr << "sudoku-hint needs a snapshot file\n";
    return 1;
  }
  const std::string path = args.positional[0];
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Could not open " + path);
  }
  SudokuGame game = snapshot::parse_sudoku_snapshot(snapshot::read_block(in, snapshot::SUDOKU_HEADER));
  in.close();

  const auto cell = game.reveal_hint();
  if (!cell) {
    if (game.hints_left() <= 0) {
      std::cout << "No hints left\n";
    } else {
      std::cout << "Nothing to reveal, the board already matches the solution\n";
    }
    return 0;
  }
  std::cout << "Revealed (" << cell->row + 1 << "," << cell->col + 1 << ") = "
            << game.working().at(cell->row, cell->col) << ", hints left: " << game.hints_left() << "\n";
  std::cout << ConstraintRules::render_grid(game.working());
  if (game.is_complete()) {
    std::cout << "Puzzle completed! Mistakes: " << game.mistakes() << " Score: " << game.score() << "\n";
  }

  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Could not open " + path + " for writing");
  }
  out << snapshot::build_sudoku_snapshot(game);
  log_line("SAVE", "wrote " + path);
  return 0;
}

// ---------------------------------------------------------------- memory-sim

int play_memory_game(MemoryGame& game, PerfectRecallPolicy& policy) {
  policy.reset();
  while (!game.is_complete()) {
    const auto first = policy.pick_first(game);
    if (!first) {
      throw std::logic_error("Memory policy found no card to open");
    }
    game.flip(*first);
    policy.observe(*first, game.card(*first).symbol);

    const auto second = policy.pick_second(game, *first);
    if (!second) {
      throw std::logic_error("Memory policy found no second card to open");
    }
    if (game.flip(*second) != FlipResult::PairReady) {
      throw std::logic_error("Second flip did not complete a pair");
    }
    policy.observe(*second, game.card(*second).symbol);

    if (game.evaluate() == PairOutcome::Match) {
      policy.forget(*first);
      policy.forget(*second);
    }
  }
  return game.moves();
}

int run_memory_sim(const CliArgs& args) {
  warn_unknown(args, {"pairs", "seed"});
  const int games = args.positional.empty() ? kDefaultMemoryGames
                                            : parse_count(args.positional[0], kDefaultMemoryGames);
  const int pairs = parse_count(option(args, "pairs").value_or(""), DEFAULT_PAIRS);
  const uint64_t seed = resolve_seed(args);
  log_line("SEED", std::to_string(seed));

  Mt19937Source random(seed);
  PerfectRecallPolicy policy;
  MemoryGame game(pairs, random);

  long long total_moves = 0;
  for (int i = 0; i < games; ++i) {
    if (i > 0) game.restart(pairs, random);
    const int moves = play_memory_game(game, policy);
    total_moves += moves;
    debug_line("SIM", "game " + std::to_string(i + 1) + " moves=" + std::to_string(moves));
  }

  std::cout << "\n======================================\n";
  std::cout << "Memory simulation: " << games << " games, " << pairs << " pairs\n";
  std::cout << "  Average moves: " << static_cast<double>(total_moves) / games << "\n";
  std::cout << "  Least moves: " << game.best().least_moves.value_or(0) << "\n";
  std::cout << "======================================\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const CliArgs args = parse_args(argc, argv);
  try {
    if (args.command == "merge-sim") return run_merge_sim(args);
    if (args.command == "sudoku-gen") return run_sudoku_gen(args);
    if (args.command == "sudoku-solve") return run_sudoku_solve(args);
    if (args.command == "sudoku-hint") return run_sudoku_hint(args);
    if (args.command == "memory-sim") return run_memory_sim(args);
    print_usage();
    return args.command.empty() || args.command == "help" || args.command == "--help" ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "Fatal error: " << ex.what() << std::endl;
    return 1;
  }
}
