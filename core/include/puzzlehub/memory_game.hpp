#pragma once
#include "puzzlehub/random_source.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace puzzlehub {

enum class CardState : uint8_t { Closed = 0, Open = 1, Matched = 2 };

enum class FlipResult : uint8_t { Rejected = 0, Opened = 1, PairReady = 2 };

enum class PairOutcome : uint8_t { Match = 0, Mismatch = 1 };

struct Card {
  int symbol = 0;
  CardState state = CardState::Closed;
};

struct BestRecord {
  std::optional<int> least_moves;
  std::optional<int> best_time;
};

constexpr int MIN_PAIRS = 1;
constexpr int MAX_PAIRS = 16;
constexpr int DEFAULT_PAIRS = 8;

/**
 * Pair matching state machine.
 *
 *   idle -> one open -> two open (pending) -> evaluate -> idle
 *
 * At most two cards are open and unresolved at any time. The delay between
 * PairReady and evaluate() belongs to the caller.
 */
class MemoryGame {
public:
  MemoryGame() = default;
  MemoryGame(int pairs, RandomSource& random);

  void restart(int pairs, RandomSource& random);

  FlipResult flip(int index);
  PairOutcome evaluate();
  bool pair_pending() const { return pending_.size() == 2; }

  bool reveal_all();
  void hide_unmatched();
  bool revealed() const { return revealed_; }

  bool is_complete() const;

  void tick(int seconds);
  void pause() { running_ = false; }
  void resume() { if (!is_complete()) running_ = true; }
  bool running() const { return running_; }

  // Restores a saved deck. Throws InvalidInputError when the symbols do not
  // form exactly two copies of 0..pairs-1 or an open card is present.
  void restore(const std::vector<Card>& cards, int moves, int elapsed, bool running,
               const BestRecord& best);

  int pairs() const { return static_cast<int>(cards_.size() / 2); }
  int card_count() const { return static_cast<int>(cards_.size()); }
  const Card& card(int index) const;
  const std::vector<Card>& cards() const { return cards_; }
  const std::vector<int>& pending() const { return pending_; }
  int moves() const { return moves_; }
  int matched_pairs() const { return matched_pairs_; }
  int elapsed() const { return elapsed_; }
  const BestRecord& best() const { return best_; }

private:
  void record_best();

  std::vector<Card> cards_;
  std::vector<int> pending_;
  int moves_ = 0;
  int matched_pairs_ = 0;
  int elapsed_ = 0;
  bool running_ = true;
  bool revealed_ = false;
  BestRecord best_;
};

} // namespace puzzlehub
