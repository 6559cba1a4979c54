#include "puzzlehub/memory_game.hpp"
#include "puzzlehub/errors.hpp"
#include <stdexcept>
#include <string>

namespace puzzlehub {

static void check_pairs(int pairs) {
  if (pairs < MIN_PAIRS || pairs > MAX_PAIRS) {
    throw InvalidInputError("Pair count must be in " + std::to_string(MIN_PAIRS) + ".." +
                            std::to_string(MAX_PAIRS) + ", got " + std::to_string(pairs));
  }
}

MemoryGame::MemoryGame(int pairs, RandomSource& random) {
  restart(pairs, random);
}

void MemoryGame::restart(int pairs, RandomSource& random) {
  check_pairs(pairs);
  // best records are kept per deck size
  if (pairs != this->pairs()) best_ = BestRecord{};

  std::vector<int> symbols;
  symbols.reserve(pairs * 2);
  for (int s = 0; s < pairs; ++s) {
    symbols.push_back(s);
    symbols.push_back(s);
  }
  shuffle_in_place(symbols, random);

  cards_.clear();
  cards_.reserve(symbols.size());
  for (int s : symbols) cards_.push_back(Card{s, CardState::Closed});

  pending_.clear();
  moves_ = 0;
  matched_pairs_ = 0;
  elapsed_ = 0;
  running_ = true;
  revealed_ = false;
}

const Card& MemoryGame::card(int index) const {
  if (index < 0 || index >= card_count()) {
    throw InvalidInputError("Card index " + std::to_string(index) + " is out of range");
  }
  return cards_[index];
}

FlipResult MemoryGame::flip(int index) {
  if (index < 0 || index >= card_count()) {
    throw InvalidInputError("Card index " + std::to_string(index) + " is out of range");
  }
  if (!running_ || revealed_ || pair_pending()) return FlipResult::Rejected;
  Card& c = cards_[index];
  if (c.state != CardState::Closed) return FlipResult::Rejected;

  c.state = CardState::Open;
  pending_.push_back(index);
  if (pending_.size() < 2) return FlipResult::Opened;

  ++moves_;
  return FlipResult::PairReady;
}

PairOutcome MemoryGame::evaluate() {
  if (!pair_pending()) {
    throw std::logic_error("evaluate() called without two open cards");
  }
  Card& a = cards_[pending_[0]];
  Card& b = cards_[pending_[1]];
  pending_.clear();

  if (a.symbol == b.symbol) {
    a.state = CardState::Matched;
    b.state = CardState::Matched;
    ++matched_pairs_;
    if (is_complete()) {
      running_ = false;
      record_best();
    }
    return PairOutcome::Match;
  }
  a.state = CardState::Closed;
  b.state = CardState::Closed;
  return PairOutcome::Mismatch;
}

bool MemoryGame::reveal_all() {
  if (!pending_.empty() || revealed_) return false;
  revealed_ = true;
  return true;
}

void MemoryGame::hide_unmatched() {
  revealed_ = false;
}

bool MemoryGame::is_complete() const {
  return !cards_.empty() && matched_pairs_ == pairs();
}

void MemoryGame::tick(int seconds) {
  if (running_ && seconds > 0) elapsed_ += seconds;
}

void MemoryGame::record_best() {
  const bool fewer_moves = !best_.least_moves || moves_ < *best_.least_moves;
  const bool same_moves_faster = best_.least_moves && moves_ == *best_.least_moves &&
                                 (!best_.best_time || elapsed_ < *best_.best_time);
  if (fewer_moves || same_moves_faster) {
    best_.least_moves = moves_;
    best_.best_time = elapsed_;
  }
}

void MemoryGame::restore(const std::vector<Card>& cards, int moves, int elapsed, bool running,
                         const BestRecord& best) {
  if (cards.empty() || cards.size() % 2 != 0) {
    throw InvalidInputError("Deck must hold a positive even number of cards");
  }
  const int pairs = static_cast<int>(cards.size() / 2);
  check_pairs(pairs);

  std::vector<int> seen(pairs, 0);
  std::vector<int> matched(pairs, 0);
  for (const Card& c : cards) {
    if (c.symbol < 0 || c.symbol >= pairs) {
      throw InvalidInputError("Card symbol " + std::to_string(c.symbol) + " is out of range");
    }
    if (c.state == CardState::Open) {
      throw InvalidInputError("Saved deck cannot hold an unresolved open card");
    }
    ++seen[c.symbol];
    if (c.state == CardState::Matched) ++matched[c.symbol];
  }
  int matched_pairs = 0;
  for (int s = 0; s < pairs; ++s) {
    if (seen[s] != 2) {
      throw InvalidInputError("Symbol " + std::to_string(s) + " must appear exactly twice");
    }
    if (matched[s] == 1) {
      throw InvalidInputError("Symbol " + std::to_string(s) + " is only half matched");
    }
    if (matched[s] == 2) ++matched_pairs;
  }
  if (moves < 0 || elapsed < 0) {
    throw InvalidInputError("Negative counters in saved memory state");
  }

  cards_ = cards;
  pending_.clear();
  moves_ = moves;
  matched_pairs_ = matched_pairs;
  elapsed_ = elapsed;
  running_ = running && !is_complete();
  revealed_ = false;
  best_ = best;
}

} // namespace puzzlehub
