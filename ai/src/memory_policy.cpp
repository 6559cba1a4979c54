#include "memory_policy.hpp"
#include <iterator>

namespace puzzlehub_ai {

using puzzlehub::CardState;
using puzzlehub::MemoryGame;

void PerfectRecallPolicy::reset() {
  seen_.clear();
}

void PerfectRecallPolicy::observe(int index, int symbol) {
  seen_[index] = symbol;
}

void PerfectRecallPolicy::forget(int index) {
  seen_.erase(index);
}

std::optional<int> PerfectRecallPolicy::known_pair_start(const MemoryGame& game) const {
  for (auto a = seen_.begin(); a != seen_.end(); ++a) {
    if (game.card(a->first).state != CardState::Closed) continue;
    for (auto b = std::next(a); b != seen_.end(); ++b) {
      if (b->second == a->second && game.card(b->first).state == CardState::Closed) {
        return a->first;
      }
    }
  }
  return std::nullopt;
}

std::optional<int> PerfectRecallPolicy::lowest_unseen(const MemoryGame& game, int except) const {
  for (int i = 0; i < game.card_count(); ++i) {
    if (i == except) continue;
    if (game.card(i).state != CardState::Closed) continue;
    if (seen_.count(i)) continue;
    return i;
  }
  return std::nullopt;
}

std::optional<int> PerfectRecallPolicy::pick_first(const MemoryGame& game) {
  if (auto known = known_pair_start(game)) return known;
  return lowest_unseen(game, -1);
}

std::optional<int> PerfectRecallPolicy::pick_second(const MemoryGame& game, int first) {
  const auto it = seen_.find(first);
  if (it != seen_.end()) {
    for (const auto& [index, symbol] : seen_) {
      if (index != first && symbol == it->second && game.card(index).state == CardState::Closed) {
        return index;
      }
    }
  }
  if (auto fresh = lowest_unseen(game, first)) return fresh;
  // only already-seen, non-matching cards remain closed
  for (int i = 0; i < game.card_count(); ++i) {
    if (i != first && game.card(i).state == CardState::Closed) return i;
  }
  return std::nullopt;
}

} // namespace puzzlehub_ai
