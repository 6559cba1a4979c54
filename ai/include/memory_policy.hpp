#pragma once
#include "puzzlehub/memory_game.hpp"
#include <map>
#include <optional>
#include <utility>

namespace puzzlehub_ai {

// Remembers every symbol it has seen and opens a known pair as soon as one
// is available. Otherwise opens the lowest unseen card.
class PerfectRecallPolicy {
public:
  void reset();

  // Next (first, second) card to flip. The second index is only known after
  // the first card is visible, so pick_second() is a separate step.
  std::optional<int> pick_first(const puzzlehub::MemoryGame& game);
  std::optional<int> pick_second(const puzzlehub::MemoryGame& game, int first);

  void observe(int index, int symbol);
  void forget(int index);

private:
  std::optional<int> known_pair_start(const puzzlehub::MemoryGame& game) const;
  std::optional<int> lowest_unseen(const puzzlehub::MemoryGame& game, int except) const;

  std::map<int, int> seen_; // card index -> symbol
};

} // namespace puzzlehub_ai
