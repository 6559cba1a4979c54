#pragma once
#include "puzzlehub/grid.hpp"
#include "puzzlehub/merge_rules.hpp"
#include "puzzlehub/random_source.hpp"
#include "puzzlehub/types.hpp"

namespace puzzlehub {

// Score bookkeeping and single-step undo around MergeRules.
class MergeGame {
public:
  MergeGame();
  explicit MergeGame(RandomSource& random);

  void restart(RandomSource& random);
  void reset_best(RandomSource& random);

  // Applies `dir`; on a change spawns one tile and updates scores.
  // Returns false when the move was ignored.
  bool move(Direction dir, RandomSource& random);

  bool undo();
  bool can_undo() const { return has_undo_; }

  void restore(const MergeGrid& board, Score score, Score best_score);

  const MergeGrid& board() const { return board_; }
  Score score() const { return score_; }
  Score best_score() const { return best_score_; }
  bool game_over() const { return game_over_; }
  int moves() const { return moves_; }

private:
  MergeGrid board_;
  MergeGrid previous_board_;
  Score score_ = 0;
  Score previous_score_ = 0;
  Score best_score_ = 0;
  bool has_undo_ = false;
  bool game_over_ = false;
  int moves_ = 0;
};

} // namespace puzzlehub
