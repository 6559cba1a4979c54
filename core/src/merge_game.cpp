#include "puzzlehub/merge_game.hpp"

namespace puzzlehub {

MergeGame::MergeGame() {
  previous_board_ = board_;
}

MergeGame::MergeGame(RandomSource& random) {
  restart(random);
}

void MergeGame::restart(RandomSource& random) {
  board_ = MergeRules::new_grid(random);
  previous_board_ = board_;
  score_ = 0;
  previous_score_ = 0;
  has_undo_ = false;
  game_over_ = false;
  moves_ = 0;
}

void MergeGame::reset_best(RandomSource& random) {
  restart(random);
  best_score_ = 0;
}

bool MergeGame::move(Direction dir, RandomSource& random) {
  if (game_over_) return false;

  MoveResult result = MergeRules::apply_move(board_, dir);
  if (!result.changed) return false;

  MergeRules::spawn_random_tile(result.grid, random);

  previous_board_ = board_;
  previous_score_ = score_;
  has_undo_ = true;

  board_ = result.grid;
  score_ += result.points_gained;
  if (score_ > best_score_) best_score_ = score_;
  ++moves_;

  // the spawned tile may have filled the last gap
  game_over_ = !MergeRules::has_any_legal_move(board_);
  return true;
}

bool MergeGame::undo() {
  if (!has_undo_) return false;
  board_ = previous_board_;
  score_ = previous_score_;
  has_undo_ = false;
  game_over_ = false;
  if (moves_ > 0) --moves_;
  return true;
}

void MergeGame::restore(const MergeGrid& board, Score score, Score best_score) {
  MergeRules::validate_grid(board);
  board_ = board;
  previous_board_ = board;
  score_ = score < 0 ? 0 : score;
  previous_score_ = 0;
  best_score_ = best_score < score_ ? score_ : best_score;
  has_undo_ = false;
  moves_ = 0;
  game_over_ = !MergeRules::has_any_legal_move(board_);
}

} // namespace puzzlehub
