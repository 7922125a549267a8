#include "aeon/board_gen.hpp"

#include <cassert>

namespace aeon {

BoardMoveIter::BoardMoveIter(const Game& game, const PartialGame& pg, const Board& board)
    : game_(&game), pg_(&pg), board_(&board) {}

std::optional<Move> BoardMoveIter::next() {
  const Color us = board_->to_move();
  const int n = board_->size();

  while (index_ < n) {
    if (current_) {
      if (auto m = current_->next()) return m;
      current_.reset();
      ++index_;
      continue;
    }

    while (index_ < n && !board_->at(index_).is_of(us)) ++index_;
    if (index_ >= n) break;

    const PiecePosition pos{board_->at(index_),
                            Coords{board_->l(), board_->t(), index_ % board_->width(), index_ / board_->width()}};
    current_ = pos.generate_moves(*game_, *pg_);
    assert(current_ && "board square lost its piece");
  }
  return std::nullopt;
}

std::optional<BoardMoveIter> BoardMoves::generate_moves(const Game& game, const PartialGame& pg) const {
  if (!board || pg.get_board(board->l(), board->t()) != board) return std::nullopt;
  return BoardMoveIter(game, pg, *board);
}

bool BoardMoves::validate_move(const Game& game, const PartialGame& pg, const Move& mv) const {
  if (!board || mv.from.l != board->l() || mv.from.t != board->t()) return false;
  if (!board->in_bounds(mv.from.x, mv.from.y)) return false;
  const Piece p = board->get(mv.from.x, mv.from.y);
  if (!p.is_of(board->to_move())) return false;
  return PiecePosition{p, mv.from}.validate_move(game, pg, mv);
}

} // namespace aeon
