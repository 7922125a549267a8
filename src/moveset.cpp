#include "aeon/moveset.hpp"

#include "aeon/attack.hpp"
#include "aeon/board_gen.hpp"

#include <set>
#include <utility>

namespace aeon {

static std::optional<MovesetValidityErr> check_boards(const std::vector<Move>& moves, const PartialGame& pg) {
  const GameInfo& info = pg.info();
  const Color us = info.active_player();
  std::set<std::pair<Layer, Time>> consumed;

  for (const Move& mv : moves) {
    const TimelineInfo* src = info.timeline(mv.from.l);
    if (!src || src->last != mv.from.t) return MovesetValidityErr::InconsistentTimeline;
    if (to_move_at(mv.from.t) != us || mv.piece.color != us) return MovesetValidityErr::IllegalMove;
    if (!consumed.emplace(mv.from.l, mv.from.t).second) return MovesetValidityErr::DuplicateOrMissingBoard;

    if (!mv.changes_board()) continue;
    const TimelineInfo* dst = info.timeline(mv.to.l);
    if (!dst || mv.to.t < dst->first || mv.to.t > dst->last) return MovesetValidityErr::InconsistentTimeline;
    // Landing on a timeline's newest board uses that board up; landing further back branches.
    if (mv.to.t == dst->last && !consumed.emplace(mv.to.l, mv.to.t).second)
      return MovesetValidityErr::DuplicateOrMissingBoard;
  }

  for (const Board* b : pg.own_boards()) {
    if (consumed.count(std::make_pair(b->l(), b->t())) == 0) return MovesetValidityErr::DuplicateOrMissingBoard;
  }
  return std::nullopt;
}

static Piece placed_piece(const Move& mv) {
  if (mv.promotion == PieceKind::None) return mv.piece;
  return Piece{mv.promotion, mv.piece.color};
}


const char* to_string(MovesetValidityErr err) {
  switch (err) {
    case MovesetValidityErr::DuplicateOrMissingBoard: return "duplicate or missing board";
    case MovesetValidityErr::IllegalMove:             return "illegal move";
    case MovesetValidityErr::KingInCheck:             return "king in check";
    case MovesetValidityErr::InconsistentTimeline:    return "inconsistent timeline";
  }
  return "unknown";
}

Validated<Moveset> Moveset::make(std::vector<Move> moves, const PartialGame& pg) {
  if (auto err = check_boards(moves, pg)) return *err;
  return Moveset(std::move(moves));
}

Validated<PartialGame> Moveset::generate_partial_game(const Game& game, const PartialGame& pg) const {
  if (auto err = check_boards(moves_, pg)) return *err;

  for (const Move& mv : moves_) {
    const Board* src = pg.get_board(mv.from.l, mv.from.t);
    if (!BoardMoves{src}.validate_move(game, pg, mv)) return MovesetValidityErr::IllegalMove;
  }

  const Color us = pg.info().active_player();
  PartialGame next(game, &pg, pg.info());

  for (const Move& mv : moves_) {
    const Board* src = pg.get_board(mv.from.l, mv.from.t);
    Board moved = src->relocated(mv.from.l, mv.from.t + 1);
    moved.clear(mv.from.x, mv.from.y);

    if (!mv.changes_board()) {
      moved.set(mv.to.x, mv.to.y, placed_piece(mv));
    } else {
      const Board* dst = pg.get_board(mv.to.l, mv.to.t);
      const TimelineInfo* dst_line = pg.info().timeline(mv.to.l);
      if (!dst || !dst_line) return MovesetValidityErr::InconsistentTimeline;

      Layer l = mv.to.l;
      if (dst_line->last == mv.to.t) {
        next.info_.advance(l, mv.to.t + 1);
      } else {
        l = (us == Color::White) ? next.info_.max_layer() + 1 : next.info_.min_layer() - 1;
        next.info_.add_timeline(l, mv.to.t + 1, mv.to.l);
      }
      Board landed = dst->relocated(l, mv.to.t + 1);
      landed.set(mv.to.x, mv.to.y, placed_piece(mv));
      next.insert(std::move(landed));
    }

    next.info_.advance(mv.from.l, mv.from.t + 1);
    next.insert(std::move(moved));
  }

  if (in_check(game, next, us)) return MovesetValidityErr::KingInCheck;
  return Validated<PartialGame>(std::move(next));
}

} // namespace aeon
