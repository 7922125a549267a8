#include "aeon/piece_gen.hpp"

#include <cassert>
#include <iterator>

namespace aeon {

struct Landing {
  bool has_move = false;
  bool stop = true;   // the ray ends here
  Move move{};
};

static const Board* reach(const PartialGame& pg, const Coords& from, const Vec4& d, int k, Coords& to) {
  to = Coords{from.l + d.l * k, from.t + 2 * d.t * k, from.x + d.x * k, from.y + d.y * k};
  const Board* b = pg.get_board(to.l, to.t);
  if (!b || !b->in_bounds(to.x, to.y)) return nullptr;
  return b;
}

static bool double_push_allowed(const PartialGame& pg, Piece piece, const Coords& from, const Step& s) {
  const Board* src = pg.get_board(from.l, from.t);
  if (!src || from.y != pawn_start_rank(piece.color, src->height())) return false;
  const Vec4 half{s.d.l / 2, s.d.t / 2, s.d.x / 2, s.d.y / 2};
  Coords mid;
  const Board* b = reach(pg, from, half, 1, mid);
  return b && b->get(mid.x, mid.y).empty();
}

// Evaluates the k-th square along step `s`.
static Landing land(const PartialGame& pg, Piece piece, const Coords& from, const Step& s, int k) {
  Landing out;
  Coords to;
  const Board* b = reach(pg, from, s.d, k, to);
  if (!b) return out;

  const Piece occ = b->get(to.x, to.y);
  if (occ.is_of(piece.color)) return out;
  if (occ.empty() && s.mode == StepMode::CaptureOnly) return out;
  if (!occ.empty() && s.mode == StepMode::QuietOnly) return out;
  if (s.double_push && !double_push_allowed(pg, piece, from, s)) return out;

  out.has_move = true;
  out.move = Move{piece, from, to, occ, PieceKind::None};
  out.stop = !occ.empty() || !s.rider;
  return out;
}

static bool promotes(const PartialGame& pg, const Move& m) {
  if (m.piece.kind != PieceKind::Pawn) return false;
  const Board* b = pg.get_board(m.to.l, m.to.t);
  return b && m.to.y == promotion_rank(m.piece.color, b->height());
}

// Positive k with delta == k * d, or 0.
static int step_multiple(const Vec4& d, const Vec4& delta) {
  const int dc[4] = {d.l, d.t, d.x, d.y};
  const int dv[4] = {delta.l, delta.t, delta.x, delta.y};
  int k = 0;
  for (int i = 0; i < 4; ++i) {
    if (dc[i] == 0) {
      if (dv[i] != 0) return 0;
      continue;
    }
    if (dv[i] % dc[i] != 0) return 0;
    const int q = dv[i] / dc[i];
    if (q <= 0 || (k != 0 && q != k)) return 0;
    k = q;
  }
  return k;
}

static bool holds(const PartialGame& pg, Piece piece, const Coords& at) {
  const Board* b = pg.get_board(at.l, at.t);
  return b && b->in_bounds(at.x, at.y) && b->get(at.x, at.y) == piece;
}


PieceMoveIter::PieceMoveIter(const PartialGame& pg, Piece piece, Coords from)
    : pg_(&pg), piece_(piece), from_(from), steps_(&steps_for(piece)) {}

std::optional<Move> PieceMoveIter::next() {
  while (true) {
    if (promoting_) {
      if (promo_ < std::size(PROMOTIONS)) {
        Move m = *promoting_;
        m.promotion = PROMOTIONS[promo_++];
        return m;
      }
      promoting_.reset();
    }

    if (step_ >= steps_->size()) return std::nullopt;

    const Landing l = land(*pg_, piece_, from_, (*steps_)[step_], dist_);
    if (l.stop) { ++step_; dist_ = 1; }
    else ++dist_;

    if (!l.has_move) continue;
    if (promotes(*pg_, l.move)) {
      promoting_ = l.move;
      promo_ = 0;
      continue;
    }
    return l.move;
  }
}

std::optional<PieceMoveIter> PiecePosition::generate_moves(const Game& game, const PartialGame& pg) const {
  assert(&pg.game() == &game);
  (void)game;
  if (piece.empty() || !holds(pg, piece, coords)) return std::nullopt;
  return PieceMoveIter(pg, piece, coords);
}

bool PiecePosition::validate_move(const Game& game, const PartialGame& pg, const Move& mv) const {
  assert(&pg.game() == &game);
  (void)game;
  if (mv.piece != piece || mv.from != coords) return false;
  if (piece.empty() || !holds(pg, piece, coords)) return false;

  const int dt = mv.to.t - mv.from.t;
  if (dt % 2 != 0) return false;
  const Vec4 delta{mv.to.l - mv.from.l, dt / 2, mv.to.x - mv.from.x, mv.to.y - mv.from.y};

  for (const Step& s : steps_for(piece)) {
    const int k = step_multiple(s.d, delta);
    if (k == 0 || (k > 1 && !s.rider)) continue;

    bool clear = true;
    for (int i = 1; i < k && clear; ++i) {
      const Landing l = land(pg, piece, coords, s, i);
      clear = l.has_move && !l.stop;
    }
    if (!clear) continue;

    const Landing l = land(pg, piece, coords, s, k);
    if (!l.has_move) continue;

    Move m = l.move;
    if (promotes(pg, m)) {
      for (PieceKind p : PROMOTIONS) {
        m.promotion = p;
        if (m == mv) return true;
      }
    } else if (m == mv) {
      return true;
    }
  }
  return false;
}

} // namespace aeon
