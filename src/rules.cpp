#include "aeon/rules.hpp"

#include <array>
#include <cassert>
#include <cstdlib>

namespace aeon {

// Every direction built from `axes` non-zero unit components (1..4), in (l, t, x, y) order.
static std::vector<Vec4> slides(int axes) {
  std::vector<Vec4> out;
  for (int dl = -1; dl <= 1; ++dl)
  for (int dt = -1; dt <= 1; ++dt)
  for (int dx = -1; dx <= 1; ++dx)
  for (int dy = -1; dy <= 1; ++dy) {
    const int n = (dl != 0) + (dt != 0) + (dx != 0) + (dy != 0);
    if (n == axes) out.push_back(Vec4{dl, dt, dx, dy});
  }
  return out;
}

static std::vector<Vec4> knight_jumps() {
  std::vector<Vec4> out;
  for (int dl = -2; dl <= 2; ++dl)
  for (int dt = -2; dt <= 2; ++dt)
  for (int dx = -2; dx <= 2; ++dx)
  for (int dy = -2; dy <= 2; ++dy) {
    const int a[4] = {std::abs(dl), std::abs(dt), std::abs(dx), std::abs(dy)};
    int ones = 0, twos = 0;
    for (int v : a) { ones += (v == 1); twos += (v == 2); }
    if (ones == 1 && twos == 1) out.push_back(Vec4{dl, dt, dx, dy});
  }
  return out;
}

static void append(std::vector<Step>& out, const std::vector<Vec4>& dirs, bool rider) {
  for (const Vec4& d : dirs) out.push_back(Step{d, rider, StepMode::Any, false});
}

static std::vector<Step> pawn_steps(Color c) {
  const int fy = (c == Color::White) ? +1 : -1;
  const int fl = (c == Color::White) ? -1 : +1;
  return {
    Step{Vec4{0, 0, 0, fy},      false, StepMode::QuietOnly,   false},
    Step{Vec4{0, 0, 0, 2 * fy},  false, StepMode::QuietOnly,   true},
    Step{Vec4{fl, 0, 0, 0},      false, StepMode::QuietOnly,   false},
    Step{Vec4{0, 0, -1, fy},     false, StepMode::CaptureOnly, false},
    Step{Vec4{0, 0, +1, fy},     false, StepMode::CaptureOnly, false},
    Step{Vec4{fl, -1, 0, 0},     false, StepMode::CaptureOnly, false},
    Step{Vec4{fl, +1, 0, 0},     false, StepMode::CaptureOnly, false},
  };
}

using StepTable = std::array<std::array<std::vector<Step>, COLOR_N>, KIND_N>;

static StepTable build_table() {
  StepTable table;
  const auto rook = slides(1), bishop = slides(2), unicorn = slides(3), dragon = slides(4);
  for (int c = 0; c < COLOR_N; ++c) {
    auto at = [&](PieceKind k) -> std::vector<Step>& {
      return table[static_cast<std::size_t>(k)][static_cast<std::size_t>(c)];
    };

    at(PieceKind::Pawn) = pawn_steps(static_cast<Color>(c));
    append(at(PieceKind::Knight), knight_jumps(), false);
    append(at(PieceKind::Bishop), bishop, true);
    append(at(PieceKind::Rook), rook, true);
    append(at(PieceKind::Unicorn), unicorn, true);
    append(at(PieceKind::Dragon), dragon, true);
    append(at(PieceKind::Princess), rook, true);
    append(at(PieceKind::Princess), bishop, true);

    for (PieceKind k : {PieceKind::Queen, PieceKind::RoyalQueen, PieceKind::King, PieceKind::CommonKing}) {
      const bool rider = (k == PieceKind::Queen || k == PieceKind::RoyalQueen);
      append(at(k), rook, rider);
      append(at(k), bishop, rider);
      append(at(k), unicorn, rider);
      append(at(k), dragon, rider);
    }
  }
  return table;
}


const std::vector<Step>& steps_for(Piece p) {
  static const StepTable table = build_table();
  assert(!p.empty());
  return table[static_cast<std::size_t>(p.kind)][static_cast<std::size_t>(p.color)];
}

bool is_royal(PieceKind k) {
  return k == PieceKind::King || k == PieceKind::RoyalQueen;
}

} // namespace aeon
