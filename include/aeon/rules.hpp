#pragma once
#include <cstdint>
#include <vector>
#include "aeon/types.hpp"

namespace aeon {

// 4D displacement. `t` counts full turns: one unit moves the piece two half-turns.
struct Vec4 {
  int l = 0;
  int t = 0;
  int x = 0;
  int y = 0;
};

enum class StepMode : std::uint8_t {
  Any,          // quiet move or capture
  QuietOnly,    // target must be empty (pawn pushes)
  CaptureOnly   // target must hold an enemy piece (pawn captures)
};

struct Step {
  Vec4 d{};
  bool rider = false;        // repeat until blocked
  StepMode mode = StepMode::Any;
  bool double_push = false;  // pawn's first move; needs the square in between free
};

// Ordered step table for a piece; generation order follows it.
const std::vector<Step>& steps_for(Piece p);

// Capturing one of these ends the game, so leaving one attacked is illegal.
bool is_royal(PieceKind k);

// Last rank for `c`'s pawns on a board of `height` ranks.
inline int promotion_rank(Color c, int height) { return c == Color::White ? height - 1 : 0; }
inline int pawn_start_rank(Color c, int height) { return c == Color::White ? 1 : height - 2; }

inline constexpr PieceKind PROMOTIONS[4] = {
  PieceKind::Queen, PieceKind::Rook, PieceKind::Bishop, PieceKind::Knight
};

} // namespace aeon
