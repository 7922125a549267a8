#pragma once
#include "aeon/types.hpp"


namespace aeon {


struct Move {
  Piece piece{};                       // piece being moved
  Coords from{};
  Coords to{};
  Piece captured{};                    // empty unless the move captures
  PieceKind promotion{PieceKind::None};

  bool is_capture() const { return !captured.empty(); }
  // True if the piece leaves its own board (across time or timelines).
  bool changes_board() const { return from.l != to.l || from.t != to.t; }

  bool operator==(const Move&) const = default;
};


} // namespace aeon
