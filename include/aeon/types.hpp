#pragma once
#include <cstdint>


namespace aeon {


using Layer = int; // timeline index, negative for Black-created timelines
using Time = int;  // half-turn index, even = White to move


enum class Color : int { White = 0, Black = 1 };


enum class PieceKind : int {
  Pawn = 0, Knight = 1, Bishop = 2, Rook = 3, Queen = 4, King = 5,
  Unicorn = 6, Dragon = 7, Princess = 8, CommonKing = 9, RoyalQueen = 10,
  None = 11
};


constexpr int COLOR_N = 2;
constexpr int KIND_N = 11; // without None


struct Piece {
  PieceKind kind{PieceKind::None};
  Color color{Color::White};

  bool empty() const { return kind == PieceKind::None; }
  bool is_of(Color c) const { return !empty() && color == c; }
  bool operator==(const Piece&) const = default;
};


struct Coords {
  Layer l{0};
  Time t{0};
  int x{0};
  int y{0};

  bool operator==(const Coords&) const = default;
};


inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }
inline constexpr Color to_move_at(Time t) { return (t & 1) ? Color::Black : Color::White; }


} // namespace aeon
