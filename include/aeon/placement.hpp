#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "aeon/board.hpp"

namespace aeon {

struct PlacementError : std::runtime_error { using std::runtime_error::runtime_error; };

// FEN-style piece placement for a single board: ranks from the top, '/' between ranks,
// digits for runs of empty squares. Letters: P N B R Q K U(nicorn) D(ragon) S (princess)
// C (common king) Y (royal queen); upper case is White.
Board board_from_placement(Layer l, Time t, std::string_view placement);
std::string to_placement(const Board& b);

char piece_to_char(Piece p);
Piece char_to_piece(char c);   // empty piece for unknown letters

} // namespace aeon
