#include <cassert>
#include <string>
#include "aeon/board.hpp"
#include "aeon/placement.hpp"


int main() {
using namespace aeon;

// Round-trip and orientation: first rank in the text is the top of the board
{
  Board b = board_from_placement(0, 0, "k2/3/K2");
  assert(b.width() == 3 && b.height() == 3);
  assert(b.get(0, 2) == (Piece{PieceKind::King, Color::Black}));
  assert(b.get(0, 0) == (Piece{PieceKind::King, Color::White}));
  assert(to_placement(b) == "k2/3/K2");
}

// Variant pieces and wide boards
{
  Board b = board_from_placement(-1, 3, "4/PpUd/4/S2y");
  assert(b.l() == -1 && b.t() == 3);
  assert(b.get(2, 2) == (Piece{PieceKind::Unicorn, Color::White}));
  assert(b.get(3, 2) == (Piece{PieceKind::Dragon, Color::Black}));
  assert(b.get(0, 0) == (Piece{PieceKind::Princess, Color::White}));
  assert(b.get(3, 0) == (Piece{PieceKind::RoyalQueen, Color::Black}));
  assert(to_placement(b) == "4/PpUd/4/S2y");

  Board w = board_from_placement(0, 0, "12/11C");
  assert(w.width() == 12 && w.height() == 2);
  assert(w.get(11, 0) == (Piece{PieceKind::CommonKing, Color::White}));
  assert(to_placement(w) == "12/11C");
}

// Malformed text
{
  bool threw = false;
  try { board_from_placement(0, 0, "k2/4"); } catch (const PlacementError&) { threw = true; }
  assert(threw);

  threw = false;
  try { board_from_placement(0, 0, "x2"); } catch (const PlacementError&) { threw = true; }
  assert(threw);

  threw = false;
  try { board_from_placement(0, 0, "3//3"); } catch (const PlacementError&) { threw = true; }
  assert(threw);

  // Runs that would not fit any sensible rank are refused before anything is allocated
  threw = false;
  try { board_from_placement(0, 0, "99999999999K"); } catch (const PlacementError&) { threw = true; }
  assert(threw);

  threw = false;
  try { board_from_placement(0, 0, "4000/4000P100"); } catch (const PlacementError&) { threw = true; }
  assert(threw);
}

return 0;
}
