#include <cassert>
#include <string>
#include <vector>
#include "aeon/board_gen.hpp"
#include "aeon/game.hpp"
#include "aeon/partial_game.hpp"
#include "aeon/piece_gen.hpp"
#include "aeon/placement.hpp"

using namespace aeon;

static std::vector<Move> drain(std::optional<BoardMoveIter> it) {
  assert(it);
  std::vector<Move> out;
  while (auto m = it->next()) out.push_back(*m);
  return out;
}

int main() {
  // Board sequence == piece sequences of the side to move, chained in square order
  {
    Game g(4, 4);
    g.add_board(board_from_placement(0, 0, "r2k/1P2/2N1/K2b"));
    const PartialGame pg = no_partial_game(g);
    const Board* b = g.get_board(0, 0);

    std::vector<Move> expected;
    for (int idx = 0; idx < b->size(); ++idx) {
      const Piece p = b->at(idx);
      if (!p.is_of(b->to_move())) continue;
      auto it = PiecePosition{p, Coords{0, 0, idx % b->width(), idx / b->width()}}.generate_moves(g, pg);
      assert(it);
      while (auto m = it->next()) expected.push_back(*m);
    }

    const std::vector<Move> got = drain(BoardMoves{b}.generate_moves(g, pg));
    assert(!got.empty());
    assert(got == expected);
    for (const Move& m : got) {
      assert(m.piece.color == Color::White);
      assert(b->get(m.from.x, m.from.y) == m.piece);
    }
    for (std::size_t i = 0; i < got.size(); ++i)
      for (std::size_t j = i + 1; j < got.size(); ++j) assert(!(got[i] == got[j]));

    const Piece N{PieceKind::Knight, Color::White};
    const Piece B{PieceKind::Bishop, Color::Black};
    assert(BoardMoves{b}.validate_move(g, pg, Move{N, Coords{0, 0, 2, 1}, Coords{0, 0, 0, 2}, Piece{}, PieceKind::None}));
    assert(!BoardMoves{b}.validate_move(g, pg, Move{B, Coords{0, 0, 3, 0}, Coords{0, 0, 2, 1}, N, PieceKind::None}));
    // source on another board
    assert(!BoardMoves{b}.validate_move(g, pg, Move{N, Coords{0, 2, 2, 1}, Coords{0, 2, 0, 2}, Piece{}, PieceKind::None}));
  }

  // Black's board only yields Black's moves
  {
    Game g(4, 4);
    g.add_board(board_from_placement(0, 1, "r2k/1P2/2N1/K2b"));
    const PartialGame pg = no_partial_game(g);
    for (const Move& m : drain(BoardMoves{g.get_board(0, 1)}.generate_moves(g, pg)))
      assert(m.piece.color == Color::Black);
  }

  // A huge, almost empty board walks its squares in a loop
  {
    std::string placement;
    for (int r = 0; r < 63; ++r) placement += "64/";
    placement += "63K";
    Game g(64, 64);
    g.add_board(board_from_placement(0, 0, placement));
    const PartialGame pg = no_partial_game(g);
    assert(drain(BoardMoves{g.get_board(0, 0)}.generate_moves(g, pg)).size() == 3);
  }

  // A board that is not the overlay's board at its address is stale
  {
    Game g(4, 4);
    g.add_board(board_from_placement(0, 0, "r2k/1P2/2N1/K2b"));
    const PartialGame pg = no_partial_game(g);
    const Board copy = *g.get_board(0, 0);
    assert(!(BoardMoves{&copy}.generate_moves(g, pg)));
    assert(BoardMoves{g.get_board(0, 0)}.generate_moves(g, pg).has_value());
  }

  return 0;
}
