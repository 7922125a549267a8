#include <cassert>
#include <vector>
#include "aeon/board_gen.hpp"
#include "aeon/cache.hpp"
#include "aeon/game.hpp"
#include "aeon/partial_game.hpp"
#include "aeon/placement.hpp"

int main() {
  using namespace aeon;

  // Lone king in the middle of a 3x1 board: two destinations, left first
  {
    Game g(3, 1);
    g.add_board(board_from_placement(0, 0, "1K1"));
    const PartialGame pg = no_partial_game(g);
    const Board* b = g.get_board(0, 0);

    auto it = BoardMoves{b}.generate_moves(g, pg);
    assert(it);
    std::vector<Move> seq;
    while (auto m = it->next()) seq.push_back(*m);
    assert(seq.size() == 2);
    assert(seq[0].to == (Coords{0, 0, 0, 0}));
    assert(seq[1].to == (Coords{0, 0, 2, 0}));

    // The cache hands out the second move without the first being asked for
    auto cache = cache_moves(BoardMoves{b}, g, pg);
    assert(cache);
    auto second = cache->get(1);
    assert(second && *second == seq[1]);
    assert(cache->get_cached(0) && *cache->get_cached(0) == seq[0]);
    assert(!cache->get(2));
  }

  // Corner of 2x2
  {
    Game g(2, 2);
    g.add_board(board_from_placement(0, 0, "2/K1"));
    const PartialGame pg = no_partial_game(g);
    auto it = BoardMoves{g.get_board(0, 0)}.generate_moves(g, pg);
    int n = 0;
    while (it->next()) ++n;
    assert(n == 3);
  }

  // Capturing the enemy king is generated; that is how checks are seen
  {
    Game g(3, 1);
    g.add_board(board_from_placement(0, 0, "Kk1"));
    const PartialGame pg = no_partial_game(g);
    auto it = BoardMoves{g.get_board(0, 0)}.generate_moves(g, pg);
    auto m = it->next();
    assert(m && m->captured == (Piece{PieceKind::King, Color::Black}));
    assert(!it->next());
  }

  // Kings step once along any mix of axes, including to the previous turn
  {
    Game g(3, 3);
    g.add_board(board_from_placement(0, 0, "3/3/3"));
    g.add_board(board_from_placement(0, 1, "3/3/3"));
    g.add_board(board_from_placement(0, 2, "3/1K1/3"));
    const PartialGame pg = no_partial_game(g);
    auto it = BoardMoves{g.get_board(0, 2)}.generate_moves(g, pg);
    int on_board = 0, back = 0;
    while (auto m = it->next()) {
      if (m->changes_board()) { ++back; assert(m->to.t == 0); }
      else ++on_board;
    }
    assert(on_board == 8);
    assert(back == 9);
  }

  return 0;
}
