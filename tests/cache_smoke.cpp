#include <cassert>
#include <cstddef>
#include <vector>
#include "aeon/cache.hpp"
#include "aeon/game.hpp"
#include "aeon/partial_game.hpp"
#include "aeon/piece_gen.hpp"
#include "aeon/placement.hpp"

int main() {
  using namespace aeon;

  Game g(4, 4);
  g.add_board(board_from_placement(0, 0, "4/4/4/R3"));
  const PartialGame pg = no_partial_game(g);
  const PiecePosition rook{Piece{PieceKind::Rook, Color::White}, Coords{0, 0, 0, 0}};

  std::vector<Move> all;
  {
    auto it = rook.generate_moves(g, pg);
    while (auto m = it->next()) all.push_back(*m);
  }
  assert(all.size() == 6);

  // next() mirrors the sequence and the cache keeps it in order
  {
    auto cache = cache_moves(rook, g, pg);
    assert(cache);
    const std::size_t k = 3;
    for (std::size_t i = 0; i < k; ++i) {
      auto m = cache->next();
      assert(m && *m == all[i]);
    }
    for (std::size_t i = 0; i < k; ++i) assert(*cache->get_cached(i) == all[i]);
    assert(!cache->get_cached(k));

    // Cached lookups: no false positives, later moves not seen yet
    for (std::size_t i = 0; i < all.size(); ++i) assert(cache->validate_move_cached(all[i]) == (i < k));

    // Full lookup drains just far enough
    assert(cache->validate_move(all[4]));
    assert(cache->cache().size() == 5);
    assert(!cache->exhausted());
  }

  // get() drains on demand; out of range stays absent after exhaustion
  {
    auto cache = cache_moves(rook, g, pg);
    assert(*cache->get(5) == all[5]);
    assert(cache->cache().size() == 6);
    assert(!cache->get(6));
    assert(cache->exhausted());
    assert(!cache->next());
    assert(!cache->get(6));
    assert(cache->cache() == all);
  }

  // A move that never appears drains everything and is rejected
  {
    auto cache = cache_moves(rook, g, pg);
    Move bogus = all[0];
    bogus.to = Coords{0, 0, 3, 3};
    assert(!cache->validate_move(bogus));
    assert(cache->exhausted());
    assert(cache->cache().size() == all.size());
  }

  // Stale generator: no decorator
  {
    const PiecePosition gone{Piece{PieceKind::Rook, Color::White}, Coords{0, 0, 1, 1}};
    assert(!cache_moves(gone, g, pg));
  }

  return 0;
}
