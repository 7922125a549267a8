#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "aeon/board.hpp"
#include "aeon/board_gen.hpp"
#include "aeon/cache.hpp"
#include "aeon/game.hpp"
#include "aeon/moveset.hpp"
#include "aeon/partial_game.hpp"

namespace aeon {

struct LegalTurn {
  Moveset moveset;
  PartialGame result;   // parent is the overlay the enumerator was built on
};

// Walks the Cartesian product of the boards' move lists like an odometer: one digit per
// board, the last board varies fastest. Move lists are discovered lazily through a cache
// per board. Candidates only pass the board-accounting check; king safety is left to
// Moveset::generate_partial_game (or next_legal()).
class GenMovesetIter {
public:
  GenMovesetIter(std::vector<const Board*> own_boards, const Game& game, const PartialGame& pg);

  std::optional<Validated<Moveset>> next();

  // Next candidate that also survives generate_partial_game, with its resulting overlay.
  std::optional<LegalTurn> next_legal();

private:
  bool advance();

  const Game* game_;
  const PartialGame* pg_;
  std::vector<CacheMoves<BoardMoveIter>> digits_;
  std::vector<std::size_t> cursors_;
  bool started_ = false;
  bool done_ = false;
};

} // namespace aeon
