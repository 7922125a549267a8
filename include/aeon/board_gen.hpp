#pragma once

#include <optional>

#include "aeon/board.hpp"
#include "aeon/game.hpp"
#include "aeon/move.hpp"
#include "aeon/partial_game.hpp"
#include "aeon/piece_gen.hpp"

namespace aeon {

struct BoardMoves;

// Moves of every piece of the side to move on one board, square index ascending.
class BoardMoveIter {
public:
  std::optional<Move> next();

private:
  friend struct BoardMoves;
  BoardMoveIter(const Game& game, const PartialGame& pg, const Board& board);

  const Game* game_;
  const PartialGame* pg_;
  const Board* board_;
  int index_ = 0;
  std::optional<PieceMoveIter> current_;
};

struct BoardMoves {
  using Iter = BoardMoveIter;

  const Board* board = nullptr;

  // nullopt if `board` is not the board the overlay holds at its (l, t).
  std::optional<BoardMoveIter> generate_moves(const Game& game, const PartialGame& pg) const;

  bool validate_move(const Game& game, const PartialGame& pg, const Move& mv) const;
};

} // namespace aeon
