#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "aeon/game.hpp"
#include "aeon/move.hpp"
#include "aeon/partial_game.hpp"
#include "aeon/rules.hpp"
#include "aeon/types.hpp"

namespace aeon {

struct PiecePosition;

// Lazy, one-shot sequence of the moves of one piece. Borrows the overlay it was made from.
class PieceMoveIter {
public:
  std::optional<Move> next();

private:
  friend struct PiecePosition;
  PieceMoveIter(const PartialGame& pg, Piece piece, Coords from);

  const PartialGame* pg_;
  Piece piece_;
  Coords from_;
  const std::vector<Step>* steps_;
  std::size_t step_ = 0;
  int dist_ = 1;                    // rider distance along the current step
  std::optional<Move> promoting_;   // pawn move still to be emitted per promotion kind
  std::size_t promo_ = 0;
};

struct PiecePosition {
  using Iter = PieceMoveIter;

  Piece piece{};
  Coords coords{};

  // nullopt if the overlay no longer holds `piece` on `coords`.
  std::optional<PieceMoveIter> generate_moves(const Game& game, const PartialGame& pg) const;

  // Same answer as searching generate_moves() for `mv`, without walking unrelated steps.
  bool validate_move(const Game& game, const PartialGame& pg, const Move& mv) const;
};

} // namespace aeon
