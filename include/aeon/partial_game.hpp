#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <utility>
#include <vector>

#include "aeon/board.hpp"
#include "aeon/game.hpp"

namespace aeon {

class Moveset;

// Speculative state of the boards in play for one turn, layered over a Game.
// Boards are looked up in this overlay, then its parent chain, then the Game.
// The Game and the parent must outlive the overlay and must not move while it exists.
class PartialGame {
public:
  PartialGame(PartialGame&&) = default;
  PartialGame& operator=(PartialGame&&) = default;

  const Board* get_board(Layer l, Time t) const;
  const GameInfo& info() const { return info_; }
  const Game& game() const { return *game_; }
  const PartialGame* parent() const { return parent_; }

  // Newest board of every active timeline that waits on the active player, by timeline.
  std::vector<const Board*> own_boards() const;

  // Newest board of every timeline that waits on `c`.
  std::vector<const Board*> playable_boards(Color c) const;

  // Boards produced by this overlay (not its parents), keyed by (l, t).
  const std::map<std::pair<Layer, Time>, std::unique_ptr<const Board>>& boards() const {
    return boards_;
  }

private:
  friend PartialGame no_partial_game(const Game& game);
  friend class Moveset;

  PartialGame(const Game& game, const PartialGame* parent, GameInfo info);
  void insert(Board b);

  const Game* game_;
  const PartialGame* parent_;
  GameInfo info_;
  std::map<std::pair<Layer, Time>, std::unique_ptr<const Board>> boards_;
};

// Baseline overlay: no tentative moves, every board served by the Game.
PartialGame no_partial_game(const Game& game);

} // namespace aeon
