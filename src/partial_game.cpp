#include "aeon/partial_game.hpp"

#include <cassert>
#include <utility>

namespace aeon {

PartialGame::PartialGame(const Game& game, const PartialGame* parent, GameInfo info)
    : game_(&game), parent_(parent), info_(std::move(info)) {}

void PartialGame::insert(Board b) {
  const auto key = std::make_pair(b.l(), b.t());
  assert(boards_.find(key) == boards_.end());
  boards_.emplace(key, std::make_unique<const Board>(std::move(b)));
}

const Board* PartialGame::get_board(Layer l, Time t) const {
  for (const PartialGame* pg = this; pg; pg = pg->parent_) {
    auto it = pg->boards_.find(std::make_pair(l, t));
    if (it != pg->boards_.end()) return it->second.get();
  }
  return game_->get_board(l, t);
}

std::vector<const Board*> PartialGame::own_boards() const {
  std::vector<const Board*> out;
  const Color us = info_.active_player();
  for (const auto& [l, tl] : info_.timelines()) {
    if (!info_.is_active(l) || to_move_at(tl.last) != us) continue;
    const Board* b = get_board(l, tl.last);
    assert(b);
    out.push_back(b);
  }
  return out;
}

std::vector<const Board*> PartialGame::playable_boards(Color c) const {
  std::vector<const Board*> out;
  for (const auto& [l, tl] : info_.timelines()) {
    if (to_move_at(tl.last) != c) continue;
    const Board* b = get_board(l, tl.last);
    assert(b);
    out.push_back(b);
  }
  return out;
}

PartialGame no_partial_game(const Game& game) {
  return PartialGame(game, nullptr, game.info());
}

} // namespace aeon
