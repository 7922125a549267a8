#include "aeon/game.hpp"

#include <algorithm>
#include <cassert>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace aeon {

const TimelineInfo* GameInfo::timeline(Layer l) const {
  auto it = timelines_.find(l);
  return it == timelines_.end() ? nullptr : &it->second;
}

Layer GameInfo::min_layer() const {
  return timelines_.empty() ? 0 : timelines_.begin()->first;
}

Layer GameInfo::max_layer() const {
  return timelines_.empty() ? 0 : timelines_.rbegin()->first;
}

bool GameInfo::is_active(Layer l) const {
  const int white = std::max(0, max_layer());
  const int black = std::max(0, -min_layer());
  return l >= -std::min(black, white + 1) && l <= std::min(white, black + 1);
}

Time GameInfo::present() const {
  Time p = std::numeric_limits<Time>::max();
  for (const auto& [l, tl] : timelines_) {
    if (is_active(l)) p = std::min(p, tl.last);
  }
  return p == std::numeric_limits<Time>::max() ? 0 : p;
}

void GameInfo::add_timeline(Layer l, Time first, Layer parent) {
  assert(timelines_.find(l) == timelines_.end());
  timelines_.emplace(l, TimelineInfo{l, first, first, parent});
}

void GameInfo::advance(Layer l, Time last) {
  auto it = timelines_.find(l);
  assert(it != timelines_.end());
  assert(last > it->second.last);
  it->second.last = last;
}

Game::Game(int width, int height) : width_(width), height_(height) {
  if (width <= 0 || height <= 0) throw std::invalid_argument("board dimensions must be positive");
}

void Game::add_board(Board b) {
  const Layer l = b.l();
  add_board(std::move(b), l);
}

void Game::add_board(Board b, Layer parent) {
  if (b.width() != width_ || b.height() != height_)
    throw std::invalid_argument("board dimensions do not match the game");

  const Layer l = b.l();
  const Time t = b.t();
  const TimelineInfo* tl = info_.timeline(l);
  if (!tl) {
    info_.add_timeline(l, t, parent);
  } else {
    if (t != tl->last + 1)
      throw std::invalid_argument("board (" + std::to_string(l) + ", " + std::to_string(t) +
                                  ") does not follow timeline end " + std::to_string(tl->last));
    info_.advance(l, t);
  }
  boards_[l].push_back(std::make_unique<const Board>(std::move(b)));
}

const Board* Game::get_board(Layer l, Time t) const {
  const TimelineInfo* tl = info_.timeline(l);
  if (!tl || t < tl->first || t > tl->last) return nullptr;
  const auto& line = boards_.at(l);
  return line[static_cast<std::size_t>(t - tl->first)].get();
}

} // namespace aeon
