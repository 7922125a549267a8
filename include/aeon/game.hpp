#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

#include "aeon/board.hpp"
#include "aeon/types.hpp"

namespace aeon {

struct TimelineInfo {
  Layer index = 0;
  Time first = 0;       // half-turn of the first board
  Time last = 0;        // half-turn of the newest board
  Layer parent = 0;     // timeline branched from (== index for original timelines)
};

// Timeline bookkeeping shared by the game and every overlay.
class GameInfo {
public:
  const TimelineInfo* timeline(Layer l) const;
  const std::map<Layer, TimelineInfo>& timelines() const { return timelines_; }
  std::size_t len_timelines() const { return timelines_.size(); }

  Layer min_layer() const;
  Layer max_layer() const;

  // Timelines outside the balance window created by the other side are inactive.
  bool is_active(Layer l) const;

  // Earliest newest board among active timelines.
  Time present() const;
  Color active_player() const { return to_move_at(present()); }

  void add_timeline(Layer l, Time first, Layer parent);
  void advance(Layer l, Time last);

private:
  std::map<Layer, TimelineInfo> timelines_;
};

// Baseline multiverse as handed over by an external reader. Built once, then read-only.
class Game {
public:
  Game(int width, int height);

  Game(Game&&) = default;
  Game& operator=(Game&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }

  // Appends a board to its timeline. A board for an unknown timeline opens it; otherwise
  // it must directly follow the timeline's newest board. Throws std::invalid_argument.
  void add_board(Board b);
  void add_board(Board b, Layer parent);

  const Board* get_board(Layer l, Time t) const;
  const GameInfo& info() const { return info_; }

private:
  int width_;
  int height_;
  GameInfo info_;
  std::map<Layer, std::vector<std::unique_ptr<const Board>>> boards_;
};

} // namespace aeon
