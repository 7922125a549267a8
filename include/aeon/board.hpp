#pragma once
#include <vector>
#include "aeon/types.hpp"


namespace aeon {


// One position of the multiverse, addressed by (timeline, half-turn).
// Boards are filled in before publication and only read afterwards.
class Board {
public:
  Board(Layer l, Time t, int width, int height);

  Layer l() const { return l_; }
  Time t() const { return t_; }
  int width() const { return width_; }
  int height() const { return height_; }
  int size() const { return width_ * height_; }

  // Side whose move this board is waiting for.
  Color to_move() const { return to_move_at(t_); }

  bool in_bounds(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }
  int index(int x, int y) const { return y * width_ + x; }

  Piece get(int x, int y) const { return squares_[static_cast<std::size_t>(index(x, y))]; }
  Piece at(int idx) const { return squares_[static_cast<std::size_t>(idx)]; }

  void set(int x, int y, Piece p);
  void clear(int x, int y) { set(x, y, Piece{}); }

  // Copy of this position re-addressed to (l, t).
  Board relocated(Layer l, Time t) const;

  bool operator==(const Board&) const = default;

private:
  Layer l_;
  Time t_;
  int width_;
  int height_;
  std::vector<Piece> squares_;
};


} // namespace aeon
