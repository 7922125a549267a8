#include "aeon/board.hpp"
#include <cassert>


namespace aeon {


Board::Board(Layer l, Time t, int width, int height)
    : l_(l), t_(t), width_(width), height_(height),
      squares_(static_cast<std::size_t>(width * height)) {
  assert(width > 0 && height > 0);
}


void Board::set(int x, int y, Piece p) {
  assert(in_bounds(x, y));
  squares_[static_cast<std::size_t>(index(x, y))] = p;
}


Board Board::relocated(Layer l, Time t) const {
  Board out = *this;
  out.l_ = l;
  out.t_ = t;
  return out;
}


} // namespace aeon
