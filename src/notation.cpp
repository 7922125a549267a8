#include "aeon/notation.hpp"
#include "aeon/placement.hpp"

#include <string>

namespace aeon {

std::string coords_to_string(const Coords& c) {
  std::string s = "(" + std::to_string(c.l) + "T" + std::to_string(c.t) + ")";
  s.push_back(static_cast<char>('a' + c.x));
  s += std::to_string(c.y + 1);
  return s;
}

std::string move_to_string(const Move& m) {
  std::string s = coords_to_string(m.from);
  s.push_back(m.is_capture() ? 'x' : '-');
  s += coords_to_string(m.to);
  if (m.promotion != PieceKind::None) {
    s.push_back('=');
    s.push_back(piece_to_char(Piece{m.promotion, Color::White}));
  }
  return s;
}

std::string moveset_to_string(const Moveset& ms) {
  std::string s;
  for (const Move& m : ms.moves()) {
    if (!s.empty()) s.push_back(' ');
    s += move_to_string(m);
  }
  return s;
}

} // namespace aeon
