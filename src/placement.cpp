#include "aeon/placement.hpp"
#include <cctype>
#include <string>
#include <vector>

namespace aeon {

static constexpr char WHITE_CHARS[] = "PNBRQKUDSCY";
static constexpr int MAX_RANK_WIDTH = 4096;

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

Piece char_to_piece(char c) {
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  for (int k = 0; k < KIND_N; ++k) {
    if (WHITE_CHARS[k] == upper) {
      const Color col = (c == upper) ? Color::White : Color::Black;
      return Piece{static_cast<PieceKind>(k), col};
    }
  }
  return Piece{};
}

char piece_to_char(Piece p) {
  if (p.empty()) return '.';
  const char c = WHITE_CHARS[static_cast<int>(p.kind)];
  return p.color == Color::White ? c : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

Board board_from_placement(Layer l, Time t, std::string_view placement) {
  // 1) Split into ranks, top rank first
  std::vector<std::string> ranks(1);
  for (char ch : placement) {
    if (ch == '/') ranks.emplace_back();
    else ranks.back() += ch;
  }

  // 2) Width of each rank must agree
  int width = -1;
  std::vector<std::vector<Piece>> rows;
  for (const std::string& r : ranks) {
    std::vector<Piece> row;
    int run = 0;
    for (char ch : r) {
      if (is_digit(ch)) {
        run = run * 10 + (ch - '0');
        if (static_cast<int>(row.size()) + run > MAX_RANK_WIDTH)
          throw PlacementError("Run length too large in placement");
        continue;
      }
      if (run) { row.resize(row.size() + static_cast<std::size_t>(run)); run = 0; }
      Piece p = char_to_piece(ch);
      if (p.empty()) throw PlacementError(std::string("Invalid piece character in placement: ") + ch);
      if (static_cast<int>(row.size()) >= MAX_RANK_WIDTH) throw PlacementError("Rank too wide in placement");
      row.push_back(p);
    }
    if (run) row.resize(row.size() + static_cast<std::size_t>(run));
    if (row.empty()) throw PlacementError("Empty rank in placement");
    if (width < 0) width = static_cast<int>(row.size());
    else if (width != static_cast<int>(row.size())) throw PlacementError("Ranks of different widths in placement");
    rows.push_back(std::move(row));
  }

  const int height = static_cast<int>(rows.size());
  Board b(l, t, width, height);
  for (int i = 0; i < height; ++i) {
    const int y = height - 1 - i;
    for (int x = 0; x < width; ++x) b.set(x, y, rows[static_cast<std::size_t>(i)][static_cast<std::size_t>(x)]);
  }
  return b;
}

std::string to_placement(const Board& b) {
  std::string out;
  for (int y = b.height() - 1; y >= 0; --y) {
    int empties = 0;
    for (int x = 0; x < b.width(); ++x) {
      const Piece p = b.get(x, y);
      if (p.empty()) {
        ++empties;
      } else {
        if (empties) { out += std::to_string(empties); empties = 0; }
        out += piece_to_char(p);
      }
    }
    if (empties) out += std::to_string(empties);
    if (y) out += '/';
  }
  return out;
}

} // namespace aeon
