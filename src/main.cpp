#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "aeon/board_gen.hpp"
#include "aeon/game.hpp"
#include "aeon/moveset_gen.hpp"
#include "aeon/notation.hpp"
#include "aeon/partial_game.hpp"
#include "aeon/perft.hpp"
#include "aeon/placement.hpp"

using namespace aeon;

static void usage() {
  std::cout <<
    "Aeon CLI\n"
    "Usage:\n"
    "  aeon_cli moves    <boards...>\n"
    "  aeon_cli movesets <boards...>\n"
    "  aeon_cli perft <depth> <boards...>\n"
    "  aeon_cli divide <depth> <boards...>\n"
    "Boards: board <timeline> <half-turn> <placement> [board ...]\n"
    "Placement ranks run top to bottom, e.g. 'k2/3/K2'.\n";
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

// Boards are added in the order given, so list each timeline oldest first.
static Game game_from_args(const std::vector<std::string>& a, std::size_t start) {
  std::vector<Board> boards;
  for (std::size_t i = start; i < a.size(); i += 4) {
    if (a[i] != "board" || i + 3 >= a.size())
      throw std::invalid_argument("expected: board <timeline> <half-turn> <placement>");
    boards.push_back(board_from_placement(to_int(a[i + 1]), to_int(a[i + 2]), a[i + 3]));
  }
  if (boards.empty()) throw std::invalid_argument("no boards given");

  Game g(boards.front().width(), boards.front().height());
  for (auto& b : boards) g.add_board(std::move(b));
  return g;
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // moves <boards...>
  if (cmd == "moves") {
    const Game g = game_from_args(args, 1);
    const PartialGame pg = no_partial_game(g);
    for (const Board* b : pg.own_boards()) {
      std::cout << "board (" << b->l() << "T" << b->t() << ")\n";
      auto it = BoardMoves{b}.generate_moves(g, pg);
      int n = 0;
      while (auto m = it->next()) {
        std::cout << "  " << move_to_string(*m) << "\n";
        ++n;
      }
      std::cout << "  " << n << " moves\n";
    }
    return 0;
  }

  // movesets <boards...>
  if (cmd == "movesets") {
    const Game g = game_from_args(args, 1);
    const PartialGame pg = no_partial_game(g);
    GenMovesetIter it(pg.own_boards(), g, pg);
    std::uint64_t total = 0, legal = 0;
    while (auto cand = it.next()) {
      ++total;
      if (!cand->ok()) {
        std::cout << "rejected: " << to_string(cand->error()) << "\n";
        continue;
      }
      auto res = cand->value().generate_partial_game(g, pg);
      std::cout << moveset_to_string(cand->value()) << " : "
                << (res.ok() ? "ok" : to_string(res.error())) << "\n";
      if (res.ok()) ++legal;
    }
    std::cout << "candidates " << total << " legal " << legal << "\n";
    return 0;
  }

  // perft <depth> <boards...>
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    if (depth < 0) { usage(); return 1; }
    const Game g = game_from_args(args, 2);
    std::cout << perft(g, depth) << "\n";
    return 0;
  }

  // divide <depth> <boards...>
  if (cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    if (depth < 0) { usage(); return 1; }
    const Game g = game_from_args(args, 2);
    std::vector<std::pair<Moveset, std::uint64_t>> parts;
    perft_divide(g, depth, parts);
    std::uint64_t total = 0;
    for (auto& [ms, n] : parts) {
      std::cout << moveset_to_string(ms) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const PlacementError& e) {
    std::cerr << "placement error: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  return 1;
}
