#include "aeon/perft.hpp"
#include "aeon/moveset_gen.hpp"
#include <utility>
#include <vector>

namespace aeon {

std::uint64_t perft(const Game& game, const PartialGame& pg, int depth) {
  if (depth <= 0) return 1ULL;

  GenMovesetIter it(pg.own_boards(), game, pg);
  std::uint64_t nodes = 0ULL;
  while (auto turn = it.next_legal()) {
    nodes += (depth == 1) ? 1ULL : perft(game, turn->result, depth - 1);
  }
  return nodes;
}

std::uint64_t perft(const Game& game, int depth) {
  const PartialGame root = no_partial_game(game);
  return perft(game, root, depth);
}

void perft_divide(const Game& game, int depth,
                  std::vector<std::pair<Moveset, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;

  const PartialGame root = no_partial_game(game);
  GenMovesetIter it(root.own_boards(), game, root);
  while (auto turn = it.next_legal()) {
    const std::uint64_t n = perft(game, turn->result, depth - 1);
    out.emplace_back(std::move(turn->moveset), n);
  }
}

} // namespace aeon
