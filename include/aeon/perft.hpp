#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "aeon/game.hpp"
#include "aeon/moveset.hpp"
#include "aeon/partial_game.hpp"

namespace aeon {

// Number of legal turn sequences `depth` turns deep.
std::uint64_t perft(const Game& game, const PartialGame& pg, int depth);
std::uint64_t perft(const Game& game, int depth);

// Per-moveset breakdown at root
void perft_divide(const Game& game, int depth,
                  std::vector<std::pair<Moveset, std::uint64_t>>& out);

} // namespace aeon
