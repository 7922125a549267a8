#include "aeon/attack.hpp"
#include "aeon/board_gen.hpp"
#include "aeon/rules.hpp"

namespace aeon {

bool royal_attacked(const Game& game, const PartialGame& pg, Color by) {
  const Color victim = other(by);
  for (const Board* b : pg.playable_boards(by)) {
    auto it = BoardMoves{b}.generate_moves(game, pg);
    if (!it) continue;
    while (auto m = it->next()) {
      if (m->captured.is_of(victim) && is_royal(m->captured.kind)) return true;
    }
  }
  return false;
}

bool in_check(const Game& game, const PartialGame& pg, Color side) {
  return royal_attacked(game, pg, other(side));
}

} // namespace aeon
