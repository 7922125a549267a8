#pragma once
#include "aeon/game.hpp"
#include "aeon/partial_game.hpp"

namespace aeon {

// Could `by` capture a royal piece of the other side from any board it may play on?
bool royal_attacked(const Game& game, const PartialGame& pg, Color by);

// Is 'side' currently in check on any timeline?
bool in_check(const Game& game, const PartialGame& pg, Color side);

} // namespace aeon
