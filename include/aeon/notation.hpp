#pragma once

#include <string>

#include "aeon/move.hpp"
#include "aeon/moveset.hpp"
#include "aeon/types.hpp"

namespace aeon {

// "(0T4)e2": timeline 0, half-turn 4, file e, rank 2.
std::string coords_to_string(const Coords& c);

// "(0T4)e2-(0T4)e4", 'x' instead of '-' for captures, "=Q" for promotions.
std::string move_to_string(const Move& m);

std::string moveset_to_string(const Moveset& ms);

} // namespace aeon
