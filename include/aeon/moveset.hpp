#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "aeon/game.hpp"
#include "aeon/move.hpp"
#include "aeon/partial_game.hpp"

namespace aeon {

// Why a candidate turn was turned down. Always recoverable: try the next candidate.
enum class MovesetValidityErr : int {
  DuplicateOrMissingBoard = 0,  // a board is played twice, or a board that must move is not
  IllegalMove = 1,              // a move is not produced by its piece's rules
  KingInCheck = 2,              // a royal piece of the mover is attacked afterwards
  InconsistentTimeline = 3      // a move starts on a past board or lands on a missing one
};

const char* to_string(MovesetValidityErr err);

// A value, or the reason there is none.
template <class T>
class Validated {
public:
  Validated(T value) : value_(std::move(value)) {}
  Validated(MovesetValidityErr err) : err_(err) {}

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const& { assert(ok()); return *value_; }
  T& value() & { assert(ok()); return *value_; }
  T&& value() && { assert(ok()); return std::move(*value_); }

  MovesetValidityErr error() const { assert(!ok()); return err_; }

private:
  std::optional<T> value_;
  MovesetValidityErr err_ = MovesetValidityErr::IllegalMove;
};

// One candidate turn: a move per board the active player plays on.
class Moveset {
public:
  explicit Moveset(std::vector<Move> moves) : moves_(std::move(moves)) {}

  // Wraps `moves` after the cheap board-accounting check (no move replay, no check test).
  static Validated<Moveset> make(std::vector<Move> moves, const PartialGame& pg);

  const std::vector<Move>& moves() const { return moves_; }
  std::size_t size() const { return moves_.size(); }

  // Full validation, then the overlay that results from playing every move on top of `pg`.
  // The returned overlay refers to `pg` as its parent.
  Validated<PartialGame> generate_partial_game(const Game& game, const PartialGame& pg) const;

  bool operator==(const Moveset&) const = default;

private:
  std::vector<Move> moves_;
};

} // namespace aeon
