#include "aeon/moveset_gen.hpp"

#include <utility>

namespace aeon {

GenMovesetIter::GenMovesetIter(std::vector<const Board*> own_boards, const Game& game, const PartialGame& pg)
    : game_(&game), pg_(&pg) {
  digits_.reserve(own_boards.size());
  for (const Board* b : own_boards) {
    auto cache = cache_moves(BoardMoves{b}, game, pg);
    if (!cache) {
      done_ = true;   // stale board: nothing can be played on it
      return;
    }
    digits_.push_back(std::move(*cache));
  }
  cursors_.assign(digits_.size(), 0);
  if (digits_.empty()) done_ = true;
}

// Moves the cursor set one step; false once every combination has been produced.
bool GenMovesetIter::advance() {
  std::size_t i = digits_.size();
  while (i > 0) {
    --i;
    ++cursors_[i];
    if (digits_[i].get(cursors_[i])) return true;
    cursors_[i] = 0;   // rewind; the cache replays this board's moves
  }
  return false;
}

std::optional<Validated<Moveset>> GenMovesetIter::next() {
  if (done_) return std::nullopt;

  if (!started_) {
    started_ = true;
    for (auto& d : digits_) {
      if (!d.get(0)) { done_ = true; return std::nullopt; }
    }
  } else if (!advance()) {
    done_ = true;
    return std::nullopt;
  }

  std::vector<Move> moves;
  moves.reserve(digits_.size());
  for (std::size_t i = 0; i < digits_.size(); ++i) moves.push_back(*digits_[i].get_cached(cursors_[i]));
  return Moveset::make(std::move(moves), *pg_);
}

std::optional<LegalTurn> GenMovesetIter::next_legal() {
  while (auto candidate = next()) {
    if (!candidate->ok()) continue;
    auto result = candidate->value().generate_partial_game(*game_, *pg_);
    if (!result.ok()) continue;
    return LegalTurn{std::move(*candidate).value(), std::move(result).value()};
  }
  return std::nullopt;
}

} // namespace aeon
