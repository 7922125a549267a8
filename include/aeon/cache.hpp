#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "aeon/game.hpp"
#include "aeon/move.hpp"
#include "aeon/partial_game.hpp"

namespace aeon {

// Wraps a one-shot sequence (anything with `std::optional<T> next()`) and remembers every
// element it yielded, in order, so they can be looked up again without regenerating them.
template <class Iter, class T = Move>
class CacheMoves {
public:
  explicit CacheMoves(Iter it) : iter_(std::move(it)) {}

  // Pulls the next element from the wrapped sequence and caches it.
  std::optional<T> next() {
    if (exhausted_) return std::nullopt;
    std::optional<T> m = iter_.next();
    if (!m) {
      exhausted_ = true;
      return std::nullopt;
    }
    cache_.push_back(*m);
    return m;
  }

  // Looks only at what has been yielded so far: false means "not seen yet", not "invalid".
  bool validate_move_cached(const T& mv) const {
    for (const T& c : cache_) {
      if (c == mv) return true;
    }
    return false;
  }

  // Cache first, then drains the sequence until `mv` shows up or it runs out.
  bool validate_move(const T& mv) {
    if (validate_move_cached(mv)) return true;
    while (auto m = next()) {
      if (*m == mv) return true;
    }
    return false;
  }

  std::optional<T> get_cached(std::size_t n) const {
    if (n < cache_.size()) return cache_[n];
    return std::nullopt;
  }

  // n-th element of the sequence, draining it as far as needed.
  std::optional<T> get(std::size_t n) {
    while (n >= cache_.size()) {
      if (!next()) return std::nullopt;
    }
    return cache_[n];
  }

  const std::vector<T>& cache() const { return cache_; }
  bool exhausted() const { return exhausted_; }

private:
  Iter iter_;
  std::vector<T> cache_;
  bool exhausted_ = false;
};

// Generator `G` exposes `G::Iter` and `std::optional<G::Iter> generate_moves(game, pg)`
// (PiecePosition, BoardMoves). nullopt when the generator refers to a stale square or board.
template <class G>
std::optional<CacheMoves<typename G::Iter>> cache_moves(const G& gen, const Game& game,
                                                        const PartialGame& pg) {
  auto it = gen.generate_moves(game, pg);
  if (!it) return std::nullopt;
  return CacheMoves<typename G::Iter>(std::move(*it));
}

} // namespace aeon
