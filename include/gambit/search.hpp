#pragma once

// =============================================================================
// FALLBACK SEARCH: Fixed-Depth Negamax with Alpha-Beta Pruning
// =============================================================================
//
// When no external engine is available (or it fails for a move) the session
// still needs an opponent. This search is deliberately plain:
//
//   - Fixed depth of 1 to 3 plies, mapped from the Easy/Medium/Hard levels.
//   - Negamax: one recursive function scores every node from the point of
//     view of the side to move there; a child's score is negated on the way
//     up and the (alpha, beta) window is swapped and negated on the way down.
//   - Alpha-beta: once the best score at a node reaches beta the remaining
//     siblings cannot change the result and are skipped.
//   - Leaves (depth 0 or a finished game) are scored by material only.
//
// There is no move ordering, no transposition table and no quiescence. Moves
// are examined in the order the rules engine lists them and the first of
// equally scored root moves is kept, so results are fully deterministic.
//
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "gambit/move.hpp"
#include "gambit/position.hpp"

namespace gambit::search {

inline constexpr std::uint8_t MIN_DEPTH = 1;
inline constexpr std::uint8_t MAX_DEPTH = 3;
inline constexpr std::uint8_t DEFAULT_DEPTH = 2;

// Larger than any reachable material score.
inline constexpr int SCORE_INFINITY = 1'000'000'000;

enum class Difficulty : std::uint8_t { Easy = 1, Medium = 2, Hard = 3 };

[[nodiscard]] constexpr std::uint8_t depth_for(Difficulty difficulty) noexcept {
  return static_cast<std::uint8_t>(difficulty);
}

// Clamps to the supported range first.
[[nodiscard]] Difficulty difficulty_for(int depth) noexcept;

[[nodiscard]] std::optional<Difficulty> parse_difficulty(std::string_view label);
std::string to_string(Difficulty difficulty);

[[nodiscard]] constexpr std::uint8_t clamp_depth(int depth) noexcept {
  if (depth < MIN_DEPTH) {
    return MIN_DEPTH;
  }
  if (depth > MAX_DEPTH) {
    return MAX_DEPTH;
  }
  return static_cast<std::uint8_t>(depth);
}

struct SearchResult {
  std::optional<Move> best_move{};
  int eval{0}; // side-to-move perspective
  std::uint8_t depth{0};
  std::uint64_t nodes{0};
};

// Search `depth` plies from `pos`. The position is used as scratch space and
// is restored before returning. No legal move yields an empty best_move.
SearchResult search(Position& pos, std::uint8_t depth);

// Convenience over search() for callers holding an immutable snapshot.
[[nodiscard]] std::optional<Move> best_move(const Position& pos, std::uint8_t depth);

// Exposed for tests
namespace detail {
int negamax(Position& pos, std::uint8_t depth, int alpha, int beta, std::uint64_t& nodes);
} // namespace detail

} // namespace gambit::search
