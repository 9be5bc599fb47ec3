#pragma once

#include <optional>
#include <string>

#include "gambit/colour.hpp"
#include "gambit/position.hpp"

namespace gambit {

// Why a game ended. Declaration order is the reporting priority: when several
// conditions hold at once the first one listed wins.
enum class Termination {
  Checkmate,
  Stalemate,
  InsufficientMaterial,
  ThreefoldRepetition,
  FiftyMoveRule,
};

[[nodiscard]] bool is_insufficient_material(const Board& board);

[[nodiscard]] std::optional<Termination> termination(const Position& pos);

[[nodiscard]] inline bool is_game_over(const Position& pos) {
  return termination(pos).has_value();
}

// Winner of a decided game; nullopt for draws.
[[nodiscard]] std::optional<Colour> winner(Termination reason, const Position& pos);

// Short label ("checkmate", "fifty-move rule").
std::string to_string(Termination reason);

// Game-over banner, e.g. "Checkmate! Black wins" or "Draw! Threefold repetition".
std::string describe(Termination reason, const Position& pos);

} // namespace gambit
