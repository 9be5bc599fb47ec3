#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gambit/colour.hpp"
#include "gambit/error.hpp"
#include "gambit/move.hpp"
#include "gambit/position.hpp"
#include "gambit/search.hpp"
#include "gambit/square.hpp"

namespace gambit {

// FEN letters of the pieces each side has taken, in capture order.
struct CapturedTally {
  std::string by_white{};
  std::string by_black{};

  friend bool operator==(const CapturedTally&, const CapturedTally&) = default;
};

// Everything one game session is. Exactly one lives per process, owned by
// the Session; the AI worker only ever sees a copy of `position`.
struct SessionState {
  Position position{Position::startpos()};
  std::vector<Move> history{};
  Colour human_colour{Colour::White};
  bool ai_enabled{true};
  std::uint8_t depth{search::DEFAULT_DEPTH};

  std::optional<Square> selection{};
  std::vector<Square> legal_targets{};
  bool ai_busy{false};
  CapturedTally captured{};

  // Side the human may move right now: any side when the AI is off.
  [[nodiscard]] bool human_controls(Colour side) const noexcept {
    return !ai_enabled || side == human_colour;
  }
};

// Plays a legal move: updates position, history and the capture tally. An
// illegal move leaves the state untouched and fails with IllegalMove.
Result<std::monostate> apply_move(SessionState& state, const Move& mv);

// Fresh game with the same settings (side, AI flag, depth).
void reset_game(SessionState& state);

// Replays `history` from the initial position into `state`, which must hold
// a fresh game. Stops at the first illegal move.
Result<std::monostate> replay(SessionState& state, const std::vector<Move>& history);

} // namespace gambit
