#include "gambit/session_state.hpp"

#include "gambit/movegen.hpp"

namespace gambit {

Result<std::monostate> apply_move(SessionState& state, const Move& mv) {
  if (!is_legal(state.position, mv)) {
    return make_error(ErrorKind::IllegalMove,
                      to_uci_string(mv) + " is not legal in " + state.position.to_fen());
  }

  if (const auto taken = state.position.captured_by(mv)) {
    std::string& tally = state.position.colour_to_move == Colour::White ? state.captured.by_white
                                                                         : state.captured.by_black;
    tally += to_char(*taken);
  }

  state.position.make_move(mv);
  state.history.push_back(mv);
  return std::monostate{};
}

void reset_game(SessionState& state) {
  state.position = Position::startpos();
  state.history.clear();
  state.selection.reset();
  state.legal_targets.clear();
  state.captured = CapturedTally{};
}

Result<std::monostate> replay(SessionState& state, const std::vector<Move>& history) {
  for (const auto& mv : history) {
    if (auto applied = apply_move(state, mv); !is_ok(applied)) {
      return applied;
    }
  }
  return std::monostate{};
}

} // namespace gambit
