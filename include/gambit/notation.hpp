#pragma once

#include <string>
#include <vector>

#include "gambit/move.hpp"
#include "gambit/position.hpp"

namespace gambit {

// Standard algebraic notation for a legal move in `pos`: "Nf3", "exd5",
// "Rad1", "e8=Q+", "O-O", "Qh4#". Throws std::invalid_argument when the move
// is not legal in the position.
std::string to_san(const Position& pos, const Move& mv);

// Replays `history` from the initial position and renders numbered move
// pairs: {"1. e4 e5", "2. Nf3"}.
std::vector<std::string> format_move_list(const std::vector<Move>& history);

} // namespace gambit
