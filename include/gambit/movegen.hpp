#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gambit/board.hpp"
#include "gambit/colour.hpp"
#include "gambit/move.hpp"
#include "gambit/position.hpp"
#include "gambit/square.hpp"

namespace gambit {

inline constexpr std::size_t MAX_LEGAL_MOVES = 128;
using MoveList = std::vector<Move>;

// Moves that follow the piece movement rules, ignoring own-king safety.
// Castling is only generated when the king is not in check and does not
// pass through an attacked square.
MoveList pseudo_legal_moves(const Position& pos);

// Pseudo-legal moves that do not leave the mover's king attacked. Order is
// board order (a1..h8) by origin square, then by generation order per piece;
// promotions are listed queen, rook, bishop, knight.
MoveList legal_moves(const Position& pos);

[[nodiscard]] bool is_legal(const Position& pos, const Move& mv);

[[nodiscard]] bool is_attacked(Square square, Colour by, const Board& board);
[[nodiscard]] bool is_in_check(Colour colour, const Board& board);

std::uint64_t perft(Position& pos, std::uint8_t depth);

} // namespace gambit
