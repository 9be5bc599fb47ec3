#pragma once

// =============================================================================
// STATIC EVALUATION: Material Only
// =============================================================================
//
// The fallback search scores leaf positions by material alone: every piece on
// the board contributes its value, white pieces positively and black pieces
// negatively. There is no positional, mobility or king-safety term.
//
// The king carries a value far above everything else combined so that any
// line losing it dominates every material swing; in legal play both kings
// are always on the board and their values cancel.
//
// Because the score is a plain white-minus-black sum it is zero-sum: the
// colour-mirrored position scores exactly the negation.
//
// =============================================================================

#include <array>

#include "gambit/board.hpp"
#include "gambit/colour.hpp"
#include "gambit/piece.hpp"
#include "gambit/position.hpp"

namespace gambit {

// Pawn, Knight, Bishop, Rook, Queen, King.
inline constexpr std::array<int, 6> PIECE_VALUES = {100, 320, 330, 500, 900, 20000};

[[nodiscard]] constexpr int piece_value(PieceKind kind) noexcept {
  return PIECE_VALUES[static_cast<std::size_t>(kind)];
}

// Sum of the values of `colour`'s pieces.
[[nodiscard]] int eval_material(Colour colour, const Board& board) noexcept;

// White material minus black material.
[[nodiscard]] int evaluate(const Position& pos) noexcept;

// evaluate() seen from `perspective`: negated for black.
[[nodiscard]] int evaluate_for(Colour perspective, const Position& pos) noexcept;

} // namespace gambit
