#include "gambit/eval.hpp"

namespace gambit {

int eval_material(Colour colour, const Board& board) noexcept {
  int total = 0;
  for (std::uint8_t i = 0; i < 64; ++i) {
    const auto piece = board.piece_at(Square::from_index(i));
    if (piece.has_value() && gambit::colour(*piece) == colour) {
      total += piece_value(kind(*piece));
    }
  }
  return total;
}

int evaluate(const Position& pos) noexcept {
  return eval_material(Colour::White, pos.board) - eval_material(Colour::Black, pos.board);
}

int evaluate_for(Colour perspective, const Position& pos) noexcept {
  const int score = evaluate(pos);
  return perspective == Colour::White ? score : -score;
}

} // namespace gambit
