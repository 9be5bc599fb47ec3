#include "gambit/outcome.hpp"

#include "gambit/movegen.hpp"

namespace gambit {

bool is_insufficient_material(const Board& board) {
  int minors = 0;
  int bishops = 0;
  int light_bishops = 0;

  for (std::uint8_t i = 0; i < 64; ++i) {
    const Square square = Square::from_index(i);
    const auto piece = board.piece_at(square);
    if (!piece.has_value()) {
      continue;
    }

    switch (kind(*piece)) {
    case PieceKind::King:
      break;
    case PieceKind::Knight:
      ++minors;
      break;
    case PieceKind::Bishop:
      ++minors;
      ++bishops;
      if (square.is_light()) {
        ++light_bishops;
      }
      break;
    default:
      return false;
    }
  }

  if (minors <= 1) {
    return true;
  }

  // Any number of bishops confined to one square colour can never mate.
  return minors == bishops && (light_bishops == 0 || light_bishops == bishops);
}

std::optional<Termination> termination(const Position& pos) {
  if (legal_moves(pos).empty()) {
    return is_in_check(pos.colour_to_move, pos.board) ? Termination::Checkmate
                                                      : Termination::Stalemate;
  }
  if (is_insufficient_material(pos.board)) {
    return Termination::InsufficientMaterial;
  }
  if (pos.is_threefold_repetition()) {
    return Termination::ThreefoldRepetition;
  }
  if (pos.is_fifty_move_draw()) {
    return Termination::FiftyMoveRule;
  }
  return std::nullopt;
}

std::optional<Colour> winner(Termination reason, const Position& pos) {
  if (reason == Termination::Checkmate) {
    return pos.opponent_colour();
  }
  return std::nullopt;
}

std::string to_string(Termination reason) {
  switch (reason) {
  case Termination::Checkmate:
    return "checkmate";
  case Termination::Stalemate:
    return "stalemate";
  case Termination::InsufficientMaterial:
    return "insufficient material";
  case Termination::ThreefoldRepetition:
    return "threefold repetition";
  case Termination::FiftyMoveRule:
    return "fifty-move rule";
  }
  return "unknown";
}

std::string describe(Termination reason, const Position& pos) {
  switch (reason) {
  case Termination::Checkmate: {
    const std::string side = pos.opponent_colour() == Colour::White ? "White" : "Black";
    return "Checkmate! " + side + " wins";
  }
  case Termination::Stalemate:
    return "Stalemate! It's a draw";
  case Termination::InsufficientMaterial:
    return "Draw! Insufficient material";
  case Termination::ThreefoldRepetition:
    return "Draw! Threefold repetition";
  case Termination::FiftyMoveRule:
    return "Draw! Fifty-move rule";
  }
  return "Game over";
}

} // namespace gambit
