#include "gambit/notation.hpp"

#include <algorithm>
#include <stdexcept>

#include "gambit/movegen.hpp"
#include "gambit/outcome.hpp"

namespace gambit {

namespace {

// File, rank or both, whichever first tells `mv` apart from other moves of
// the same piece kind landing on the same square.
std::string disambiguation(const Position& pos, const Move& mv, const MoveList& legal) {
  const auto moving = pos.board.piece_at(mv.from);
  bool ambiguous = false;
  bool same_file = false;
  bool same_rank = false;

  for (const auto& other : legal) {
    if (other.to != mv.to || other.from == mv.from || pos.board.piece_at(other.from) != moving) {
      continue;
    }
    ambiguous = true;
    same_file = same_file || other.from.file() == mv.from.file();
    same_rank = same_rank || other.from.rank() == mv.from.rank();
  }

  if (!ambiguous) {
    return "";
  }

  const std::string from = mv.from.to_string();
  if (!same_file) {
    return from.substr(0, 1);
  }
  if (!same_rank) {
    return from.substr(1, 1);
  }
  return from;
}

std::string check_suffix(const Position& pos, const Move& mv) {
  Position after = pos;
  after.make_move(mv);
  if (!is_in_check(after.colour_to_move, after.board)) {
    return "";
  }
  return legal_moves(after).empty() ? "#" : "+";
}

} // namespace

std::string to_san(const Position& pos, const Move& mv) {
  const MoveList legal = legal_moves(pos);
  if (std::find(legal.begin(), legal.end(), mv) == legal.end()) {
    throw std::invalid_argument("illegal move " + to_uci_string(mv) + " in " + pos.to_fen());
  }

  if (pos.is_castling(mv)) {
    const std::string castle = mv.to.file() > mv.from.file() ? "O-O" : "O-O-O";
    return castle + check_suffix(pos, mv);
  }

  const Piece moving = *pos.board.piece_at(mv.from);
  const bool capture = pos.captured_by(mv).has_value();
  std::string san;

  if (is_pawn(moving)) {
    if (capture) {
      san += mv.from.to_string().substr(0, 1);
    }
  } else {
    san += to_char(kind(moving));
    san += disambiguation(pos, mv, legal);
  }

  if (capture) {
    san += 'x';
  }
  san += mv.to.to_string();

  if (mv.promotion.has_value()) {
    san += '=';
    san += to_char(*mv.promotion);
  }

  return san + check_suffix(pos, mv);
}

std::vector<std::string> format_move_list(const std::vector<Move>& history) {
  std::vector<std::string> lines;
  Position pos = Position::startpos();

  for (std::size_t ply = 0; ply < history.size(); ++ply) {
    const std::string san = to_san(pos, history[ply]);
    if (ply % 2 == 0) {
      lines.push_back(std::to_string(ply / 2 + 1) + ". " + san);
    } else {
      lines.back() += " " + san;
    }
    pos.make_move(history[ply]);
  }

  return lines;
}

} // namespace gambit
