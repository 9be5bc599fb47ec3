// =============================================================================
// POSITION STATE AND MOVE EXECUTION
// =============================================================================
//
// A chess position is more than just piece placement; it also includes:
//   - Side to move (white or black)
//   - Castling rights (which castles are still legal)
//   - En passant square (if a pawn just moved two squares)
//   - Move clocks (for the fifty-move rule and move numbering)
//
// make_move records everything that cannot be recomputed from the board into
// an undo stack, so the search can walk down and back up the tree on a single
// Position. Alongside the undo stack a Zobrist key is recorded for every
// position reached, which is what threefold-repetition detection counts.
//
// =============================================================================

#include "gambit/position.hpp"

#include <algorithm>
#include <stdexcept>

#include "gambit/piece.hpp"
#include "gambit/zobrist.hpp"

namespace gambit {

namespace {

// Can a pawn of `side` capture en passant onto `target`?
bool en_passant_capturable(Square target, Colour side, const Board& board) {
  const int behind = side == Colour::White ? -1 : 1;
  const Piece capturer = make_piece(side, PieceKind::Pawn);

  for (const int file_delta : {-1, 1}) {
    const auto source = target.offset(file_delta, behind);
    if (source.has_value() && board.piece_at(*source) == capturer) {
      return true;
    }
  }
  return false;
}

} // namespace

Position::Position() {
  keys_.push_back(key());
}

Position::Position(Board board_, Colour colour_to_move_, CastlingRights castling_rights_,
                   std::optional<Square> en_passant_square_, std::uint16_t half_move_clock_,
                   std::uint16_t full_move_counter_)
    : board(board_), colour_to_move(colour_to_move_), castling_rights(castling_rights_),
      en_passant_square(en_passant_square_), half_move_clock(half_move_clock_),
      full_move_counter(full_move_counter_) {
  keys_.push_back(key());
}

std::uint64_t Position::key() const {
  std::uint64_t result = 0;

  for (std::uint8_t i = 0; i < 64; ++i) {
    const Square square = Square::from_index(i);
    if (const auto piece = board.piece_at(square)) {
      result ^= ZOBRIST.piece_square[piece_index(*piece)][i];
    }
  }

  if (colour_to_move == Colour::Black) {
    result ^= ZOBRIST.colour_to_move;
  }

  result ^= ZOBRIST.castling_rights[castling_rights.value()];

  if (en_passant_square.has_value() &&
      en_passant_capturable(*en_passant_square, colour_to_move, board)) {
    result ^= ZOBRIST.en_passant_files[en_passant_square->file()];
  }

  return result;
}

std::vector<Move> Position::played_moves() const {
  std::vector<Move> moves;
  moves.reserve(undo_.size());
  for (const auto& entry : undo_) {
    moves.push_back(entry.move);
  }
  return moves;
}

bool Position::is_en_passant(const Move& mv) const {
  const auto piece = board.piece_at(mv.from);
  return piece.has_value() && is_pawn(*piece) && en_passant_square == mv.to &&
         mv.from.file() != mv.to.file() && !board.has_piece_at(mv.to);
}

bool Position::is_castling(const Move& mv) const {
  const auto piece = board.piece_at(mv.from);
  return piece.has_value() && is_king(*piece) && mv.from.file_diff(mv.to) == 2;
}

std::optional<Piece> Position::captured_by(const Move& mv) const {
  if (is_en_passant(mv)) {
    return make_piece(opponent_colour(), PieceKind::Pawn);
  }
  return board.piece_at(mv.to);
}

void Position::make_move(const Move& mv) {
  const auto moving = board.piece_at(mv.from);
  if (!moving.has_value() || colour(*moving) != colour_to_move) {
    throw std::invalid_argument("no piece of the side to move on " + mv.from.to_string());
  }

  const bool en_passant = is_en_passant(mv);
  const Square capture_square =
      en_passant ? Square::from_file_and_rank(mv.to.file(), mv.from.rank()) : mv.to;

  undo_.push_back(detail::UndoEntry{
      .move = mv,
      .moved_piece = *moving,
      .captured_piece = board.piece_at(capture_square),
      .capture_square = capture_square,
      .castling_rights = castling_rights,
      .en_passant_square = en_passant_square,
      .half_move_clock = half_move_clock,
      .full_move_counter = full_move_counter,
  });
  const auto& entry = undo_.back();

  en_passant_square = std::nullopt;
  ++half_move_clock;

  if (entry.captured_piece.has_value()) {
    half_move_clock = 0;
    board.remove_piece(capture_square);
  }

  if (is_pawn(*moving)) {
    half_move_clock = 0;

    if (mv.from.rank_diff(mv.to) == 2) {
      en_passant_square = mv.from.advance(colour_to_move);
    }
  }

  if (is_king(*moving)) {
    castling_rights.remove_for_colour(colour_to_move);

    if (mv.from.file_diff(mv.to) == 2) {
      const bool king_side = mv.to.file() > mv.from.file();
      const Square rook_from = Square::from_file_and_rank(king_side ? 7 : 0, mv.from.rank());
      const Square rook_to = Square::from_file_and_rank(king_side ? 5 : 3, mv.from.rank());

      board.remove_piece(rook_from);
      board.put_piece(make_piece(colour_to_move, PieceKind::Rook), rook_to);
    }
  }

  castling_rights.remove_for_square(mv.from);
  castling_rights.remove_for_square(mv.to);

  const Piece placed =
      mv.promotion.has_value() ? make_piece(colour_to_move, *mv.promotion) : *moving;
  board.remove_piece(mv.from);
  board.put_piece(placed, mv.to);

  if (colour_to_move == Colour::Black) {
    ++full_move_counter;
  }

  colour_to_move = opponent_colour();
  keys_.push_back(key());
}

void Position::unmake_move() {
  if (undo_.empty()) {
    throw std::logic_error("no move to unmake");
  }

  const auto entry = undo_.back();
  undo_.pop_back();
  keys_.pop_back();

  colour_to_move = opponent_colour();
  castling_rights = entry.castling_rights;
  en_passant_square = entry.en_passant_square;
  half_move_clock = entry.half_move_clock;
  full_move_counter = entry.full_move_counter;

  const Move& mv = entry.move;

  board.remove_piece(mv.to);
  board.put_piece(entry.moved_piece, mv.from);

  if (entry.captured_piece.has_value()) {
    board.put_piece(*entry.captured_piece, entry.capture_square);
  }

  if (is_king(entry.moved_piece) && mv.from.file_diff(mv.to) == 2) {
    const bool king_side = mv.to.file() > mv.from.file();
    const Square rook_home = Square::from_file_and_rank(king_side ? 7 : 0, mv.from.rank());
    const Square rook_moved = Square::from_file_and_rank(king_side ? 5 : 3, mv.from.rank());

    board.remove_piece(rook_moved);
    board.put_piece(make_piece(colour_to_move, PieceKind::Rook), rook_home);
  }
}

// =============================================================================
// REPETITION DETECTION
// =============================================================================
// Only positions since the last capture or pawn move can repeat, so the scan
// is bounded by the half-move clock. Positions with the other side to move
// never match (the side-to-move key differs), so stepping by two is enough.
// =============================================================================

std::size_t Position::repetition_count() const {
  const std::uint64_t current = keys_.back();
  const std::size_t reach = std::min<std::size_t>(half_move_clock, keys_.size() - 1);

  std::size_t count = 1;
  for (std::size_t distance = 2; distance <= reach; distance += 2) {
    if (keys_[keys_.size() - 1 - distance] == current) {
      ++count;
    }
  }
  return count;
}

Position Position::mirrored() const {
  Board flipped = Board::empty();

  for (std::uint8_t i = 0; i < 64; ++i) {
    const Square square = Square::from_index(i);
    if (const auto piece = board.piece_at(square)) {
      flipped.put_piece(make_piece(!colour(*piece), kind(*piece)), square.flipped());
    }
  }

  std::optional<Square> en_passant = std::nullopt;
  if (en_passant_square.has_value()) {
    en_passant = en_passant_square->flipped();
  }

  return Position{flipped,         !colour_to_move,  castling_rights.swapped(), en_passant,
                  half_move_clock, full_move_counter};
}

} // namespace gambit
