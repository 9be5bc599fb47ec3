#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gambit/board.hpp"
#include "gambit/castling.hpp"
#include "gambit/colour.hpp"
#include "gambit/move.hpp"
#include "gambit/square.hpp"

namespace gambit {

namespace detail {

// Everything unmake_move needs that cannot be read back off the board.
struct UndoEntry {
  Move move;
  Piece moved_piece;
  std::optional<Piece> captured_piece;
  Square capture_square;
  CastlingRights castling_rights;
  std::optional<Square> en_passant_square;
  std::uint16_t half_move_clock;
  std::uint16_t full_move_counter;
};

} // namespace detail

// FEN-aware position container. The rules engine's single state type: the
// session, the search and the persistence codec only ever hold one of these.
class Position {
public:
  Board board{};
  Colour colour_to_move{Colour::White};
  CastlingRights castling_rights{CastlingRights::none()};
  std::optional<Square> en_passant_square{};
  std::uint16_t half_move_clock{0};
  std::uint16_t full_move_counter{1};

  Position();

  Position(Board board, Colour colour_to_move, CastlingRights castling_rights,
           std::optional<Square> en_passant_square, std::uint16_t half_move_clock,
           std::uint16_t full_move_counter);

  // Parse a FEN string into a Position, throwing std::runtime_error on error.
  static Position from_fen(std::string_view fen);

  // Convenience: starting position constant.
  static Position startpos() { return from_fen(START_POS_FEN); }

  // Serialise position back to FEN.
  std::string to_fen() const;

  // Zobrist key of the current placement, side, rights and en passant file.
  std::uint64_t key() const;

  // Apply a move for the side to move. The move must be pseudo-legal (piece
  // of the side to move on `from`); legality is the caller's concern.
  void make_move(const Move& mv);

  // Undo the most recent make_move. Throws std::logic_error when there is
  // nothing to undo.
  void unmake_move();

  [[nodiscard]] bool can_unmake() const noexcept { return !undo_.empty(); }

  // Moves made on this position that unmake_move could take back, oldest
  // first.
  [[nodiscard]] std::vector<Move> played_moves() const;

  // The piece a move would capture in this position, en passant included.
  [[nodiscard]] std::optional<Piece> captured_by(const Move& mv) const;

  [[nodiscard]] bool is_castling(const Move& mv) const;
  [[nodiscard]] bool is_en_passant(const Move& mv) const;

  // How often the current position has occurred since the last capture or
  // pawn move (the current occurrence included).
  [[nodiscard]] std::size_t repetition_count() const;
  [[nodiscard]] bool is_threefold_repetition() const { return repetition_count() >= 3; }
  [[nodiscard]] bool is_fifty_move_draw() const { return half_move_clock >= 100; }

  // Colour-reversed copy: ranks flipped, piece colours swapped, side to move
  // and castling rights swapped. History is not carried over.
  [[nodiscard]] Position mirrored() const;

  Colour opponent_colour() const { return !colour_to_move; }

  // Standard starting position FEN.
  inline static constexpr std::string_view START_POS_FEN =
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

private:
  std::vector<detail::UndoEntry> undo_{};
  std::vector<std::uint64_t> keys_{};
};

} // namespace gambit
