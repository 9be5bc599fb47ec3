// =============================================================================
// MOVE GENERATION: Mailbox Rays and Steps
// =============================================================================
//
// Moves are generated square by square from a plain 8x8 mailbox:
//
// 1. STEPPERS (knight, king)
//    Fixed (file, rank) offsets; a destination is kept if it is on the board
//    and not occupied by a friendly piece.
//
// 2. SLIDERS (bishop, rook, queen)
//    Walk each direction until the edge of the board or the first piece. An
//    enemy piece ends the ray and is capturable; a friendly piece ends it
//    without a move.
//
// 3. PSEUDO-LEGAL THEN FILTER
//    Pseudo-legal moves are played on a scratch copy of the board and kept
//    only if the mover's king is not attacked afterwards. This covers pins,
//    check evasions and the en passant discovered-check corner case in one
//    test.
//
// =============================================================================

#include "gambit/movegen.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "gambit/piece.hpp"

namespace gambit {

namespace {

using Offset = std::pair<int, int>;

constexpr std::array<Offset, 8> KNIGHT_OFFSETS = {{
    {1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2},
}};

constexpr std::array<Offset, 8> KING_OFFSETS = {{
    {0, 1}, {1, 1}, {1, 0}, {1, -1}, {0, -1}, {-1, -1}, {-1, 0}, {-1, 1},
}};

constexpr std::array<Offset, 4> ORTHOGONALS = {{{0, 1}, {1, 0}, {0, -1}, {-1, 0}}};
constexpr std::array<Offset, 4> DIAGONALS = {{{1, 1}, {1, -1}, {-1, -1}, {-1, 1}}};

constexpr int forward(Colour colour) {
  return colour == Colour::White ? 1 : -1;
}

constexpr std::uint8_t pawn_start_rank(Colour colour) {
  return colour == Colour::White ? 1 : 6;
}

constexpr std::uint8_t promotion_rank(Colour colour) {
  return colour == Colour::White ? 7 : 0;
}

void add_pawn_move(MoveList& moves, Square from, Square to, Colour colour) {
  if (to.rank() == promotion_rank(colour)) {
    for (const auto kind : PROMOTION_KINDS) {
      moves.push_back(Move{.from = from, .to = to, .promotion = kind});
    }
    return;
  }
  moves.push_back(Move{.from = from, .to = to});
}

void pawn_moves(const Position& pos, Square from, MoveList& moves) {
  const Colour us = pos.colour_to_move;
  const int dir = forward(us);

  if (const auto one = from.offset(0, dir); one.has_value() && !pos.board.has_piece_at(*one)) {
    add_pawn_move(moves, from, *one, us);

    if (from.rank() == pawn_start_rank(us)) {
      const auto two = one->offset(0, dir);
      if (two.has_value() && !pos.board.has_piece_at(*two)) {
        moves.push_back(Move{.from = from, .to = *two});
      }
    }
  }

  for (const int file_delta : {-1, 1}) {
    const auto target = from.offset(file_delta, dir);
    if (!target.has_value()) {
      continue;
    }

    if (pos.board.has_piece_of(*target, !us)) {
      add_pawn_move(moves, from, *target, us);
    } else if (pos.en_passant_square == *target) {
      moves.push_back(Move{.from = from, .to = *target});
    }
  }
}

template <std::size_t N>
void step_moves(const Position& pos, Square from, const std::array<Offset, N>& offsets,
                MoveList& moves) {
  for (const auto& [df, dr] : offsets) {
    const auto to = from.offset(df, dr);
    if (to.has_value() && !pos.board.has_piece_of(*to, pos.colour_to_move)) {
      moves.push_back(Move{.from = from, .to = *to});
    }
  }
}

template <std::size_t N>
void slide_moves(const Position& pos, Square from, const std::array<Offset, N>& directions,
                 MoveList& moves) {
  for (const auto& [df, dr] : directions) {
    auto to = from.offset(df, dr);
    while (to.has_value()) {
      if (const auto occupant = pos.board.piece_at(*to)) {
        if (colour(*occupant) != pos.colour_to_move) {
          moves.push_back(Move{.from = from, .to = *to});
        }
        break;
      }
      moves.push_back(Move{.from = from, .to = *to});
      to = to->offset(df, dr);
    }
  }
}

// =============================================================================
// CASTLING MOVE GENERATION
// =============================================================================
// Castling has strict requirements:
//   1. King and rook haven't moved (tracked by castling rights)
//   2. Squares between king and rook are empty
//   3. King doesn't pass through or land on an attacked square
//   4. King is not currently in check
//
// The landing square is left to the legality filter; the square the king
// crosses is checked here because the filter never sees it.
// =============================================================================

void castling_moves(const Position& pos, MoveList& moves) {
  const Colour us = pos.colour_to_move;
  const std::uint8_t rank = us == Colour::White ? 0 : 7;
  const Square king_home = Square::from_file_and_rank(4, rank);
  const Piece rook_piece = make_piece(us, PieceKind::Rook);

  if (pos.board.piece_at(king_home) != make_piece(us, PieceKind::King) ||
      is_attacked(king_home, !us, pos.board)) {
    return;
  }

  const auto empty = [&](std::uint8_t file) {
    return !pos.board.has_piece_at(Square::from_file_and_rank(file, rank));
  };
  const auto safe = [&](std::uint8_t file) {
    return !is_attacked(Square::from_file_and_rank(file, rank), !us, pos.board);
  };

  const CastlingRight king_side =
      us == Colour::White ? CastlingRight::WhiteKing : CastlingRight::BlackKing;
  const CastlingRight queen_side =
      us == Colour::White ? CastlingRight::WhiteQueen : CastlingRight::BlackQueen;

  if (pos.castling_rights.has(king_side) &&
      pos.board.piece_at(Square::from_file_and_rank(7, rank)) == rook_piece && empty(5) &&
      empty(6) && safe(5)) {
    moves.push_back(Move{.from = king_home, .to = Square::from_file_and_rank(6, rank)});
  }

  if (pos.castling_rights.has(queen_side) &&
      pos.board.piece_at(Square::from_file_and_rank(0, rank)) == rook_piece && empty(1) &&
      empty(2) && empty(3) && safe(3)) {
    moves.push_back(Move{.from = king_home, .to = Square::from_file_and_rank(2, rank)});
  }
}

// Play `mv` on a scratch board: only placement matters for the king test.
Board board_after(const Position& pos, const Move& mv) {
  Board board = pos.board;
  const auto moving = board.piece_at(mv.from);

  if (pos.is_en_passant(mv)) {
    board.remove_piece(Square::from_file_and_rank(mv.to.file(), mv.from.rank()));
  }

  if (pos.is_castling(mv)) {
    const bool king_side = mv.to.file() > mv.from.file();
    const Square rook_from = Square::from_file_and_rank(king_side ? 7 : 0, mv.from.rank());
    const Square rook_to = Square::from_file_and_rank(king_side ? 5 : 3, mv.from.rank());
    board.remove_piece(rook_from);
    board.put_piece(make_piece(pos.colour_to_move, PieceKind::Rook), rook_to);
  }

  board.remove_piece(mv.from);
  if (moving.has_value()) {
    const Piece placed =
        mv.promotion.has_value() ? make_piece(colour(*moving), *mv.promotion) : *moving;
    board.put_piece(placed, mv.to);
  }

  return board;
}

bool slider_hits(Square square, Colour by, const Board& board, const std::array<Offset, 4>& dirs,
                 PieceKind slider) {
  const Piece straight = make_piece(by, slider);
  const Piece queen = make_piece(by, PieceKind::Queen);

  for (const auto& [df, dr] : dirs) {
    auto next = square.offset(df, dr);
    while (next.has_value()) {
      if (const auto occupant = board.piece_at(*next)) {
        if (*occupant == straight || *occupant == queen) {
          return true;
        }
        break;
      }
      next = next->offset(df, dr);
    }
  }
  return false;
}

} // namespace

// =============================================================================
// ATTACK DETECTION
// =============================================================================
// Reverse lookup: "if a knight stood on this square, which squares would it
// reach?" Any enemy knight on one of them attacks the square. The same idea
// works for every piece type, so no attack tables are needed.
// =============================================================================

bool is_attacked(Square square, Colour by, const Board& board) {
  const int behind = -forward(by);
  const Piece pawn = make_piece(by, PieceKind::Pawn);
  for (const int file_delta : {-1, 1}) {
    const auto source = square.offset(file_delta, behind);
    if (source.has_value() && board.piece_at(*source) == pawn) {
      return true;
    }
  }

  const Piece knight = make_piece(by, PieceKind::Knight);
  for (const auto& [df, dr] : KNIGHT_OFFSETS) {
    const auto source = square.offset(df, dr);
    if (source.has_value() && board.piece_at(*source) == knight) {
      return true;
    }
  }

  const Piece king = make_piece(by, PieceKind::King);
  for (const auto& [df, dr] : KING_OFFSETS) {
    const auto source = square.offset(df, dr);
    if (source.has_value() && board.piece_at(*source) == king) {
      return true;
    }
  }

  return slider_hits(square, by, board, ORTHOGONALS, PieceKind::Rook) ||
         slider_hits(square, by, board, DIAGONALS, PieceKind::Bishop);
}

bool is_in_check(Colour colour, const Board& board) {
  const auto king_square = board.king_square(colour);
  return king_square.has_value() && is_attacked(*king_square, !colour, board);
}

MoveList pseudo_legal_moves(const Position& pos) {
  MoveList moves;
  moves.reserve(MAX_LEGAL_MOVES);

  for (std::uint8_t i = 0; i < 64; ++i) {
    const Square from = Square::from_index(i);
    const auto piece = pos.board.piece_at(from);
    if (!piece.has_value() || colour(*piece) != pos.colour_to_move) {
      continue;
    }

    switch (kind(*piece)) {
    case PieceKind::Pawn:
      pawn_moves(pos, from, moves);
      break;
    case PieceKind::Knight:
      step_moves(pos, from, KNIGHT_OFFSETS, moves);
      break;
    case PieceKind::Bishop:
      slide_moves(pos, from, DIAGONALS, moves);
      break;
    case PieceKind::Rook:
      slide_moves(pos, from, ORTHOGONALS, moves);
      break;
    case PieceKind::Queen:
      slide_moves(pos, from, ORTHOGONALS, moves);
      slide_moves(pos, from, DIAGONALS, moves);
      break;
    case PieceKind::King:
      step_moves(pos, from, KING_OFFSETS, moves);
      castling_moves(pos, moves);
      break;
    }
  }

  return moves;
}

MoveList legal_moves(const Position& pos) {
  MoveList moves = pseudo_legal_moves(pos);
  std::erase_if(moves, [&](const Move& mv) {
    return is_in_check(pos.colour_to_move, board_after(pos, mv));
  });
  return moves;
}

bool is_legal(const Position& pos, const Move& mv) {
  const auto moves = legal_moves(pos);
  return std::find(moves.begin(), moves.end(), mv) != moves.end();
}

std::uint64_t perft(Position& pos, std::uint8_t depth) {
  if (depth == 0) {
    return 1;
  }

  const MoveList moves = legal_moves(pos);
  if (depth == 1) {
    return moves.size();
  }

  std::uint64_t nodes = 0;
  for (const auto& mv : moves) {
    pos.make_move(mv);
    nodes += perft(pos, static_cast<std::uint8_t>(depth - 1));
    pos.unmake_move();
  }

  return nodes;
}

} // namespace gambit
