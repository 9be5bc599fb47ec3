#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "gambit/colour.hpp"

namespace gambit {

/// Chess pieces enumeration.
/// Naming convention: [Colour][Piece]
/// Colours: W = White, B = Black
/// Pieces: P = Pawn, N = Knight (N to avoid confusion with King),
///         B = Bishop, R = Rook, Q = Queen, K = King
enum class Piece : int {
  WP, // White Pawn
  WN, // White Knight
  WB, // White Bishop
  WR, // White Rook
  WQ, // White Queen
  WK, // White King
  BP, // Black Pawn
  BN, // Black Knight
  BB, // Black Bishop
  BR, // Black Rook
  BQ, // Black Queen
  BK, // Black King
};

// Colourless piece type. Promotions are expressed as a kind so that a move
// never has to know who is making it.
enum class PieceKind : int { Pawn, Knight, Bishop, Rook, Queen, King };

inline constexpr std::array<Piece, 12> ALL_PIECES = {
    Piece::WP, Piece::WN, Piece::WB, Piece::WR, Piece::WQ, Piece::WK,
    Piece::BP, Piece::BN, Piece::BB, Piece::BR, Piece::BQ, Piece::BK,
};

// Strongest first: the order auto-promotion and notation prefer.
inline constexpr std::array<PieceKind, 4> PROMOTION_KINDS = {
    PieceKind::Queen,
    PieceKind::Rook,
    PieceKind::Bishop,
    PieceKind::Knight,
};

constexpr Colour colour(Piece piece) {
  return static_cast<int>(piece) <= static_cast<int>(Piece::WK) ? Colour::White : Colour::Black;
}

constexpr PieceKind kind(Piece piece) {
  return static_cast<PieceKind>(static_cast<int>(piece) % 6);
}

constexpr Piece make_piece(Colour colour, PieceKind kind) {
  return static_cast<Piece>(static_cast<int>(colour) * 6 + static_cast<int>(kind));
}

constexpr std::size_t piece_index(Piece piece) {
  return static_cast<std::size_t>(piece);
}

constexpr bool is_pawn(Piece piece) {
  return kind(piece) == PieceKind::Pawn;
}

constexpr bool is_king(Piece piece) {
  return kind(piece) == PieceKind::King;
}

// Upper-case letter for the kind, as used by SAN ("N", "Q", ...).
constexpr char to_char(PieceKind kind) {
  switch (kind) {
  case PieceKind::Pawn:
    return 'P';
  case PieceKind::Knight:
    return 'N';
  case PieceKind::Bishop:
    return 'B';
  case PieceKind::Rook:
    return 'R';
  case PieceKind::Queen:
    return 'Q';
  case PieceKind::King:
    return 'K';
  }
  return '?';
}

// FEN letter: upper case for white, lower case for black.
constexpr char to_char(Piece piece) {
  const char upper = to_char(kind(piece));
  return colour(piece) == Colour::White ? upper : static_cast<char>(upper - 'A' + 'a');
}

constexpr std::optional<PieceKind> kind_from_char(char c) {
  switch (c) {
  case 'p':
  case 'P':
    return PieceKind::Pawn;
  case 'n':
  case 'N':
    return PieceKind::Knight;
  case 'b':
  case 'B':
    return PieceKind::Bishop;
  case 'r':
  case 'R':
    return PieceKind::Rook;
  case 'q':
  case 'Q':
    return PieceKind::Queen;
  case 'k':
  case 'K':
    return PieceKind::King;
  default:
    return std::nullopt;
  }
}

constexpr std::optional<Piece> piece_from_char(char c) {
  const auto parsed = kind_from_char(c);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  const Colour side = (c >= 'a' && c <= 'z') ? Colour::Black : Colour::White;
  return make_piece(side, *parsed);
}

inline std::string to_string(Piece piece) {
  return std::string(1, to_char(piece));
}

inline std::ostream& operator<<(std::ostream& os, Piece piece) {
  os << to_char(piece);
  return os;
}

} // namespace gambit
