#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "gambit/colour.hpp"
#include "gambit/piece.hpp"
#include "gambit/square.hpp"

namespace gambit {

// Mailbox board: one optional piece per square. Move generation only ever
// asks "what is on this square?", so no piece-set index is maintained.
class Board {
public:
  [[nodiscard]] static constexpr Board empty() noexcept { return Board{}; }

  void put_piece(Piece piece, Square square) noexcept { squares_[square.index()] = piece; }

  void remove_piece(Square square) noexcept { squares_[square.index()] = std::nullopt; }

  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    return squares_[square.index()];
  }

  [[nodiscard]] bool has_piece_at(Square square) const noexcept {
    return piece_at(square).has_value();
  }

  [[nodiscard]] bool has_piece_of(Square square, Colour side) const noexcept {
    const auto piece = piece_at(square);
    return piece.has_value() && colour(*piece) == side;
  }

  [[nodiscard]] std::uint32_t count_pieces(Piece piece) const noexcept {
    std::uint32_t count = 0;
    for (const auto& entry : squares_) {
      if (entry.has_value() && *entry == piece) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] std::optional<Square> king_square(Colour side) const noexcept {
    const Piece wanted = make_piece(side, PieceKind::King);
    for (std::uint8_t i = 0; i < 64; ++i) {
      if (squares_[i] == wanted) {
        return Square::from_index(i);
      }
    }
    return std::nullopt;
  }

  friend bool operator==(const Board&, const Board&) = default;

private:
  std::array<std::optional<Piece>, 64> squares_{};
};

} // namespace gambit
