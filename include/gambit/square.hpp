#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "gambit/colour.hpp"

namespace gambit {

// Board square, 0 = a1 ... 7 = h1, 8 = a2 ... 63 = h8.
class Square {
public:
  constexpr Square() noexcept : index_(0) {}

  [[nodiscard]] static constexpr Square from_index(std::uint8_t index) noexcept {
    return Square(index);
  }

  [[nodiscard]] static constexpr Square from_file_and_rank(std::uint8_t file,
                                                           std::uint8_t rank) noexcept {
    return Square(static_cast<std::uint8_t>((rank << 3) | file));
  }

  [[nodiscard]] constexpr std::uint8_t index() const noexcept { return index_; }

  [[nodiscard]] constexpr std::uint8_t file() const noexcept {
    return static_cast<std::uint8_t>(index_ & 7u);
  }

  [[nodiscard]] constexpr std::uint8_t rank() const noexcept {
    return static_cast<std::uint8_t>(index_ >> 3);
  }

  [[nodiscard]] constexpr std::uint8_t file_diff(Square other) const noexcept {
    return static_cast<std::uint8_t>(file() > other.file() ? file() - other.file()
                                                           : other.file() - file());
  }

  [[nodiscard]] constexpr std::uint8_t rank_diff(Square other) const noexcept {
    return static_cast<std::uint8_t>(rank() > other.rank() ? rank() - other.rank()
                                                           : other.rank() - rank());
  }

  // Step by (file, rank) deltas; nullopt when the step leaves the board.
  [[nodiscard]] constexpr std::optional<Square> offset(int file_delta,
                                                       int rank_delta) const noexcept {
    const int f = static_cast<int>(file()) + file_delta;
    const int r = static_cast<int>(rank()) + rank_delta;
    if (f < 0 || f > 7 || r < 0 || r > 7) {
      return std::nullopt;
    }
    return from_file_and_rank(static_cast<std::uint8_t>(f), static_cast<std::uint8_t>(r));
  }

  // One rank towards the opponent. Precondition: not on the colour's last rank.
  [[nodiscard]] constexpr Square advance(Colour colour) const noexcept {
    return colour == Colour::White ? Square(static_cast<std::uint8_t>(index_ + 8))
                                   : Square(static_cast<std::uint8_t>(index_ - 8));
  }

  [[nodiscard]] constexpr bool is_back_rank() const noexcept {
    return rank() == 0 || rank() == 7;
  }

  [[nodiscard]] constexpr bool is_light() const noexcept { return (file() + rank()) % 2 != 0; }

  // Same file, rank flipped (a1 <-> a8).
  [[nodiscard]] constexpr Square flipped() const noexcept {
    return from_file_and_rank(file(), static_cast<std::uint8_t>(7 - rank()));
  }

  [[nodiscard]] std::string to_string() const {
    const char file_char = static_cast<char>('a' + file());
    const char rank_char = static_cast<char>('1' + rank());
    return std::string{file_char, rank_char};
  }

  [[nodiscard]] static std::optional<Square> parse(std::string_view algebraic) noexcept {
    if (algebraic.size() != 2) {
      return std::nullopt;
    }

    const char file_char = algebraic[0];
    const char rank_char = algebraic[1];

    if (file_char < 'a' || file_char > 'h' || rank_char < '1' || rank_char > '8') {
      return std::nullopt;
    }

    const std::uint8_t file = static_cast<std::uint8_t>(file_char - 'a');
    const std::uint8_t rank = static_cast<std::uint8_t>(rank_char - '1');
    return from_file_and_rank(file, rank);
  }

  friend constexpr bool operator==(Square lhs, Square rhs) noexcept = default;

  friend constexpr bool operator<(Square lhs, Square rhs) noexcept {
    return lhs.index_ < rhs.index_;
  }

private:
  explicit constexpr Square(std::uint8_t index) noexcept : index_(index) {}

  std::uint8_t index_;
};

inline std::ostream& operator<<(std::ostream& os, Square square) {
  return os << square.to_string();
}

} // namespace gambit
