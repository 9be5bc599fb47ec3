#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "gambit/piece.hpp"
#include "gambit/square.hpp"

namespace gambit {

// A move as the session, the search and the external engine exchange it:
// origin, destination and an optional promotion kind. Everything else
// (moved piece, capture, en passant, castling) is derived from the position
// it is played in.
struct Move {
  Square from{};
  Square to{};
  std::optional<PieceKind> promotion{};

  friend constexpr bool operator==(const Move&, const Move&) = default;
};

// Long algebraic notation as spoken by UCI engines: "e2e4", "e7e8q".
[[nodiscard]] std::optional<Move> parse_uci_move(std::string_view str);
[[nodiscard]] std::string to_uci_string(const Move& mv);

inline std::ostream& operator<<(std::ostream& os, const Move& mv) {
  os << to_uci_string(mv);
  return os;
}

} // namespace gambit
