#include "gambit/move.hpp"

#include <cctype>
#include <string>

#include "gambit/colour.hpp"

namespace gambit {

std::optional<Colour> parse_colour(std::string_view str) {
  std::string lowered;
  lowered.reserve(str.size());
  for (const char c : str) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lowered == "white" || lowered == "w") {
    return Colour::White;
  }
  if (lowered == "black" || lowered == "b") {
    return Colour::Black;
  }
  return std::nullopt;
}

std::optional<Move> parse_uci_move(std::string_view str) {
  if (str.size() != 4 && str.size() != 5) {
    return std::nullopt;
  }

  const auto from = Square::parse(str.substr(0, 2));
  const auto to = Square::parse(str.substr(2, 2));

  if (!from.has_value() || !to.has_value()) {
    return std::nullopt;
  }

  std::optional<PieceKind> promotion = std::nullopt;

  if (str.size() == 5) {
    switch (std::tolower(static_cast<unsigned char>(str[4]))) {
    case 'n':
      promotion = PieceKind::Knight;
      break;
    case 'b':
      promotion = PieceKind::Bishop;
      break;
    case 'r':
      promotion = PieceKind::Rook;
      break;
    case 'q':
      promotion = PieceKind::Queen;
      break;
    default:
      return std::nullopt;
    }
  }

  return Move{
      .from = *from,
      .to = *to,
      .promotion = promotion,
  };
}

std::string to_uci_string(const Move& mv) {
  std::string out;
  out.reserve(5);
  out += mv.from.to_string();
  out += mv.to.to_string();

  if (mv.promotion.has_value()) {
    out.push_back(static_cast<char>(std::tolower(to_char(*mv.promotion))));
  }

  return out;
}

} // namespace gambit
