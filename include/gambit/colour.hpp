#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gambit {

enum class Colour : std::uint8_t { White = 0, Black = 1 };

constexpr Colour operator!(Colour colour) {
  return colour == Colour::White ? Colour::Black : Colour::White;
}

inline std::string to_string(Colour colour) {
  return colour == Colour::White ? "white" : "black";
}

// Accepts "white"/"black" (any case) and the FEN letters "w"/"b".
std::optional<Colour> parse_colour(std::string_view str);

} // namespace gambit
