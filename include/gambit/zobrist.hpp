#pragma once

// =============================================================================
// ZOBRIST KEYS: Fingerprinting Positions for Repetition Detection
// =============================================================================
//
// Threefold repetition asks "has this exact position occurred before?". Two
// positions are the same when piece placement, side to move, castling rights
// and the en passant possibility all match. Comparing boards square by square
// against every earlier position is wasteful, so each position is reduced to
// a 64-bit key: the XOR of one random number per (piece, square) pair, plus
// numbers for the side to move, the castling rights and the en passant file.
//
// The en passant file only contributes when a pawn could actually capture,
// so a "phantom" en passant square after a double push does not make two
// otherwise identical positions look different.
//
// =============================================================================

#include <array>
#include <cstdint>

#include "gambit/piece.hpp"

namespace gambit {

// Xorshift64: deterministic, so keys are identical across runs and builds.
class HashRng {
public:
  explicit constexpr HashRng(std::uint64_t seed) : state_{seed} {}

  constexpr std::uint64_t next() {
    std::uint64_t x = state_;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    state_ = x;
    return x;
  }

private:
  std::uint64_t state_;
};

inline constexpr std::uint64_t HASH_SEED = 0x6A6D6269745F6B31ull;

struct ZobristTable {
  std::array<std::array<std::uint64_t, 64>, 12> piece_square{};
  std::uint64_t colour_to_move{};
  std::array<std::uint64_t, 16> castling_rights{};
  std::array<std::uint64_t, 8> en_passant_files{};
};

consteval ZobristTable make_zobrist_table() {
  ZobristTable table{};
  HashRng rng(HASH_SEED);

  for (auto& squares : table.piece_square) {
    for (auto& entry : squares) {
      entry = rng.next();
    }
  }

  table.colour_to_move = rng.next();

  for (auto& entry : table.castling_rights) {
    entry = rng.next();
  }

  for (auto& entry : table.en_passant_files) {
    entry = rng.next();
  }

  return table;
}

inline constexpr ZobristTable ZOBRIST = make_zobrist_table();

} // namespace gambit
