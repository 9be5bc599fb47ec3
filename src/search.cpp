#include "gambit/search.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "gambit/eval.hpp"
#include "gambit/movegen.hpp"
#include "gambit/outcome.hpp"

namespace gambit::search {

namespace {

// Draw conditions that leave legal moves on the board. Mate and stalemate are
// detected by the caller from the (already generated) empty move list.
bool is_drawn(const Position& pos) {
  return is_insufficient_material(pos.board) || pos.is_threefold_repetition() ||
         pos.is_fifty_move_draw();
}

} // namespace

Difficulty difficulty_for(int depth) noexcept {
  return static_cast<Difficulty>(clamp_depth(depth));
}

std::optional<Difficulty> parse_difficulty(std::string_view label) {
  std::string lowered;
  lowered.reserve(label.size());
  for (const char c : label) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (lowered == "easy") {
    return Difficulty::Easy;
  }
  if (lowered == "medium") {
    return Difficulty::Medium;
  }
  if (lowered == "hard") {
    return Difficulty::Hard;
  }
  return std::nullopt;
}

std::string to_string(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Easy:
    return "Easy";
  case Difficulty::Medium:
    return "Medium";
  case Difficulty::Hard:
    return "Hard";
  }
  return "Medium";
}

namespace detail {

// =============================================================================
// NEGAMAX
// =============================================================================
// Returns the score of `pos` for the side to move. At a leaf the material
// balance is turned into that perspective, which is the same as carrying a
// +1/-1 sign from the root and flipping it every ply.
// =============================================================================

int negamax(Position& pos, std::uint8_t depth, int alpha, int beta, std::uint64_t& nodes) {
  ++nodes;

  if (depth == 0) {
    return evaluate_for(pos.colour_to_move, pos);
  }

  const MoveList moves = legal_moves(pos);
  if (moves.empty() || is_drawn(pos)) {
    return evaluate_for(pos.colour_to_move, pos);
  }

  int best = -SCORE_INFINITY;
  for (const auto& mv : moves) {
    pos.make_move(mv);
    const int score = -negamax(pos, static_cast<std::uint8_t>(depth - 1), -beta, -alpha, nodes);
    pos.unmake_move();

    best = std::max(best, score);
    alpha = std::max(alpha, score);

    // Beta cutoff: the opponent already has a better option elsewhere.
    if (alpha >= beta) {
      break;
    }
  }

  return best;
}

} // namespace detail

SearchResult search(Position& pos, std::uint8_t depth) {
  const std::uint8_t clamped = clamp_depth(depth);
  SearchResult result{.best_move = std::nullopt, .eval = -SCORE_INFINITY, .depth = clamped, .nodes = 0};

  // Every root move gets a full window so that each score is exact and ties
  // fall to the first move listed.
  for (const auto& mv : legal_moves(pos)) {
    pos.make_move(mv);
    const int score = -detail::negamax(pos, static_cast<std::uint8_t>(clamped - 1),
                                       -SCORE_INFINITY, SCORE_INFINITY, result.nodes);
    pos.unmake_move();

    if (score > result.eval) {
      result.eval = score;
      result.best_move = mv;
    }
  }

  if (!result.best_move.has_value()) {
    result.eval = evaluate_for(pos.colour_to_move, pos);
  }

  return result;
}

std::optional<Move> best_move(const Position& pos, std::uint8_t depth) {
  Position scratch = pos;
  return search(scratch, depth).best_move;
}

} // namespace gambit::search
