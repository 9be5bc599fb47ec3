#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

#include "gambit/movegen.hpp"
#include "gambit/piece.hpp"
#include "gambit/position.hpp"
#include "gambit/square.hpp"
#include "fixtures.hpp"

using namespace gambit;

namespace {

Square sq(std::string_view algebraic) {
  return Square::parse(algebraic).value();
}

std::size_t moves_from(std::string_view fen, std::string_view from) {
  const auto moves = legal_moves(Position::from_fen(fen));
  return static_cast<std::size_t>(std::count_if(
      moves.begin(), moves.end(), [&](const Move& mv) { return mv.from == sq(from); }));
}

std::size_t castling_move_count(const Position& pos) {
  const auto moves = legal_moves(pos);
  return static_cast<std::size_t>(std::count_if(
      moves.begin(), moves.end(), [&](const Move& mv) { return pos.is_castling(mv); }));
}

bool contains(const MoveList& moves, std::string_view text) {
  const auto mv = parse_uci_move(text).value();
  return std::find(moves.begin(), moves.end(), mv) != moves.end();
}

} // namespace

// Attack detection --------------------------------------------------------

TEST(Attacks, KnightGivesCheck) {
  const Position pos = Position::from_fen("4k3/8/3N4/8/8/8/8/4K3 b - - 0 1");
  EXPECT_TRUE(is_in_check(Colour::Black, pos.board));
  EXPECT_FALSE(is_in_check(Colour::White, pos.board));
}

TEST(Attacks, SlidersAreBlocked) {
  const Position pos = Position::from_fen("4k3/8/8/8/Q7/8/8/4K3 w - - 0 1");
  EXPECT_TRUE(is_attacked(sq("e8"), Colour::White, pos.board));

  const Position blocked = Position::from_fen("4k3/3p4/8/8/Q7/8/8/4K3 w - - 0 1");
  EXPECT_FALSE(is_attacked(sq("e8"), Colour::White, blocked.board));
}

TEST(Attacks, PawnsAttackDiagonallyForward) {
  const Position pos = Position::from_fen("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");
  EXPECT_TRUE(is_attacked(sq("d3"), Colour::White, pos.board));
  EXPECT_TRUE(is_attacked(sq("f3"), Colour::White, pos.board));
  EXPECT_FALSE(is_attacked(sq("e3"), Colour::White, pos.board));
  EXPECT_FALSE(is_attacked(sq("d1"), Colour::Black, pos.board));
}

// Move generation ---------------------------------------------------------

TEST(Movegen, StartingPositionHasTwentyMoves) {
  EXPECT_EQ(legal_moves(Position::startpos()).size(), 20U);
}

TEST(Movegen, NoLegalMovesWhenCheckmated) {
  const Position pos =
      Position::from_fen("rnb1kbnr/pppp1ppp/4p3/8/6Pq/5P2/PPPPP2P/RNBQKBNR w KQkq - 0 1");
  EXPECT_TRUE(legal_moves(pos).empty());
}

TEST(Movegen, CheckLimitsTheReplies) {
  const Position pos =
      Position::from_fen("rnbqkbnr/1pp1p1pp/p2p1p2/1B6/8/4P3/PPPP1PPP/RNBQK1NR b KQq - 0 1");
  EXPECT_EQ(legal_moves(pos).size(), 7U);
}

TEST(Movegen, PieceMobility) {
  EXPECT_EQ(moves_from("4k3/8/8/8/3N4/8/8/4K3 w - - 0 1", "d4"), 8U);
  EXPECT_EQ(moves_from("4k3/r7/5n2/8/3B4/8/8/7K w - - 0 1", "d4"), 11U);
  EXPECT_EQ(moves_from("4k3/3b4/8/8/1n1R4/8/8/K7 w - - 0 1", "d4"), 12U);
  EXPECT_EQ(moves_from("7k/8/8/8/8/8/8/4K3 w - - 0 1", "e1"), 5U);
}

TEST(Movegen, PawnPushes) {
  EXPECT_EQ(moves_from("4k3/8/8/8/8/8/4P3/K7 w - - 0 1", "e2"), 2U);
  EXPECT_EQ(moves_from("k7/4p3/8/8/8/8/8/4K3 b - - 0 1", "e7"), 2U);
  EXPECT_EQ(moves_from("4k3/8/8/8/4p3/8/4P3/K7 w - - 0 1", "e2"), 1U);
  EXPECT_EQ(moves_from("4k3/8/8/8/8/4p3/4P3/K7 w - - 0 1", "e2"), 0U);
}

TEST(Movegen, PromotionsListAllFourKinds) {
  EXPECT_EQ(moves_from("k7/4P3/8/8/8/8/8/4K3 w - - 0 1", "e7"), 4U);
  EXPECT_EQ(moves_from("3qk3/4P3/8/8/8/8/8/4K3 w - - 0 1", "e7"), 4U);
  EXPECT_EQ(moves_from("3q3k/4P3/8/8/8/8/8/4K3 w - - 0 1", "e7"), 8U);

  const auto moves = legal_moves(Position::from_fen("k7/4P3/8/8/8/8/8/4K3 w - - 0 1"));
  const auto first = std::find_if(moves.begin(), moves.end(),
                                  [](const Move& mv) { return mv.promotion.has_value(); });
  ASSERT_NE(first, moves.end());
  EXPECT_EQ(first->promotion, PieceKind::Queen);
}

TEST(Movegen, CastlingBothSides) {
  EXPECT_EQ(castling_move_count(Position::from_fen("4k3/8/8/8/8/8/8/R3K2R w K - 0 1")), 1U);
  EXPECT_EQ(castling_move_count(Position::from_fen("4k3/8/8/8/8/8/8/R3K2R w Q - 0 1")), 1U);
  EXPECT_EQ(castling_move_count(Position::from_fen("4k3/8/8/8/8/8/8/R3K2R w KQ - 0 1")), 2U);
}

TEST(Movegen, NoCastlingThroughPiecesOrAttacks) {
  for (const std::string_view fen : {
           "4k3/8/8/8/8/8/8/R1B1K1NR w KQ - 0 1",
           "4k3/8/8/8/8/8/8/R1b1K1nR w KQ - 0 1",
           "4k3/8/8/8/8/8/8/RN2KB1R w KQ - 0 1",
           "4k3/8/8/8/8/4n3/8/R3K2R w KQ - 0 1",
           "4k3/8/8/8/8/3n4/8/R3K2R w KQ - 0 1",
           "4k3/8/8/8/8/8/8/R3K2R w - - 0 1",
       }) {
    EXPECT_EQ(castling_move_count(Position::from_fen(fen)), 0U) << fen;
  }
}

TEST(Movegen, QueenSideCastlingIgnoresAttackOnB1) {
  const Position pos = Position::from_fen("1r2k3/8/8/8/8/8/8/R3K3 w Q - 0 1");
  EXPECT_TRUE(contains(legal_moves(pos), "e1c1"));
}

TEST(Movegen, EnPassantCaptures) {
  const Position pos = Position::from_fen("4k3/8/8/3PpP2/8/8/8/4K3 w - e6 0 1");
  const auto moves = legal_moves(pos);

  EXPECT_TRUE(contains(moves, "d5e6"));
  EXPECT_TRUE(contains(moves, "f5e6"));
  EXPECT_TRUE(pos.is_en_passant(*parse_uci_move("d5e6")));
}

TEST(Movegen, EnPassantExposingTheKingIsIllegal) {
  const Position pos = Position::from_fen("8/8/8/KPp4r/8/8/8/7k w - c6 0 1");
  EXPECT_FALSE(contains(legal_moves(pos), "b5c6"));
}

TEST(Movegen, PinnedPieceCannotLeaveTheLine) {
  const Position pos = Position::from_fen("4r2k/8/8/8/8/8/4N3/4K3 w - - 0 1");
  EXPECT_EQ(moves_from("4r2k/8/8/8/8/8/4N3/4K3 w - - 0 1", "e2"), 0U);
  EXPECT_TRUE(is_legal(pos, *parse_uci_move("e1d1")));
  EXPECT_FALSE(is_legal(pos, *parse_uci_move("e2c3")));
}

TEST(Movegen, FriendlyPiecesAreNotCaptured) {
  EXPECT_EQ(moves_from("4k3/8/5p2/5P2/3N4/8/8/K7 w - - 0 1", "d4"), 7U);
  EXPECT_EQ(moves_from("4k3/8/8/8/3N4/5P2/8/K7 w - - 0 1", "d4"), 7U);
}

// Perft -------------------------------------------------------------------

TEST(Perft, FixturesMatch) {
  const auto records = fixtures::load_perft(fixtures::perft_path());

  for (const auto& record : records) {
    Position pos = Position::from_fen(record.fen);
    const auto nodes = perft(pos, static_cast<std::uint8_t>(record.depth));
    EXPECT_EQ(record.nodes, nodes) << record.name;
    EXPECT_EQ(pos.to_fen(), record.fen) << record.name;
  }
}
