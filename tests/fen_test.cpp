#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "gambit/position.hpp"

using namespace gambit;

TEST(Fen, StartingPositionRoundTrip) {
  const auto pos = Position::startpos();

  EXPECT_EQ(pos.to_fen(), Position::START_POS_FEN);
  EXPECT_EQ(pos.colour_to_move, Colour::White);
  EXPECT_EQ(pos.castling_rights, CastlingRights::all());
  EXPECT_FALSE(pos.en_passant_square.has_value());
  EXPECT_EQ(pos.half_move_clock, 0);
  EXPECT_EQ(pos.full_move_counter, 1);
}

TEST(Fen, ParsesEveryField) {
  const auto pos = Position::from_fen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 3 42");

  EXPECT_EQ(pos.board.piece_at(*Square::parse("e5")), Piece::WP);
  EXPECT_EQ(pos.board.piece_at(*Square::parse("d5")), Piece::BP);
  EXPECT_EQ(pos.en_passant_square, Square::parse("d6"));
  EXPECT_EQ(pos.castling_rights, CastlingRights::none());
  EXPECT_EQ(pos.half_move_clock, 3);
  EXPECT_EQ(pos.full_move_counter, 42);
}

TEST(Fen, RoundTripsArbitraryPositions) {
  for (const std::string_view fen : {
           "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
           "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
           "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8",
           "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR b Kq e3 0 2",
       }) {
    EXPECT_EQ(Position::from_fen(fen).to_fen(), fen);
  }
}

TEST(Fen, RejectsMalformedInput) {
  const std::string_view bad[] = {
      "",
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0",
      "rnbqkbnr/pppppppp/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
      "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
      "rnbqkbnr/ppppxppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQxq - 0 1",
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e4 0 1",
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - a 1",
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 0",
      "rnbq1bnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQ - 0 1",
  };

  for (const auto fen : bad) {
    EXPECT_THROW(Position::from_fen(fen), std::runtime_error) << fen;
  }
}

TEST(Fen, ReportsRowCount) {
  try {
    Position::from_fen("8/8/8/8 w - - 0 1");
    FAIL() << "expected a parse error";
  } catch (const std::runtime_error& e) {
    EXPECT_EQ(std::string(e.what()), "board must contain 8 rows, got 4");
  }
}
