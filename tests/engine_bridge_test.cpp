#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "gambit/engine_bridge.hpp"
#include "gambit/log.hpp"
#include "gambit/process.hpp"
#include "fixtures.hpp"

using namespace gambit;
using namespace std::chrono_literals;

namespace {

// A minimal UCI engine: answers the handshake and replies to "go" with
// `bestmove`. Anything else is ignored.
std::string fake_engine(const std::string& bestmove) {
  return "#!/bin/sh\n"
         "while read line; do\n"
         "  case \"$line\" in\n"
         "    uci) echo 'id name fake'; echo 'uciok' ;;\n"
         "    isready) echo 'readyok' ;;\n"
         "    go*) echo 'info depth 1 score cp 20'; echo '" +
         bestmove +
         "' ;;\n"
         "    quit) exit 0 ;;\n"
         "  esac\n"
         "done\n";
}

constexpr EngineTimeouts FAST{.handshake = 500ms, .bestmove = 500ms, .shutdown = 100ms};

EngineConfig config_for(const std::filesystem::path& path) {
  return EngineConfig{.available = true, .path = path.string(), .preferred = true};
}

} // namespace

// ChildProcess ----------------------------------------------------------------

TEST(ChildProcess, EchoesLines) {
  fixtures::TempDir dir("gambit-process");
  const auto script = dir.write_script("echo.sh", "#!/bin/sh\nread line\necho \"got $line\"\n");

  auto spawned = ChildProcess::spawn(script.string());
  ASSERT_TRUE(is_ok(spawned));
  auto& child = *value(spawned);

  EXPECT_TRUE(child.running());
  EXPECT_TRUE(child.write_line("ping"));
  EXPECT_EQ(child.read_line(1000ms), "got ping");
  child.terminate();
  EXPECT_FALSE(child.running());
}

TEST(ChildProcess, MissingProgramIsUnavailable) {
  const auto spawned = ChildProcess::spawn("/nonexistent/gambit-engine");

  ASSERT_FALSE(is_ok(spawned));
  EXPECT_EQ(error(spawned).kind, ErrorKind::EngineUnavailable);
}

TEST(ChildProcess, ReadTimesOutOnSilence) {
  fixtures::TempDir dir("gambit-process");
  const auto script = dir.write_script("silent.sh", "#!/bin/sh\nwhile read line; do :; done\n");

  auto spawned = ChildProcess::spawn(script.string());
  ASSERT_TRUE(is_ok(spawned));
  auto& child = *value(spawned);

  EXPECT_FALSE(child.read_line(50ms).has_value());
  EXPECT_FALSE(child.at_eof());
  child.terminate();
}

// Probing ---------------------------------------------------------------------

TEST(EngineBridge, ProbeAcceptsAUciEngine) {
  fixtures::TempDir dir("gambit-engine");
  const auto script = dir.write_script("engine.sh", fake_engine("bestmove e2e4"));

  EXPECT_TRUE(is_ok(probe_engine(script.string(), FAST)));
}

TEST(EngineBridge, ProbeRejectsANonEngine) {
  fixtures::TempDir dir("gambit-engine");
  const auto script = dir.write_script("mute.sh", "#!/bin/sh\nexit 0\n");

  const auto probed = probe_engine(script.string(), FAST);
  ASSERT_FALSE(is_ok(probed));
  EXPECT_EQ(error(probed).kind, ErrorKind::EngineUnavailable);
}

TEST(EngineBridge, ResolveSkipsUnusableCandidates) {
  fixtures::TempDir dir("gambit-engine");
  const auto good = dir.write_script("engine.sh", fake_engine("bestmove e2e4"));
  const auto mute = dir.write_script("mute.sh", "#!/bin/sh\nexit 0\n");
  std::ostringstream log;
  Logger logger(log, LogLevel::Debug);

  const auto config =
      resolve_engine({"", "/nonexistent/stockfish", mute.string(), good.string()}, FAST, logger);

  EXPECT_TRUE(config.available);
  EXPECT_TRUE(config.preferred);
  EXPECT_EQ(config.path, good.string());
  EXPECT_NE(log.str().find("[info] engine: using " + good.string()), std::string::npos);
}

TEST(EngineBridge, ResolveWithoutCandidatesIsUnavailable) {
  std::ostringstream log;
  Logger logger(log);

  const auto config = resolve_engine({"/nonexistent/stockfish"}, FAST, logger);

  EXPECT_FALSE(config.available);
  EXPECT_TRUE(config.path.empty());
  EXPECT_NE(log.str().find("[warn]"), std::string::npos);
}

// Requests --------------------------------------------------------------------

TEST(EngineBridge, RequestReturnsTheEnginesMove) {
  fixtures::TempDir dir("gambit-engine");
  const auto script = dir.write_script("engine.sh", fake_engine("bestmove e2e4 ponder e7e5"));
  const ExternalEngine engine(config_for(script), FAST);

  const auto reply = engine.request_move(Position::startpos(), 2);
  ASSERT_TRUE(is_ok(reply)) << error(reply);
  EXPECT_EQ(value(reply), parse_uci_move("e2e4").value());
}

TEST(EngineBridge, RequestSendsTheRootAndTheMovesPlayed) {
  fixtures::TempDir dir("gambit-engine");
  const auto transcript = dir.path() / "transcript.txt";
  const auto script = dir.write_script("engine.sh", "#!/bin/sh\n"
                                                    "while read line; do\n"
                                                    "  echo \"$line\" >> '" + transcript.string() + "'\n"
                                                    "  case \"$line\" in\n"
                                                    "    uci) echo 'uciok' ;;\n"
                                                    "    isready) echo 'readyok' ;;\n"
                                                    "    go*) echo 'bestmove g1f3' ;;\n"
                                                    "    quit) exit 0 ;;\n"
                                                    "  esac\n"
                                                    "done\n");
  const ExternalEngine engine(config_for(script), FAST);
  Position pos = Position::startpos();
  pos.make_move(parse_uci_move("e2e4").value());
  pos.make_move(parse_uci_move("e7e5").value());

  const auto reply = engine.request_move(pos, 3);
  ASSERT_TRUE(is_ok(reply)) << error(reply);

  std::ifstream in(transcript);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  const std::vector<std::string> expected = {
      "uci",
      "isready",
      "ucinewgame",
      "position fen " + std::string(Position::START_POS_FEN) + " moves e2e4 e7e5",
      "go depth 3",
  };
  ASSERT_GE(lines.size(), expected.size());
  lines.resize(expected.size());
  EXPECT_EQ(lines, expected);
}

TEST(EngineBridge, RequestFromAFenWithoutHistorySendsNoMoves) {
  fixtures::TempDir dir("gambit-engine");
  const auto transcript = dir.path() / "transcript.txt";
  const auto script = dir.write_script("engine.sh", "#!/bin/sh\n"
                                                    "while read line; do\n"
                                                    "  echo \"$line\" >> '" + transcript.string() + "'\n"
                                                    "  case \"$line\" in\n"
                                                    "    uci) echo 'uciok' ;;\n"
                                                    "    isready) echo 'readyok' ;;\n"
                                                    "    go*) echo 'bestmove e1d1' ;;\n"
                                                    "  esac\n"
                                                    "done\n");
  const ExternalEngine engine(config_for(script), FAST);
  const std::string fen = "4k3/8/8/8/8/8/8/4K3 w - - 0 1";

  ASSERT_TRUE(is_ok(engine.request_move(Position::from_fen(fen), 1)));

  std::ifstream in(transcript);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_NE(text.find("position fen " + fen + "\n"), std::string::npos);
  EXPECT_EQ(text.find(" moves"), std::string::npos);
}

TEST(EngineBridge, RequestRejectsMissingMove) {
  fixtures::TempDir dir("gambit-engine");

  int index = 0;
  for (const std::string bestmove : {"bestmove (none)", "bestmove 0000", "bestmove zz99"}) {
    const auto script = dir.write_script("engine" + std::to_string(index++) + ".sh", fake_engine(bestmove));
    const ExternalEngine engine(config_for(script), FAST);

    const auto reply = engine.request_move(Position::startpos(), 2);
    ASSERT_FALSE(is_ok(reply)) << bestmove;
    EXPECT_EQ(error(reply).kind, ErrorKind::EngineProtocolError) << bestmove;
  }
}

TEST(EngineBridge, RequestRejectsIllegalMove) {
  fixtures::TempDir dir("gambit-engine");
  const auto script = dir.write_script("engine.sh", fake_engine("bestmove e2e5"));
  const ExternalEngine engine(config_for(script), FAST);

  const auto reply = engine.request_move(Position::startpos(), 2);
  ASSERT_FALSE(is_ok(reply));
  EXPECT_EQ(error(reply).kind, ErrorKind::EngineProtocolError);
}

TEST(EngineBridge, RequestTimesOutOnASilentEngine) {
  fixtures::TempDir dir("gambit-engine");
  const auto script = dir.write_script("slow.sh", "#!/bin/sh\n"
                                                  "while read line; do\n"
                                                  "  case \"$line\" in\n"
                                                  "    uci) echo 'uciok' ;;\n"
                                                  "    isready) echo 'readyok' ;;\n"
                                                  "  esac\n"
                                                  "done\n");
  const ExternalEngine engine(config_for(script),
                              EngineTimeouts{.handshake = 500ms, .bestmove = 100ms, .shutdown = 100ms});

  const auto started = std::chrono::steady_clock::now();
  const auto reply = engine.request_move(Position::startpos(), 2);

  ASSERT_FALSE(is_ok(reply));
  EXPECT_EQ(error(reply).kind, ErrorKind::EngineProtocolError);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(EngineBridge, RequestWithoutEngineIsUnavailable) {
  const ExternalEngine engine(EngineConfig{}, FAST);

  EXPECT_FALSE(engine.available());
  const auto reply = engine.request_move(Position::startpos(), 2);
  ASSERT_FALSE(is_ok(reply));
  EXPECT_EQ(error(reply).kind, ErrorKind::EngineUnavailable);
}

TEST(EngineBridge, RequestWithVanishedBinaryIsAProtocolError) {
  const ExternalEngine engine(config_for("/nonexistent/stockfish"), FAST);

  const auto reply = engine.request_move(Position::startpos(), 2);
  ASSERT_FALSE(is_ok(reply));
  EXPECT_EQ(error(reply).kind, ErrorKind::EngineProtocolError);
}
