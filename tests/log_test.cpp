#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "gambit/error.hpp"
#include "gambit/log.hpp"

using namespace gambit;

TEST(Logger, WritesLevelledLines) {
  std::ostringstream out;
  Logger logger(out);

  logger.info("engine: using stockfish");
  logger.error("persistence: cannot write");

  EXPECT_EQ(out.str(), "[info] engine: using stockfish\n[error] persistence: cannot write\n");
}

TEST(Logger, DropsLinesBelowTheLevel) {
  std::ostringstream out;
  Logger logger(out, LogLevel::Warn);

  logger.debug("hidden");
  logger.info("hidden");
  logger.warn("shown");

  EXPECT_EQ(out.str(), "[warn] shown\n");
  EXPECT_FALSE(logger.enabled(LogLevel::Info));

  logger.set_level(LogLevel::Debug);
  EXPECT_EQ(logger.level(), LogLevel::Debug);
  EXPECT_TRUE(logger.enabled(LogLevel::Debug));
}

TEST(Logger, LinesFromThreadsDoNotInterleave) {
  std::ostringstream out;
  Logger logger(out);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&logger] {
      for (int i = 0; i < 200; ++i) {
        logger.info("worker line");
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    EXPECT_EQ(line, "[info] worker line");
    ++count;
  }
  EXPECT_EQ(count, 800);
}

TEST(LogLevel, ParsesLabels) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("ERROR"), LogLevel::Error);
  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_EQ(to_string(LogLevel::Warn), "warn");
}

TEST(ErrorKind, PrintsKindAndMessage) {
  std::ostringstream out;
  out << make_error(ErrorKind::EngineUnavailable, "no engine");
  EXPECT_EQ(out.str(), "engine unavailable: no engine");
}
