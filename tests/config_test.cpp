#include <gtest/gtest.h>

#include <map>
#include <string>

#include "gambit/config.hpp"

using namespace gambit;

namespace {

EnvLookup env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    const auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

} // namespace

TEST(Config, DefaultsUnderHome) {
  const auto config = Config::from_environment(env({{"HOME", "/home/player"}}));

  EXPECT_EQ(config.data_dir, std::filesystem::path("/home/player/.gambit"));
  EXPECT_EQ(config.session_file(), std::filesystem::path("/home/player/.gambit/session.ini"));
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_FALSE(config.engine_disabled);
}

TEST(Config, ResolvesEngineCandidates) {
  const auto lookup = env({{"HOME", "/home/player"}, {"STOCKFISH_PATH", "/opt/stockfish"}});
  const auto config = Config::from_environment(lookup);

  EXPECT_EQ(config.engine_candidates, engine_candidates(lookup));
  EXPECT_EQ(config.engine_candidates.front(), "/opt/stockfish");
}

TEST(Config, ExplicitDataDirWins) {
  const auto config =
      Config::from_environment(env({{"HOME", "/home/player"}, {"GAMBIT_HOME", "/srv/gambit"}}));

  EXPECT_EQ(config.session_file(), std::filesystem::path("/srv/gambit/session.ini"));
}

TEST(Config, NoHomeFallsBackToTheWorkingDirectory) {
  const auto config = Config::from_environment(env({}));

  EXPECT_EQ(config.data_dir, std::filesystem::path(".gambit"));
}

TEST(Config, EngineOverridesComeFirst) {
  const auto candidates = engine_candidates(
      env({{"GAMBIT_ENGINE_PATH", "/opt/engine"}, {"STOCKFISH_PATH", "/opt/stockfish"}}));

  ASSERT_GE(candidates.size(), 3u);
  EXPECT_EQ(candidates[0], "/opt/engine");
  EXPECT_EQ(candidates[1], "/opt/stockfish");
  EXPECT_EQ(candidates.back(), "stockfish");
}

TEST(Config, EmptyOverridesAreSkipped) {
  const auto with_empty = engine_candidates(env({{"GAMBIT_ENGINE_PATH", ""}}));
  const auto without = engine_candidates(env({}));

  EXPECT_EQ(with_empty, without);
  EXPECT_EQ(without.front(), "/usr/bin/stockfish");
}

TEST(Config, LogLevelAndEngineSwitch) {
  const auto config =
      Config::from_environment(env({{"GAMBIT_LOG_LEVEL", "DEBUG"}, {"GAMBIT_NO_ENGINE", "yes"}}));

  EXPECT_EQ(config.log_level, LogLevel::Debug);
  EXPECT_TRUE(config.engine_disabled);
}

TEST(Config, UnknownLogLevelKeepsTheDefault) {
  const auto config =
      Config::from_environment(env({{"GAMBIT_LOG_LEVEL", "chatty"}, {"GAMBIT_NO_ENGINE", "0"}}));

  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_FALSE(config.engine_disabled);
}
