#include "gambit/config.hpp"

#include <cstdlib>

namespace gambit {

namespace {

constexpr const char* SESSION_DIR_NAME = ".gambit";

const std::vector<std::string> WELL_KNOWN_ENGINE_PATHS = {
    "/usr/bin/stockfish",
    "/usr/local/bin/stockfish",
    "/usr/games/stockfish",
    "stockfish",
};

bool is_truthy(const std::string& value) {
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace

std::optional<std::string> process_env(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

std::vector<std::string> engine_candidates(const EnvLookup& lookup) {
  std::vector<std::string> candidates;

  for (const char* name : {"GAMBIT_ENGINE_PATH", "STOCKFISH_PATH"}) {
    const auto value = lookup(name);
    if (value.has_value() && !value->empty()) {
      candidates.push_back(*value);
    }
  }

  candidates.insert(candidates.end(), WELL_KNOWN_ENGINE_PATHS.begin(),
                    WELL_KNOWN_ENGINE_PATHS.end());
  return candidates;
}

Config Config::from_environment(const EnvLookup& lookup) {
  Config config;

  if (const auto home = lookup("GAMBIT_HOME"); home.has_value() && !home->empty()) {
    config.data_dir = *home;
  } else if (const auto user_home = lookup("HOME"); user_home.has_value() && !user_home->empty()) {
    config.data_dir = std::filesystem::path(*user_home) / SESSION_DIR_NAME;
  } else {
    config.data_dir = std::filesystem::path(SESSION_DIR_NAME);
  }

  config.engine_candidates = gambit::engine_candidates(lookup);

  if (const auto level = lookup("GAMBIT_LOG_LEVEL")) {
    if (const auto parsed = parse_log_level(*level)) {
      config.log_level = *parsed;
    } else {
      default_logger().warn("config: ignoring unknown log level '" + *level + "'");
    }
  }

  if (const auto disabled = lookup("GAMBIT_NO_ENGINE")) {
    config.engine_disabled = is_truthy(*disabled);
  }

  return config;
}

} // namespace gambit
