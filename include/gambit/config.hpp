#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "gambit/log.hpp"

namespace gambit {

// Returns the value of an environment variable, nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Looks variables up in the real process environment.
std::optional<std::string> process_env(const std::string& name);

// Startup settings, resolved once from the environment.
struct Config {
  std::filesystem::path data_dir{};
  std::vector<std::string> engine_candidates{};
  LogLevel log_level{LogLevel::Info};
  bool engine_disabled{false};

  [[nodiscard]] std::filesystem::path session_file() const { return data_dir / "session.ini"; }

  static Config from_environment(const EnvLookup& lookup = process_env);
};

// Candidate engine executables in probe order; explicit overrides first, the
// bare name last so that the launcher searches PATH for it.
std::vector<std::string> engine_candidates(const EnvLookup& lookup);

} // namespace gambit
