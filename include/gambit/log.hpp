#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace gambit {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view label);
std::string to_string(LogLevel level);

// Levelled line sink: "[warn] engine: bestmove timed out". Lines from
// different threads never interleave.
class Logger {
public:
  explicit Logger(std::ostream& out, LogLevel min_level = LogLevel::Info);

  void log(LogLevel level, std::string_view message);

  void debug(std::string_view message) { log(LogLevel::Debug, message); }
  void info(std::string_view message) { log(LogLevel::Info, message); }
  void warn(std::string_view message) { log(LogLevel::Warn, message); }
  void error(std::string_view message) { log(LogLevel::Error, message); }

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;

  [[nodiscard]] bool enabled(LogLevel level) const { return level >= this->level(); }

private:
  std::ostream* out_;
  LogLevel min_level_;
  mutable std::mutex mutex_;
};

// Process-wide logger writing to std::clog.
Logger& default_logger();

} // namespace gambit
