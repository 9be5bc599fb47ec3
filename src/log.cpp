#include "gambit/log.hpp"

#include <cctype>
#include <iostream>

namespace gambit {

std::optional<LogLevel> parse_log_level(std::string_view label) {
  std::string lowered;
  for (const char c : label) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (lowered == "debug") {
    return LogLevel::Debug;
  }
  if (lowered == "info") {
    return LogLevel::Info;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::Warn;
  }
  if (lowered == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}

Logger::Logger(std::ostream& out, LogLevel min_level) : out_(&out), min_level_(min_level) {}

void Logger::log(LogLevel level, std::string_view message) {
  std::scoped_lock lock(mutex_);
  if (level < min_level_) {
    return;
  }
  *out_ << '[' << to_string(level) << "] " << message << '\n' << std::flush;
}

void Logger::set_level(LogLevel level) {
  std::scoped_lock lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::level() const {
  std::scoped_lock lock(mutex_);
  return min_level_;
}

Logger& default_logger() {
  static Logger logger(std::clog);
  return logger;
}

} // namespace gambit
