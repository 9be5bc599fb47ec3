#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace gambit {

// Recoverable failures of the session core. None of them is fatal: the worst
// outcome is a fresh game or a weaker move source.
enum class ErrorKind {
  IllegalMove,         // move not in the legal set; selection is adjusted
  EngineUnavailable,   // no external engine could be started
  EngineProtocolError, // one external engine call failed
  PersistenceCorrupt,  // saved session unreadable or inconsistent
};

struct Error {
  ErrorKind kind;
  std::string message;
};

template <class T> using Result = std::variant<T, Error>;

template <class T> [[nodiscard]] bool is_ok(const Result<T>& result) noexcept {
  return std::holds_alternative<T>(result);
}

template <class T> [[nodiscard]] const T& value(const Result<T>& result) {
  return std::get<T>(result);
}

template <class T> [[nodiscard]] T& value(Result<T>& result) {
  return std::get<T>(result);
}

template <class T> [[nodiscard]] const Error& error(const Result<T>& result) {
  return std::get<Error>(result);
}

inline Error make_error(ErrorKind kind, std::string message) {
  return Error{.kind = kind, .message = std::move(message)};
}

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::IllegalMove:
    return "illegal move";
  case ErrorKind::EngineUnavailable:
    return "engine unavailable";
  case ErrorKind::EngineProtocolError:
    return "engine protocol error";
  case ErrorKind::PersistenceCorrupt:
    return "persistence corrupt";
  }
  return "unknown error";
}

inline std::ostream& operator<<(std::ostream& os, const Error& err) {
  return os << to_string(err.kind) << ": " << err.message;
}

} // namespace gambit
