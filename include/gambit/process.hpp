#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

#include "gambit/error.hpp"

namespace gambit {

// A child process with its stdin and stdout connected to pipes. The child is
// always gone (exited or killed, and reaped) once the object is destroyed.
class ChildProcess {
public:
  // Starts `program`, searching PATH when it contains no slash. Fails with
  // EngineUnavailable when the pipes cannot be created or exec fails.
  static Result<std::unique_ptr<ChildProcess>> spawn(const std::string& program);

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ~ChildProcess();

  // False when the child's stdin is closed or the write failed.
  [[nodiscard]] bool write_line(std::string_view line);

  // Next line of output without the trailing newline. Nullopt when no full
  // line arrived within `timeout` or the child closed its stdout.
  [[nodiscard]] std::optional<std::string> read_line(std::chrono::milliseconds timeout);

  [[nodiscard]] bool at_eof() const noexcept { return eof_; }

  // Closes stdin, gives the child `grace` to exit by itself, then kills it.
  // Safe to call more than once.
  void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(200));

  [[nodiscard]] pid_t pid() const noexcept { return pid_; }
  [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

private:
  // Only spawn() can name this, so only spawn() can construct.
  struct Started {
    pid_t pid;
    int stdin_fd;
    int stdout_fd;
  };

public:
  explicit ChildProcess(Started started) noexcept
      : pid_(started.pid), stdin_fd_(started.stdin_fd), stdout_fd_(started.stdout_fd) {}

private:

  std::optional<std::string> take_buffered_line();
  void close_pipes() noexcept;

  pid_t pid_{-1};
  int stdin_fd_{-1};
  int stdout_fd_{-1};
  std::string buffer_{};
  bool eof_{false};
};

} // namespace gambit
