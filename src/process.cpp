#include "gambit/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace gambit {

namespace {

using Clock = std::chrono::steady_clock;

// A child that dies between our writes must not take the parent down.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::string errno_message(const std::string& what, int err) {
  return what + ": " + std::strerror(err);
}

} // namespace

// =============================================================================
// SPAWNING
// =============================================================================
// Three pipes are created:
//   to_child    parent writes, child reads as stdin
//   from_child  child writes stdout (and stderr), parent reads
//   exec_status close-on-exec; the child writes errno into it only if execvp
//               fails, so an empty read in the parent means exec succeeded
// =============================================================================

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const std::string& program) {
  ignore_sigpipe();

  int to_child[2] = {-1, -1};
  int from_child[2] = {-1, -1};
  int exec_status[2] = {-1, -1};

  if (::pipe2(to_child, O_CLOEXEC) < 0 || ::pipe2(from_child, O_CLOEXEC) < 0 ||
      ::pipe2(exec_status, O_CLOEXEC) < 0) {
    const int err = errno;
    for (int* fds : {to_child, from_child, exec_status}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return make_error(ErrorKind::EngineUnavailable, errno_message("pipe", err));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    for (int* fds : {to_child, from_child, exec_status}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return make_error(ErrorKind::EngineUnavailable, errno_message("fork", err));
  }

  if (pid == 0) {
    ::dup2(to_child[0], STDIN_FILENO);
    ::dup2(from_child[1], STDOUT_FILENO);
    ::dup2(from_child[1], STDERR_FILENO);

    char* argv[] = {const_cast<char*>(program.c_str()), nullptr};
    ::execvp(program.c_str(), argv);

    const int err = errno;
    [[maybe_unused]] const auto written = ::write(exec_status[1], &err, sizeof(err));
    ::_exit(127);
  }

  close_fd(to_child[0]);
  close_fd(from_child[1]);
  close_fd(exec_status[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_status[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_status[0]);

  auto child = std::make_unique<ChildProcess>(
      Started{.pid = pid, .stdin_fd = to_child[1], .stdout_fd = from_child[0]});

  if (n > 0) {
    child->terminate(std::chrono::milliseconds(0));
    return make_error(ErrorKind::EngineUnavailable,
                      errno_message("cannot execute " + program, child_errno));
  }

  return child;
}

ChildProcess::~ChildProcess() {
  terminate();
}

bool ChildProcess::write_line(std::string_view line) {
  if (stdin_fd_ < 0) {
    return false;
  }

  std::string message(line);
  message += '\n';

  std::size_t offset = 0;
  while (offset < message.size()) {
    const ssize_t n = ::write(stdin_fd_, message.data() + offset, message.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<std::size_t>(n);
  }
  return true;
}

std::optional<std::string> ChildProcess::take_buffered_line() {
  const auto newline = buffer_.find('\n');
  if (newline == std::string::npos) {
    return std::nullopt;
  }

  std::string line = buffer_.substr(0, newline);
  buffer_.erase(0, newline + 1);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

std::optional<std::string> ChildProcess::read_line(std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  while (true) {
    if (auto line = take_buffered_line()) {
      return line;
    }
    if (eof_ || stdout_fd_ < 0) {
      return std::nullopt;
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      return std::nullopt;
    }

    pollfd pfd{.fd = stdout_fd_, .events = POLLIN, .revents = 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      eof_ = true;
      return std::nullopt;
    }
    if (ready == 0) {
      return std::nullopt;
    }

    std::array<char, 4096> chunk{};
    const ssize_t n = ::read(stdout_fd_, chunk.data(), chunk.size());
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      eof_ = true;
      continue;
    }
    buffer_.append(chunk.data(), static_cast<std::size_t>(n));
  }
}

void ChildProcess::close_pipes() noexcept {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
  close_pipes();
  if (pid_ <= 0) {
    return;
  }

  const auto deadline = Clock::now() + grace;
  while (true) {
    const pid_t reaped = ::waitpid(pid_, nullptr, WNOHANG);
    if (reaped == pid_ || (reaped < 0 && errno != EINTR)) {
      pid_ = -1;
      return;
    }
    if (Clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  ::kill(pid_, SIGKILL);
  while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
  }
  pid_ = -1;
}

} // namespace gambit
