#include "gambit/engine_bridge.hpp"

#include <array>
#include <sstream>
#include <utility>

#include "gambit/movegen.hpp"

namespace gambit {

namespace {

using Clock = std::chrono::steady_clock;

// Reads lines until one starts with `prefix`, within one overall deadline.
// Engines are free to print "info ..." and other chatter in between.
Result<std::string> read_until(ChildProcess& child, std::string_view prefix,
                               std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      return make_error(ErrorKind::EngineProtocolError,
                        "timed out waiting for '" + std::string(prefix) + "'");
    }

    auto line = child.read_line(remaining);
    if (!line.has_value()) {
      if (child.at_eof()) {
        return make_error(ErrorKind::EngineProtocolError,
                          "engine exited before '" + std::string(prefix) + "'");
      }
      continue;
    }

    if (line->starts_with(prefix)) {
      return std::move(*line);
    }
  }
}

Result<std::monostate> send(ChildProcess& child, std::string_view line) {
  if (!child.write_line(line)) {
    return make_error(ErrorKind::EngineProtocolError,
                      "could not write '" + std::string(line) + "' to engine");
  }
  return std::monostate{};
}

Result<std::monostate> handshake(ChildProcess& child, const EngineTimeouts& timeouts) {
  constexpr std::array<std::pair<std::string_view, std::string_view>, 2> exchanges = {{
      {"uci", "uciok"},
      {"isready", "readyok"},
  }};

  for (const auto& [request, reply] : exchanges) {
    if (auto sent = send(child, request); !is_ok(sent)) {
      return error(sent);
    }
    if (auto received = read_until(child, reply, timeouts.handshake); !is_ok(received)) {
      return error(received);
    }
  }
  return std::monostate{};
}

void quit(ChildProcess& child, const EngineTimeouts& timeouts) {
  // The engine may already be gone; termination below covers that.
  [[maybe_unused]] const bool sent = child.write_line("quit");
  child.terminate(timeouts.shutdown);
}

// "position fen <root> moves ..." with the root being the position before
// the first move still on the undo stack, so the engine sees the same
// repetition history as the rules engine.
std::string position_command(const Position& pos) {
  Position root = pos;
  while (root.can_unmake()) {
    root.unmake_move();
  }

  std::string command = "position fen " + root.to_fen();
  const auto moves = pos.played_moves();
  if (!moves.empty()) {
    command += " moves";
    for (const auto& mv : moves) {
      command += ' ' + to_uci_string(mv);
    }
  }
  return command;
}

Result<Move> parse_bestmove(const std::string& line, const Position& pos) {
  std::istringstream iss(line);
  std::string keyword;
  std::string token;
  iss >> keyword >> token;

  if (token.empty() || token == "(none)" || token == "0000") {
    return make_error(ErrorKind::EngineProtocolError, "engine returned no move: '" + line + "'");
  }

  const auto mv = parse_uci_move(token);
  if (!mv.has_value()) {
    return make_error(ErrorKind::EngineProtocolError, "unparsable bestmove '" + token + "'");
  }
  if (!is_legal(pos, *mv)) {
    return make_error(ErrorKind::EngineProtocolError, "engine suggested illegal move " + token);
  }
  return *mv;
}

} // namespace

Result<std::monostate> probe_engine(const std::string& path, const EngineTimeouts& timeouts) {
  auto spawned = ChildProcess::spawn(path);
  if (!is_ok(spawned)) {
    return error(spawned);
  }

  ChildProcess& child = *value(spawned);
  const auto greeted = handshake(child, timeouts);
  quit(child, timeouts);

  if (!is_ok(greeted)) {
    return make_error(ErrorKind::EngineUnavailable, error(greeted).message);
  }
  return std::monostate{};
}

EngineConfig resolve_engine(const std::vector<std::string>& candidates,
                            const EngineTimeouts& timeouts, Logger& logger) {
  for (const auto& candidate : candidates) {
    if (candidate.empty()) {
      continue;
    }

    const auto probed = probe_engine(candidate, timeouts);
    if (is_ok(probed)) {
      logger.info("engine: using " + candidate);
      return EngineConfig{.available = true, .path = candidate, .preferred = true};
    }
    logger.debug("engine: " + candidate + " rejected (" + error(probed).message + ")");
  }

  const Error unavailable =
      make_error(ErrorKind::EngineUnavailable, "no external engine found, using fallback search");
  std::ostringstream message;
  message << "engine: " << unavailable;
  logger.warn(message.str());
  return EngineConfig{.available = false, .path = "", .preferred = false};
}

ExternalEngine::ExternalEngine(EngineConfig config, EngineTimeouts timeouts)
    : config_(std::move(config)), timeouts_(timeouts) {}

Result<Move> ExternalEngine::request_move(const Position& pos, std::uint8_t depth) const {
  if (!config_.available) {
    return make_error(ErrorKind::EngineUnavailable, "no external engine configured");
  }

  auto spawned = ChildProcess::spawn(config_.path);
  if (!is_ok(spawned)) {
    return make_error(ErrorKind::EngineProtocolError, error(spawned).message);
  }

  ChildProcess& child = *value(spawned);
  const auto result = [&]() -> Result<Move> {
    if (auto greeted = handshake(child, timeouts_); !is_ok(greeted)) {
      return error(greeted);
    }

    for (const std::string& line : {std::string("ucinewgame"), position_command(pos),
                                    "go depth " + std::to_string(depth)}) {
      if (auto sent = send(child, line); !is_ok(sent)) {
        return error(sent);
      }
    }

    const auto reply = read_until(child, "bestmove", timeouts_.bestmove);
    if (!is_ok(reply)) {
      return error(reply);
    }
    return parse_bestmove(value(reply), pos);
  }();

  quit(child, timeouts_);
  return result;
}

} // namespace gambit
