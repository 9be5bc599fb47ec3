#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "gambit/error.hpp"
#include "gambit/log.hpp"
#include "gambit/move.hpp"
#include "gambit/position.hpp"
#include "gambit/process.hpp"

namespace gambit {

struct EngineTimeouts {
  std::chrono::milliseconds handshake{2000};
  std::chrono::milliseconds bestmove{30000};
  std::chrono::milliseconds shutdown{200};
};

struct EngineConfig {
  bool available{false};
  std::string path{};
  bool preferred{true}; // use ahead of the fallback search when available
};

// Starts `path`, completes the UCI handshake and quits again.
Result<std::monostate> probe_engine(const std::string& path, const EngineTimeouts& timeouts);

// First candidate that passes probe_engine. Called once at startup; a
// failure is logged as EngineUnavailable and never retried.
EngineConfig resolve_engine(const std::vector<std::string>& candidates,
                            const EngineTimeouts& timeouts, Logger& logger);

// One engine process per request: spawn, handshake, "position fen <root>
// moves ...", "go depth", read "bestmove", quit. The process never outlives
// the call.
class ExternalEngine {
public:
  explicit ExternalEngine(EngineConfig config, EngineTimeouts timeouts = {});

  [[nodiscard]] bool available() const noexcept { return config_.available; }
  [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

  // Fails with EngineUnavailable when no engine was resolved, and with
  // EngineProtocolError for any failure of this particular call.
  [[nodiscard]] Result<Move> request_move(const Position& pos, std::uint8_t depth) const;

private:
  EngineConfig config_;
  EngineTimeouts timeouts_;
};

} // namespace gambit
