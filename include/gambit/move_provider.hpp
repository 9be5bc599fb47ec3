#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "gambit/engine_bridge.hpp"
#include "gambit/log.hpp"
#include "gambit/move.hpp"
#include "gambit/position.hpp"

namespace gambit {

enum class MoveSource { ExternalEngine, FallbackSearch };

std::string to_string(MoveSource source);

struct MoveChoice {
  std::optional<Move> move{};
  MoveSource source{MoveSource::FallbackSearch};
};

// Picks the AI's move. The external engine is asked first when one was
// resolved; any failure of that call falls through to the built-in search
// for this move only. Safe to call from a worker thread.
class MoveProvider {
public:
  explicit MoveProvider(Logger& logger);
  MoveProvider(ExternalEngine engine, Logger& logger);

  // `depth` is clamped to the supported 1..3 range.
  [[nodiscard]] MoveChoice select_move(const Position& pos, int depth) const;

  [[nodiscard]] bool uses_external_engine() const noexcept {
    return engine_.has_value() && engine_->available() && engine_->config().preferred;
  }

private:
  std::optional<ExternalEngine> engine_{};
  Logger* logger_;
};

} // namespace gambit
