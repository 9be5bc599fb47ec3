#include "gambit/move_provider.hpp"

#include <sstream>
#include <utility>

#include "gambit/search.hpp"

namespace gambit {

std::string to_string(MoveSource source) {
  switch (source) {
  case MoveSource::ExternalEngine:
    return "external engine";
  case MoveSource::FallbackSearch:
    return "fallback search";
  }
  return "unknown";
}

MoveProvider::MoveProvider(Logger& logger) : logger_(&logger) {}

MoveProvider::MoveProvider(ExternalEngine engine, Logger& logger)
    : engine_(std::move(engine)), logger_(&logger) {}

MoveChoice MoveProvider::select_move(const Position& pos, int depth) const {
  const std::uint8_t clamped = search::clamp_depth(depth);

  if (uses_external_engine()) {
    const auto reply = engine_->request_move(pos, clamped);
    if (is_ok(reply)) {
      return MoveChoice{.move = value(reply), .source = MoveSource::ExternalEngine};
    }

    std::ostringstream message;
    message << "engine: " << error(reply) << ", falling back to search for this move";
    logger_->warn(message.str());
  }

  Position scratch = pos;
  const auto result = search::search(scratch, clamped);
  logger_->debug("search: depth " + std::to_string(result.depth) + " nodes " +
                 std::to_string(result.nodes) + " eval " + std::to_string(result.eval));
  return MoveChoice{.move = result.best_move, .source = MoveSource::FallbackSearch};
}

} // namespace gambit
