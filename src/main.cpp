#include <iostream>

#include "gambit/about.hpp"
#include "gambit/config.hpp"
#include "gambit/console.hpp"
#include "gambit/engine_bridge.hpp"
#include "gambit/log.hpp"
#include "gambit/move_provider.hpp"
#include "gambit/persistence.hpp"
#include "gambit/session.hpp"

int main() {
  using namespace gambit;

  const Config config = Config::from_environment();
  Logger& logger = default_logger();
  logger.set_level(config.log_level);

  print_about(std::cout);

  EngineConfig engine_config{};
  if (config.engine_disabled) {
    logger.info("engine: disabled by GAMBIT_NO_ENGINE, using fallback search");
  } else {
    engine_config = resolve_engine(config.engine_candidates, EngineTimeouts{}, logger);
  }

  const MoveProvider provider(ExternalEngine(engine_config), logger);
  Session session(provider, logger, persistence::load_or_new(config.session_file(), logger));

  std::cout << "type 'help' for commands\n";
  console::run_loop(session, std::cin, std::cout, config.session_file());
  return 0;
}
