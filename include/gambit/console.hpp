#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "gambit/colour.hpp"
#include "gambit/move.hpp"
#include "gambit/search.hpp"
#include "gambit/session.hpp"
#include "gambit/square.hpp"

namespace gambit::console {

enum class CommandType {
  Click,
  Move,
  NewGame,
  Side,
  Ai,
  Difficulty,
  Board,
  Moves,
  Status,
  Help,
  Quit
};

enum class AiSwitch { On, Off, Toggle };

struct ConsoleCommand {
  CommandType type{CommandType::Help};
  std::optional<Square> square{};
  std::optional<Move> move{};
  std::optional<Colour> colour{};
  std::optional<AiSwitch> ai{};
  std::optional<search::Difficulty> difficulty{};
};

// Throws std::runtime_error describing what is wrong with the line.
ConsoleCommand parse_command(const std::string& line);

// Text diagram, rank 8 at the top. Selection is shown in brackets and legal
// destinations of the selected piece as '*'.
std::string board_diagram(const SessionState& state);

std::string help_text();

// Owner-thread event loop. A reader thread feeds `in` line by line into the
// same channel the session's AI completion posts to. On quit or end of input
// any in-flight AI move is applied and, if `session_file` is set, the session
// is saved there. A successful `new` drops the saved game from that file.
void run_loop(Session& session, std::istream& in, std::ostream& out,
              const std::optional<std::filesystem::path>& session_file = std::nullopt);

} // namespace gambit::console
