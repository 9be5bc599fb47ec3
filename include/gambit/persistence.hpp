#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gambit/error.hpp"
#include "gambit/log.hpp"
#include "gambit/session_state.hpp"

namespace gambit::persistence {

inline constexpr std::string_view GAME_STATE_SECTION = "GameState";

// Flat "[section]" / "key = value" document. Section and entry order are kept
// so that sections owned by someone else are written back unchanged.
class IniDocument {
public:
  // Fails with PersistenceCorrupt on a line that is neither a section header,
  // an entry, a comment nor blank.
  static Result<IniDocument> parse(std::istream& in);

  [[nodiscard]] bool has_section(std::string_view section) const;
  [[nodiscard]] std::optional<std::string> get(std::string_view section,
                                               std::string_view key) const;
  void set(std::string_view section, std::string_view key, std::string value);
  void remove_section(std::string_view section);

  [[nodiscard]] std::string to_string() const;

private:
  struct Section {
    std::string name;
    std::vector<std::pair<std::string, std::string>> entries;
  };

  Section* find(std::string_view section);
  [[nodiscard]] const Section* find(std::string_view section) const;

  std::vector<Section> sections_{};
};

// Writes the persisted subset of `state` into the [GameState] section.
void encode(const SessionState& state, IniDocument& doc);

// Rebuilds a session from [GameState]: nullopt when the section is absent,
// PersistenceCorrupt when anything in it is malformed or the move list does
// not replay to the stored position. Never partially trusted.
Result<std::optional<SessionState>> decode(const IniDocument& doc);

// A missing file is "no saved game", not an error.
Result<std::optional<SessionState>> load(const std::filesystem::path& path);

// Rewrites [GameState], keeping every other section already in the file.
Result<std::monostate> save(const SessionState& state, const std::filesystem::path& path);

// Drops [GameState] but keeps every other section.
Result<std::monostate> clear_saved_game(const std::filesystem::path& path);

// load(), with a corrupt save discarded (and logged) in favour of a fresh game.
SessionState load_or_new(const std::filesystem::path& path, Logger& logger);

} // namespace gambit::persistence
