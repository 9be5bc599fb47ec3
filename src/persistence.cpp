#include "gambit/persistence.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace gambit::persistence {

namespace {

Error corrupt(std::string message) {
  return make_error(ErrorKind::PersistenceCorrupt, std::move(message));
}

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string lowercase(std::string_view text) {
  std::string lowered;
  lowered.reserve(text.size());
  for (const char c : text) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lowered;
}

std::optional<bool> parse_bool(std::string_view text) {
  const std::string lowered = lowercase(text);
  if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
    return true;
  }
  if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
    return false;
  }
  return std::nullopt;
}

std::optional<int> parse_int(std::string_view text) {
  if (text.empty() || text.size() > 3) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

Result<std::vector<Move>> parse_moves(std::string_view text) {
  std::vector<Move> moves;
  std::istringstream iss{std::string(text)};
  std::string token;
  while (iss >> token) {
    const auto mv = parse_uci_move(token);
    if (!mv.has_value()) {
      return corrupt("bad move '" + token + "' in move list");
    }
    moves.push_back(*mv);
  }
  return moves;
}

Result<std::uint8_t> decode_depth(const IniDocument& doc) {
  if (const auto depth = doc.get(GAME_STATE_SECTION, "search_depth")) {
    const auto parsed = parse_int(*depth);
    if (!parsed.has_value() || *parsed < search::MIN_DEPTH || *parsed > search::MAX_DEPTH) {
      return corrupt("search_depth must be 1-3, got '" + *depth + "'");
    }
    return static_cast<std::uint8_t>(*parsed);
  }

  if (const auto label = doc.get(GAME_STATE_SECTION, "difficulty")) {
    const auto difficulty = search::parse_difficulty(*label);
    if (!difficulty.has_value()) {
      return corrupt("unknown difficulty '" + *label + "'");
    }
    return search::depth_for(*difficulty);
  }

  return search::MAX_DEPTH;
}

Result<IniDocument> read_document(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return corrupt("cannot open " + path.string());
  }
  return IniDocument::parse(in);
}

Result<std::monostate> write_document(const IniDocument& doc, const std::filesystem::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return corrupt("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::trunc);
  out << doc.to_string();
  out.flush();
  if (!out) {
    return corrupt("cannot write " + path.string());
  }
  return std::monostate{};
}

} // namespace

// =============================================================================
// INI DOCUMENT
// =============================================================================

Result<IniDocument> IniDocument::parse(std::istream& in) {
  IniDocument doc;
  std::string raw;
  std::optional<std::string> current;
  std::size_t line_number = 0;

  while (std::getline(in, raw)) {
    ++line_number;
    const std::string_view line = trim(raw);

    if (line.empty() || line.front() == '#' || line.front() == ';') {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        return corrupt("bad section header on line " + std::to_string(line_number));
      }
      const std::string name(trim(line.substr(1, line.size() - 2)));
      // A repeated header reopens its section; entries merge into it.
      if (doc.find(name) == nullptr) {
        doc.sections_.push_back(Section{.name = name, .entries = {}});
      }
      current = name;
      continue;
    }

    const auto equals = line.find('=');
    if (equals == std::string_view::npos || !current.has_value()) {
      return corrupt("unexpected text on line " + std::to_string(line_number));
    }

    const std::string key = lowercase(trim(line.substr(0, equals)));
    if (key.empty()) {
      return corrupt("empty key on line " + std::to_string(line_number));
    }
    doc.set(*current, key, std::string(trim(line.substr(equals + 1))));
  }

  return doc;
}

IniDocument::Section* IniDocument::find(std::string_view section) {
  const auto it = std::find_if(sections_.begin(), sections_.end(),
                               [&](const Section& s) { return s.name == section; });
  return it == sections_.end() ? nullptr : &*it;
}

const IniDocument::Section* IniDocument::find(std::string_view section) const {
  const auto it = std::find_if(sections_.begin(), sections_.end(),
                               [&](const Section& s) { return s.name == section; });
  return it == sections_.end() ? nullptr : &*it;
}

bool IniDocument::has_section(std::string_view section) const {
  return find(section) != nullptr;
}

std::optional<std::string> IniDocument::get(std::string_view section, std::string_view key) const {
  const Section* found = find(section);
  if (found == nullptr) {
    return std::nullopt;
  }
  for (const auto& [k, v] : found->entries) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

void IniDocument::set(std::string_view section, std::string_view key, std::string value) {
  Section* target = find(section);
  if (target == nullptr) {
    sections_.push_back(Section{.name = std::string(section), .entries = {}});
    target = &sections_.back();
  }

  for (auto& [k, v] : target->entries) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  target->entries.emplace_back(std::string(key), std::move(value));
}

void IniDocument::remove_section(std::string_view section) {
  std::erase_if(sections_, [&](const Section& s) { return s.name == section; });
}

std::string IniDocument::to_string() const {
  std::ostringstream out;
  for (std::size_t i = 0; i < sections_.size(); ++i) {
    if (i > 0) {
      out << '\n';
    }
    out << '[' << sections_[i].name << "]\n";
    for (const auto& [key, value] : sections_[i].entries) {
      out << key << " = " << value << '\n';
    }
  }
  return out.str();
}

// =============================================================================
// GAME STATE CODEC
// =============================================================================

void encode(const SessionState& state, IniDocument& doc) {
  std::string moves;
  for (const auto& mv : state.history) {
    if (!moves.empty()) {
      moves += ' ';
    }
    moves += to_uci_string(mv);
  }

  doc.set(GAME_STATE_SECTION, "fen", state.position.to_fen());
  doc.set(GAME_STATE_SECTION, "moves", moves);
  doc.set(GAME_STATE_SECTION, "human_color", to_string(state.human_colour));
  doc.set(GAME_STATE_SECTION, "ai_enabled", state.ai_enabled ? "True" : "False");
  doc.set(GAME_STATE_SECTION, "search_depth", std::to_string(state.depth));
  doc.set(GAME_STATE_SECTION, "difficulty",
          search::to_string(search::difficulty_for(state.depth)));
  doc.set(GAME_STATE_SECTION, "captured_by_white", state.captured.by_white);
  doc.set(GAME_STATE_SECTION, "captured_by_black", state.captured.by_black);
}

Result<std::optional<SessionState>> decode(const IniDocument& doc) {
  if (!doc.has_section(GAME_STATE_SECTION)) {
    return std::optional<SessionState>{};
  }

  const auto fen = doc.get(GAME_STATE_SECTION, "fen");
  if (!fen.has_value() || fen->empty()) {
    return corrupt("saved game has no fen");
  }

  Position stored;
  try {
    stored = Position::from_fen(*fen);
  } catch (const std::runtime_error& e) {
    return corrupt(std::string("bad fen: ") + e.what());
  }

  const auto moves = parse_moves(doc.get(GAME_STATE_SECTION, "moves").value_or(""));
  if (!is_ok(moves)) {
    return error(moves);
  }

  SessionState state;

  const std::string colour_text = doc.get(GAME_STATE_SECTION, "human_color").value_or("white");
  const auto human = parse_colour(colour_text);
  if (!human.has_value()) {
    return corrupt("unknown human_color '" + colour_text + "'");
  }
  state.human_colour = *human;

  const std::string ai_text = doc.get(GAME_STATE_SECTION, "ai_enabled").value_or("True");
  const auto ai_enabled = parse_bool(ai_text);
  if (!ai_enabled.has_value()) {
    return corrupt("bad ai_enabled '" + ai_text + "'");
  }
  state.ai_enabled = *ai_enabled;

  const auto depth = decode_depth(doc);
  if (!is_ok(depth)) {
    return error(depth);
  }
  state.depth = value(depth);

  if (auto replayed = replay(state, value(moves)); !is_ok(replayed)) {
    return corrupt("move list does not replay: " + error(replayed).message);
  }

  if (state.position.to_fen() != stored.to_fen()) {
    return corrupt("move list reaches " + state.position.to_fen() + ", saved fen is " +
                   stored.to_fen());
  }

  return std::optional<SessionState>{std::move(state)};
}

Result<std::optional<SessionState>> load(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::optional<SessionState>{};
  }

  const auto doc = read_document(path);
  if (!is_ok(doc)) {
    return error(doc);
  }
  return decode(value(doc));
}

Result<std::monostate> save(const SessionState& state, const std::filesystem::path& path) {
  IniDocument doc;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    // An unreadable file is replaced outright; there is nothing to keep.
    if (auto existing = read_document(path); is_ok(existing)) {
      doc = std::move(std::get<IniDocument>(existing));
    }
  }

  encode(state, doc);
  return write_document(doc, path);
}

Result<std::monostate> clear_saved_game(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::monostate{};
  }

  auto doc = read_document(path);
  if (!is_ok(doc)) {
    // Nothing worth keeping in a file that does not parse.
    std::filesystem::remove(path, ec);
    if (ec) {
      return corrupt("cannot remove " + path.string() + ": " + ec.message());
    }
    return std::monostate{};
  }

  IniDocument& cleared = std::get<IniDocument>(doc);
  cleared.remove_section(GAME_STATE_SECTION);
  return write_document(cleared, path);
}

SessionState load_or_new(const std::filesystem::path& path, Logger& logger) {
  auto loaded = load(path);
  if (is_ok(loaded)) {
    if (auto& saved = std::get<std::optional<SessionState>>(loaded)) {
      logger.info("persistence: resumed game from " + path.string());
      return std::move(*saved);
    }
    return SessionState{};
  }

  std::ostringstream message;
  message << "persistence: discarding saved game (" << error(loaded) << ")";
  logger.warn(message.str());

  if (auto cleared = clear_saved_game(path); !is_ok(cleared)) {
    logger.error("persistence: " + error(cleared).message);
  }
  return SessionState{};
}

} // namespace gambit::persistence
