#include "gambit/console.hpp"

#include <algorithm>
#include <istream>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gambit/channel.hpp"
#include "gambit/persistence.hpp"

namespace gambit::console {

namespace {

std::vector<std::string> split_tokens(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> parts;
  std::string token;
  while (iss >> token) {
    parts.push_back(token);
  }
  return parts;
}

const std::string& require_arg(const std::vector<std::string>& args, const std::string& what) {
  if (args.empty()) {
    throw std::runtime_error("missing " + what);
  }
  return args[0];
}

struct ConsoleEvent {
  enum class Kind { Line, AiReady, EndOfInput };

  Kind kind{Kind::Line};
  std::string line{};
};

// Marks the board for redrawing and announces the end of the game. The loop
// draws at most once per event.
class ConsoleObserver : public SessionObserver {
public:
  explicit ConsoleObserver(std::ostream& out) : out_(&out) {}

  void on_render(const Session&) override { dirty_ = true; }

  void on_game_over(Termination reason) override {
    *out_ << "game over: " << to_string(reason) << '\n';
  }

  bool take_dirty() {
    const bool was = dirty_;
    dirty_ = false;
    return was;
  }

private:
  std::ostream* out_;
  bool dirty_{false};
};

} // namespace

ConsoleCommand parse_command(const std::string& line) {
  const std::vector<std::string> parts = split_tokens(line);
  if (parts.empty()) {
    throw std::runtime_error("empty command");
  }

  const std::string& head = parts[0];
  const std::vector<std::string> args(parts.begin() + 1, parts.end());

  ConsoleCommand result{};

  if (head == "click") {
    const auto& arg = require_arg(args, "square");
    result.type = CommandType::Click;
    result.square = Square::parse(arg);
    if (!result.square.has_value()) {
      throw std::runtime_error("invalid square '" + arg + "'");
    }
  } else if (head == "move") {
    const auto& arg = require_arg(args, "move");
    result.type = CommandType::Move;
    result.move = parse_uci_move(arg);
    if (!result.move.has_value()) {
      throw std::runtime_error("invalid move '" + arg + "'");
    }
  } else if (head == "new") {
    result.type = CommandType::NewGame;
  } else if (head == "side") {
    const auto& arg = require_arg(args, "colour");
    result.type = CommandType::Side;
    result.colour = parse_colour(arg);
    if (!result.colour.has_value()) {
      throw std::runtime_error("invalid colour '" + arg + "'");
    }
  } else if (head == "ai") {
    const auto& arg = require_arg(args, "on|off|toggle");
    result.type = CommandType::Ai;
    if (arg == "on") {
      result.ai = AiSwitch::On;
    } else if (arg == "off") {
      result.ai = AiSwitch::Off;
    } else if (arg == "toggle") {
      result.ai = AiSwitch::Toggle;
    } else {
      throw std::runtime_error("invalid ai switch '" + arg + "'");
    }
  } else if (head == "difficulty") {
    const auto& arg = require_arg(args, "difficulty");
    result.type = CommandType::Difficulty;
    result.difficulty = search::parse_difficulty(arg);
    if (!result.difficulty.has_value()) {
      throw std::runtime_error("invalid difficulty '" + arg + "'");
    }
  } else if (head == "board") {
    result.type = CommandType::Board;
  } else if (head == "moves") {
    result.type = CommandType::Moves;
  } else if (head == "status") {
    result.type = CommandType::Status;
  } else if (head == "help") {
    result.type = CommandType::Help;
  } else if (head == "quit") {
    result.type = CommandType::Quit;
  } else {
    throw std::runtime_error("unknown command '" + head + "'");
  }

  return result;
}

std::string board_diagram(const SessionState& state) {
  std::ostringstream out;

  for (int rank = 7; rank >= 0; --rank) {
    out << rank + 1 << ' ';
    for (int file = 0; file < 8; ++file) {
      const Square square =
          Square::from_file_and_rank(static_cast<std::uint8_t>(file), static_cast<std::uint8_t>(rank));
      const auto piece = state.position.board.piece_at(square);
      const bool selected = state.selection == square;
      const bool target = std::find(state.legal_targets.begin(), state.legal_targets.end(),
                                    square) != state.legal_targets.end();

      char glyph = piece.has_value() ? to_char(*piece) : '.';
      if (target && !piece.has_value()) {
        glyph = '*';
      }

      if (selected) {
        out << '[' << glyph << ']';
      } else if (target && piece.has_value()) {
        out << '*' << glyph << ' ';
      } else {
        out << ' ' << glyph << ' ';
      }
    }
    out << '\n';
  }
  out << "   a  b  c  d  e  f  g  h\n";
  return out.str();
}

std::string help_text() {
  return "commands:\n"
         "  click <square>                select a piece or its destination\n"
         "  move <uci>                    play a move, e.g. e2e4 or e7e8q\n"
         "  new                           start a new game\n"
         "  side white|black              choose your colour (starts a new game)\n"
         "  ai on|off|toggle              enable or disable the computer opponent\n"
         "  difficulty easy|medium|hard   set the search depth\n"
         "  board | moves | status        show the board, move list or status\n"
         "  quit                          save and exit\n";
}

// =============================================================================
// EVENT LOOP
// =============================================================================
// Everything that mutates the session happens on this thread:
//
//   reader thread ──Line/EndOfInput──┐
//                                    ├──> events ──> run_loop (owner thread)
//   AI worker ─────wake: AiReady─────┘
//
// The reader stops by itself after forwarding "quit", so joining it on the
// way out never waits on the terminal.
// =============================================================================

void run_loop(Session& session, std::istream& in, std::ostream& out,
              const std::optional<std::filesystem::path>& session_file) {
  auto events = std::make_shared<Channel<ConsoleEvent>>();
  ConsoleObserver observer(out);

  session.set_observer(&observer);
  session.set_wake_callback([events] {
    events->push(ConsoleEvent{.kind = ConsoleEvent::Kind::AiReady, .line = ""});
  });

  std::thread reader([events, &in] {
    std::string line;
    while (std::getline(in, line)) {
      const auto parts = split_tokens(line);
      events->push(ConsoleEvent{.kind = ConsoleEvent::Kind::Line, .line = line});
      if (!parts.empty() && parts[0] == "quit") {
        return;
      }
    }
    events->push(ConsoleEvent{.kind = ConsoleEvent::Kind::EndOfInput, .line = ""});
  });

  auto write_line = [&](const std::string& text) { out << text << '\n' << std::flush; };

  auto redraw = [&] {
    if (observer.take_dirty()) {
      out << board_diagram(session.state());
      write_line(session.status_line());
    }
  };

  session.start();
  redraw();

  bool running = true;
  while (running) {
    const auto event = events->pop();
    if (!event.has_value() || event->kind == ConsoleEvent::Kind::EndOfInput) {
      break;
    }

    if (event->kind == ConsoleEvent::Kind::AiReady) {
      session.poll();
      redraw();
      continue;
    }

    if (split_tokens(event->line).empty()) {
      continue;
    }

    try {
      const auto cmd = parse_command(event->line);

      switch (cmd.type) {
      case CommandType::Click:
        session.click(*cmd.square);
        break;

      case CommandType::Move: {
        Move mv = *cmd.move;
        const auto moving = session.state().position.board.piece_at(mv.from);
        if (!mv.promotion.has_value() && moving.has_value() && is_pawn(*moving) &&
            mv.to.is_back_rank()) {
          mv.promotion = PieceKind::Queen;
        }
        if (const auto played = session.play(mv); !is_ok(played)) {
          write_line("error: " + error(played).message);
        }
        break;
      }

      case CommandType::NewGame:
        if (!session.new_game()) {
          write_line("error: AI is thinking, try again shortly");
        } else if (session_file.has_value()) {
          if (const auto cleared = persistence::clear_saved_game(*session_file); !is_ok(cleared)) {
            write_line("error: " + error(cleared).message);
          }
        }
        break;

      case CommandType::Side:
        if (!session.set_human_colour(*cmd.colour)) {
          write_line("error: AI is thinking, try again shortly");
        }
        break;

      case CommandType::Ai:
        if (*cmd.ai == AiSwitch::Toggle) {
          session.toggle_ai();
        } else {
          session.set_ai_enabled(*cmd.ai == AiSwitch::On);
        }
        write_line(std::string("ai: ") + (session.state().ai_enabled ? "on" : "off"));
        break;

      case CommandType::Difficulty:
        session.set_difficulty(*cmd.difficulty);
        write_line("difficulty: " + search::to_string(*cmd.difficulty));
        break;

      case CommandType::Board:
        out << board_diagram(session.state());
        break;

      case CommandType::Moves:
        for (const auto& line : session.move_list()) {
          write_line(line);
        }
        break;

      case CommandType::Status:
        write_line(session.status_line());
        break;

      case CommandType::Help:
        out << help_text();
        break;

      case CommandType::Quit:
        running = false;
        break;
      }
    } catch (const std::exception& ex) {
      write_line(std::string("error: ") + ex.what());
    }

    redraw();
  }

  session.wait_for_ai();
  redraw();

  if (reader.joinable()) {
    reader.join();
  }
  session.set_observer(nullptr);

  if (session_file.has_value()) {
    if (const auto saved = persistence::save(session.state(), *session_file); !is_ok(saved)) {
      write_line("error: " + error(saved).message);
    }
  }
}

} // namespace gambit::console
