#pragma once

#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "gambit/channel.hpp"
#include "gambit/error.hpp"
#include "gambit/log.hpp"
#include "gambit/move_provider.hpp"
#include "gambit/outcome.hpp"
#include "gambit/search.hpp"
#include "gambit/session_state.hpp"

namespace gambit {

enum class SessionPhase { Idle, Selecting, AwaitingAI, GameOver };

std::string to_string(SessionPhase phase);

class Session;

// Hooks for whatever draws the board. Called on the owner thread only.
class SessionObserver {
public:
  virtual ~SessionObserver() = default;
  virtual void on_render(const Session& session) = 0;
  virtual void on_game_over(Termination reason) = 0;
};

// =============================================================================
// SESSION: the game controller
// =============================================================================
//
// Owns the single SessionState and is the only thing that mutates it. All
// public methods are meant for one owner thread (the UI or console loop).
//
// AI moves are computed on a worker thread from a copy of the position. The
// worker never touches the session; it posts its MoveChoice into a channel
// and the owner applies it in poll() or wait_for_ai(). The busy flag is set
// before the worker starts and cleared only after its result was applied, so
// there is at most one AI computation in flight.
//
// =============================================================================
class Session {
public:
  Session(const MoveProvider& provider, Logger& logger, SessionState initial = {});
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  void set_observer(SessionObserver* observer) { observer_ = observer; }

  // Invoked from the worker thread once a result is waiting for poll().
  // Must be set before the first AI dispatch.
  void set_wake_callback(std::function<void()> wake) { wake_ = std::move(wake); }

  // Kicks off the AI when it moves first (fresh game as black, or a restored
  // game saved on the AI's turn).
  void start();

  // Board click: select, reselect, deselect or move.
  void click(Square square);

  // Plays `mv` for the human side. Fails with IllegalMove when the move is
  // not legal or not the human's to make right now.
  Result<std::monostate> play(const Move& mv);

  // Rejected (false) while the AI is thinking.
  bool new_game();

  bool set_human_colour(Colour colour);
  void set_ai_enabled(bool enabled);
  void toggle_ai() { set_ai_enabled(!state_.ai_enabled); }
  void set_depth(int depth);
  void set_difficulty(search::Difficulty difficulty) { set_depth(search::depth_for(difficulty)); }

  // Starts an AI move unless one is in flight, the game is over or it is not
  // the AI's turn. Returns whether a worker was started.
  bool request_ai_move();

  // Applies a finished AI result, if any. Never blocks.
  bool poll();

  // Blocks until the in-flight AI move (if any) has been applied.
  void wait_for_ai();

  [[nodiscard]] const SessionState& state() const noexcept { return state_; }
  [[nodiscard]] SessionPhase phase() const noexcept;
  [[nodiscard]] std::optional<Termination> termination() const noexcept { return termination_; }
  [[nodiscard]] bool is_ai_turn() const noexcept;

  [[nodiscard]] std::string status_line() const;
  [[nodiscard]] std::vector<std::string> move_list() const;
  [[nodiscard]] search::Difficulty difficulty() const noexcept {
    return search::difficulty_for(state_.depth);
  }

private:
  void select(Square square);
  void clear_selection();
  [[nodiscard]] bool selectable(Square square) const;
  void after_move();
  void apply_ai_choice(const MoveChoice& choice);
  void render();
  void join_worker();

  const MoveProvider* provider_;
  Logger* logger_;
  SessionState state_;
  std::optional<Termination> termination_{};
  SessionObserver* observer_{nullptr};
  std::function<void()> wake_{};
  Channel<MoveChoice> results_{};
  std::thread worker_{};
};

} // namespace gambit
