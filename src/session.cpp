#include "gambit/session.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "gambit/movegen.hpp"
#include "gambit/notation.hpp"

namespace gambit {

std::string to_string(SessionPhase phase) {
  switch (phase) {
  case SessionPhase::Idle:
    return "idle";
  case SessionPhase::Selecting:
    return "selecting";
  case SessionPhase::AwaitingAI:
    return "awaiting-ai";
  case SessionPhase::GameOver:
    return "game-over";
  }
  return "idle";
}

Session::Session(const MoveProvider& provider, Logger& logger, SessionState initial)
    : provider_(&provider), logger_(&logger), state_(std::move(initial)) {
  state_.depth = search::clamp_depth(state_.depth);
  state_.ai_busy = false;
  clear_selection();
  termination_ = gambit::termination(state_.position);
}

Session::~Session() {
  join_worker();
}

void Session::join_worker() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

SessionPhase Session::phase() const noexcept {
  if (state_.ai_busy) {
    return SessionPhase::AwaitingAI;
  }
  if (termination_.has_value()) {
    return SessionPhase::GameOver;
  }
  if (state_.selection.has_value()) {
    return SessionPhase::Selecting;
  }
  return SessionPhase::Idle;
}

bool Session::is_ai_turn() const noexcept {
  return state_.ai_enabled && state_.position.colour_to_move != state_.human_colour;
}

void Session::start() {
  render();
  request_ai_move();
}

// =============================================================================
// SELECTION
// =============================================================================

bool Session::selectable(Square square) const {
  const auto piece = state_.position.board.piece_at(square);
  const Colour to_move = state_.position.colour_to_move;
  return piece.has_value() && colour(*piece) == to_move && state_.human_controls(to_move);
}

void Session::select(Square square) {
  state_.selection = square;
  state_.legal_targets.clear();
  for (const auto& mv : legal_moves(state_.position)) {
    if (mv.from == square &&
        std::find(state_.legal_targets.begin(), state_.legal_targets.end(), mv.to) ==
            state_.legal_targets.end()) {
      state_.legal_targets.push_back(mv.to);
    }
  }
}

void Session::clear_selection() {
  state_.selection.reset();
  state_.legal_targets.clear();
}

void Session::click(Square square) {
  if (state_.ai_busy || termination_.has_value()) {
    return;
  }

  if (!state_.selection.has_value()) {
    if (selectable(square)) {
      select(square);
    }
    render();
    return;
  }

  Move mv{.from = *state_.selection, .to = square};
  const auto moving = state_.position.board.piece_at(mv.from);
  if (moving.has_value() && is_pawn(*moving) && square.is_back_rank()) {
    mv.promotion = PieceKind::Queen;
  }

  if (is_ok(play(mv))) {
    return;
  }

  if (selectable(square)) {
    select(square);
  } else {
    clear_selection();
  }
  render();
}

Result<std::monostate> Session::play(const Move& mv) {
  if (state_.ai_busy || termination_.has_value()) {
    return make_error(ErrorKind::IllegalMove, "no move accepted right now");
  }
  if (!state_.human_controls(state_.position.colour_to_move)) {
    return make_error(ErrorKind::IllegalMove, "it is the AI's turn");
  }

  auto applied = apply_move(state_, mv);
  if (!is_ok(applied)) {
    logger_->debug("session: " + error(applied).message);
    return applied;
  }

  clear_selection();
  after_move();
  request_ai_move();
  return applied;
}

void Session::after_move() {
  termination_ = gambit::termination(state_.position);
  render();

  if (termination_.has_value()) {
    logger_->info("session: " + describe(*termination_, state_.position));
    if (observer_ != nullptr) {
      observer_->on_game_over(*termination_);
    }
  }
}

// =============================================================================
// AI DISPATCH
// =============================================================================
// The worker receives a copy of the position and the depth by value; the
// provider is immutable and the logger is internally locked, so nothing the
// worker reads can change under it.
// =============================================================================

bool Session::request_ai_move() {
  if (state_.ai_busy || termination_.has_value() || !is_ai_turn()) {
    return false;
  }

  state_.ai_busy = true;
  clear_selection();
  join_worker();

  worker_ = std::thread([this, snapshot = state_.position, depth = state_.depth] {
    MoveChoice choice{};
    try {
      choice = provider_->select_move(snapshot, depth);
    } catch (const std::exception& e) {
      logger_->error(std::string("session: move selection failed: ") + e.what());
    }

    results_.push(choice);
    if (wake_) {
      wake_();
    }
  });

  render();
  return true;
}

void Session::apply_ai_choice(const MoveChoice& choice) {
  state_.ai_busy = false;

  if (!choice.move.has_value()) {
    logger_->warn("session: AI returned no move");
    render();
    return;
  }

  logger_->info("session: AI plays " + to_uci_string(*choice.move) + " (" +
                to_string(choice.source) + ")");

  if (auto applied = apply_move(state_, *choice.move); !is_ok(applied)) {
    logger_->error("session: " + error(applied).message);
    render();
    return;
  }

  after_move();
}

bool Session::poll() {
  auto choice = results_.try_pop();
  if (!choice.has_value()) {
    return false;
  }
  apply_ai_choice(*choice);
  return true;
}

void Session::wait_for_ai() {
  if (!state_.ai_busy) {
    return;
  }
  if (auto choice = results_.pop()) {
    apply_ai_choice(*choice);
  }
  join_worker();
}

// =============================================================================
// GAME CONTROL
// =============================================================================

bool Session::new_game() {
  if (state_.ai_busy) {
    logger_->warn("session: AI is thinking, try again shortly");
    return false;
  }

  reset_game(state_);
  termination_.reset();
  logger_->info("session: new game, human plays " + to_string(state_.human_colour));
  start();
  return true;
}

bool Session::set_human_colour(Colour colour) {
  if (state_.ai_busy) {
    logger_->warn("session: AI is thinking, try again shortly");
    return false;
  }
  state_.human_colour = colour;
  return new_game();
}

void Session::set_ai_enabled(bool enabled) {
  state_.ai_enabled = enabled;
  if (state_.selection.has_value() && !selectable(*state_.selection)) {
    clear_selection();
  }
  render();
  request_ai_move();
}

void Session::set_depth(int depth) {
  state_.depth = search::clamp_depth(depth);
}

std::string Session::status_line() const {
  if (termination_.has_value()) {
    return describe(*termination_, state_.position);
  }
  const std::string side = state_.position.colour_to_move == Colour::White ? "White" : "Black";
  return side + " to move";
}

std::vector<std::string> Session::move_list() const {
  return format_move_list(state_.history);
}

void Session::render() {
  if (observer_ != nullptr) {
    observer_->on_render(*this);
  }
}

} // namespace gambit
