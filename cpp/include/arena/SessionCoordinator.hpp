#pragma once

#include "arena/Events.hpp"
#include "games/gomoku/Board.hpp"
#include "games/gomoku/SearchEngine.hpp"
#include "games/gomoku/Types.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace arena {

/*
 * SessionCoordinator owns the state of one table: the Board, and the registry of which
 * participant occupies each role.
 *
 * Each role is either vacant, held by a human (represented by the channel through which the human
 * receives events), or held by the AI. All public methods acquire a single mutex for their entire
 * duration, so at most one mutation is ever in flight. In particular, when a human move hands the
 * turn to the AI, the AI's reply is computed and applied before the mutex is released, so that no
 * other request can interleave between the two moves.
 *
 * Events are pushed to each human's channel independently, and a push never waits, so that one
 * participant that stops consuming cannot hold up the table or the other participant. The channel
 * capacity bounds how far a participant may fall behind: if a push finds the channel full, that
 * channel is closed, and the transport then disconnects the participant (which shows up here as a
 * leave()). Pushes to a closed channel are dropped.
 *
 * Rule violations are thrown as gomoku::GameError. Before a request from a seated participant is
 * rejected, an Error event describing the problem is delivered to that participant's channel.
 *
 * Table states:
 *
 *   kEmpty                no humans seated
 *   kAwaitingSecondPlayer one human seated, other role vacant
 *   kInPlay               both roles occupied (human+human or human+AI), game not over
 *   kFinished             game over; persists until every human has left, which resets the table
 */
class SessionCoordinator {
 public:
  struct Params {
    auto make_options_description();

    bool enable_ai = true;
    gomoku::SearchEngine::Params search_params;
  };

  enum table_state_t : int8_t { kEmpty, kAwaitingSecondPlayer, kInPlay, kFinished };

  SessionCoordinator() : params_() {}
  explicit SessionCoordinator(const Params& params) : params_(params) {}

  /*
   * Seats a human who will receive events through channel, and returns the assigned role.
   *
   * The first human is assigned Black, the second the remaining role. A preferred role is honored
   * if no human holds it. If an AI holds the assigned role, it is unbound first. If the joiner is
   * the only human and AI is enabled, the AI is bound to the other role, and moves immediately if
   * it is the AI's turn.
   *
   * Throws GameError(kTableFull) if two humans are already seated. No event is delivered to channel
   * in that case.
   */
  gomoku::role_t join(const std::string& display_name, channel_ptr_t channel,
                      std::optional<gomoku::role_t> preferred_role = std::nullopt);

  /*
   * Applies move for role, and then any AI reply. Returns the resulting outcome.
   *
   * Throws GameError with code:
   *   kGameOver         if the table is kFinished
   *   kTableNotReady    if a role is vacant
   *   kOutOfBounds, kNotYourTurn, kPositionOccupied from Board::place()
   */
  gomoku::Outcome submit_move(gomoku::role_t role, const gomoku::Move& move);

  /*
   * Unseats the human holding role and closes their channel. Resets the table if no humans
   * remain. No-op if role is not held by a human.
   */
  void leave(gomoku::role_t role);

  /*
   * Delivers ServerShutdown to every seated human and closes their channels. The board is left
   * untouched.
   */
  void shutdown();

  gomoku::Board board() const;
  table_state_t state() const;
  gomoku::Outcome outcome() const;
  bool is_ai_controlled(gomoku::role_t role) const;
  bool is_human_controlled(gomoku::role_t role) const;
  int num_humans() const;

  static const char* state_to_str(table_state_t state);

 private:
  struct HumanSeat {
    channel_ptr_t channel;
    std::string display_name;
  };

  struct AiSeat {
    gomoku::SearchEngine engine;
  };

  using seat_t = std::optional<std::variant<HumanSeat, AiSeat>>;
  using seat_array_t = std::array<seat_t, gomoku::kNumPlayers>;

  // The following methods all assume mutex_ is locked
  table_state_t state_helper() const;
  const HumanSeat* get_human(gomoku::role_t role) const;
  const AiSeat* get_ai(gomoku::role_t role) const;
  int num_humans_helper() const;
  void apply_move(const gomoku::Move& move, gomoku::role_t role);
  void advance();
  void send(gomoku::role_t role, const Event& event);
  void broadcast(const Event& event);
  void reset();

  const Params params_;

  mutable std::mutex mutex_;
  gomoku::Board board_;
  seat_array_t seats_;
};

}  // namespace arena

#include "inline/arena/SessionCoordinator.inl"
