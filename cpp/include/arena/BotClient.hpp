#pragma once

#include "arena/Constants.hpp"
#include "arena/Events.hpp"
#include "games/gomoku/Board.hpp"
#include "games/gomoku/SearchEngine.hpp"
#include "games/gomoku/Types.hpp"
#include "util/SocketUtil.hpp"

#include <optional>
#include <string>

namespace arena {

/*
 * A remote AI participant. Connects to a TableServer, joins like a human would, and answers each
 * TurnNotification for its own role with the SearchEngine's recommendation.
 *
 * The board is mirrored from BoardState events. The server always sends a BoardState before the
 * TurnNotification that depends on it, so the mirror is current whenever a move is requested.
 *
 * handle_event() contains all of the protocol logic and does no I/O, so that it can be driven
 * directly in tests. run() wraps it with a socket.
 */
class BotClient {
 public:
  struct Params {
    auto make_options_description();

    std::string remote_server = "localhost";
    io::port_t remote_port = kDefaultPort;
    std::string name = kDefaultBotName;
  };

  BotClient(const Params& params, const gomoku::SearchEngine::Params& search_params);

  /*
   * Updates the local view of the game from event. Returns the move to submit, if any.
   */
  std::optional<MoveRequest> handle_event(const Event& event);

  /*
   * Connects, joins, and plays until the game ends, the server shuts down, the join is rejected,
   * or the connection is lost.
   */
  void run();

  bool finished() const { return finished_; }
  std::optional<gomoku::role_t> role() const { return role_; }
  const gomoku::Board& board() const { return board_; }

  JoinRequest make_join_request() const { return JoinRequest{params_.name, std::nullopt}; }

 private:
  const Params params_;
  const gomoku::SearchEngine engine_;

  gomoku::Board board_;
  std::optional<gomoku::role_t> role_;
  bool finished_ = false;
};

}  // namespace arena

#include "inline/arena/BotClient.inl"
