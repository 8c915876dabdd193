#include "arena/BotClient.hpp"

#include "arena/MessageCodec.hpp"
#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/json.hpp>

namespace arena {

BotClient::BotClient(const Params& params, const gomoku::SearchEngine::Params& search_params)
    : params_(params), engine_(search_params) {
  CLEAN_ASSERT(params_.name.size() <= size_t(kMaxNameLength), "name exceeds {} characters",
               kMaxNameLength);
}

std::optional<MoveRequest> BotClient::handle_event(const Event& event) {
  std::optional<MoveRequest> response;

  std::visit(
    util::overloaded{
      [&](const JoinAccepted& e) {
        role_ = e.role;
        LOG_INFO("Joined as {}", gomoku::role_to_str(e.role));
      },
      [&](const JoinRejected& e) {
        LOG_WARN("Join rejected: {}", e.reason);
        finished_ = true;
      },
      [&](const MoveApplied& e) { LOG_DEBUG("Move applied at ({}, {})", e.row, e.col); },
      [&](const BoardState& e) { board_ = gomoku::Board::from_grid(e.grid, e.current_turn); },
      [&](const TurnNotification& e) {
        if (!role_ || e.role != *role_) return;
        gomoku::Move move = engine_.recommend(board_, *role_);
        LOG_INFO("Playing {}", move.to_str());
        response = MoveRequest{move.row, move.col};
      },
      [&](const ParticipantJoined& e) {
        LOG_INFO("{} joined as {}", e.display_name, gomoku::role_to_str(e.role));
      },
      [&](const ParticipantLeft& e) { LOG_INFO("{} left", gomoku::role_to_str(e.role)); },
      [&](const GameOver& e) {
        if (!e.winner) {
          LOG_INFO("Game over: draw");
        } else {
          LOG_INFO("Game over: {} wins{}", gomoku::role_to_str(*e.winner),
                   e.winner == role_ ? " (us)" : "");
        }
        finished_ = true;
      },
      [&](const Error& e) { LOG_WARN("Server reported error: {}", e.message); },
      [&](const ServerShutdown&) {
        LOG_INFO("Server is shutting down");
        finished_ = true;
      },
    },
    event);

  return response;
}

void BotClient::run() {
  LOG_INFO("Connecting to {}:{} as {}", params_.remote_server, params_.remote_port, params_.name);
  auto socket = io::Socket::create_client_socket(params_.remote_server, params_.remote_port);
  socket->json_write(MessageCodec::encode(Command{make_join_request()}));

  while (!finished_) {
    boost::json::value msg;
    if (!socket->json_read(&msg)) {
      LOG_WARN("Connection closed by server");
      break;
    }
    std::optional<MoveRequest> move = handle_event(MessageCodec::decode_event(msg));
    if (move) {
      socket->json_write(MessageCodec::encode(Command{*move}));
    }
  }

  if (finished_) {
    try {
      socket->json_write(MessageCodec::encode(Command{Disconnect{}}));
    } catch (const util::Exception& e) {
      LOG_WARN("Could not send Disconnect: {}", e.what());
    }
  }
  socket->shutdown();
}

}  // namespace arena
