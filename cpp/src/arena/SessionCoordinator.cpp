#include "arena/SessionCoordinator.hpp"

#include "arena/Constants.hpp"
#include "arena/MessageCodec.hpp"
#include "games/gomoku/WinDetector.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace arena {

gomoku::role_t SessionCoordinator::join(const std::string& display_name, channel_ptr_t channel,
                                        std::optional<gomoku::role_t> preferred_role) {
  RELEASE_ASSERT(channel != nullptr);
  std::unique_lock lock(mutex_);

  int num_humans = num_humans_helper();
  if (num_humans >= gomoku::kNumPlayers) {
    LOG_WARN("Rejecting join from {}: table is full", display_name);
    throw gomoku::GameError(gomoku::kTableFull, "Table is full");
  }

  gomoku::role_t role = gomoku::kBlack;
  if (preferred_role && !get_human(*preferred_role)) {
    role = *preferred_role;
  } else if (num_humans > 0) {
    role = get_human(gomoku::kBlack) ? gomoku::kWhite : gomoku::kBlack;
  }

  if (get_ai(role)) {
    LOG_INFO("Unbinding AI from {}", gomoku::role_to_str(role));
    seats_[role].reset();
  }
  seats_[role].emplace(HumanSeat{channel, display_name});
  LOG_INFO("{} joined as {}", display_name, gomoku::role_to_str(role));

  send(role, JoinAccepted{role});
  send(role, BoardState::from_board(board_));
  broadcast(ParticipantJoined{role, display_name});

  gomoku::role_t opponent = gomoku::other(role);
  if (num_humans == 0 && params_.enable_ai && !seats_[opponent]) {
    seats_[opponent].emplace(AiSeat{gomoku::SearchEngine(params_.search_params)});
    LOG_INFO("Bound AI to {}", gomoku::role_to_str(opponent));
    broadcast(ParticipantJoined{opponent, kAiDisplayName});
  }

  if (state_helper() == kFinished) {
    send(role, GameOver{gomoku::WinDetector::outcome(board_).winner});
  } else {
    advance();
  }
  return role;
}

gomoku::Outcome SessionCoordinator::submit_move(gomoku::role_t role, const gomoku::Move& move) {
  std::unique_lock lock(mutex_);

  try {
    table_state_t state = state_helper();
    if (state == kFinished) {
      throw gomoku::GameError(gomoku::kGameOver, "The game is over");
    }
    if (state != kInPlay) {
      throw gomoku::GameError(gomoku::kTableNotReady, "Waiting for a second player");
    }
    if (!get_human(role)) {
      throw gomoku::GameError(gomoku::kNotYourTurn, "{} is not controlled by this participant",
                              gomoku::role_to_str(role));
    }

    apply_move(move, role);
  } catch (const gomoku::GameError& e) {
    LOG_WARN("Rejected move {} by {}: {}", move.to_str(), gomoku::role_to_str(role), e.what());
    send(role, Error{e.what()});
    throw;
  }

  advance();
  return gomoku::WinDetector::outcome(board_);
}

void SessionCoordinator::leave(gomoku::role_t role) {
  std::unique_lock lock(mutex_);

  const HumanSeat* human = get_human(role);
  if (!human) {
    LOG_WARN("Ignoring leave of {}: not held by a human", gomoku::role_to_str(role));
    return;
  }

  LOG_INFO("{} left ({})", human->display_name, gomoku::role_to_str(role));
  human->channel->close();
  seats_[role].reset();
  broadcast(ParticipantLeft{role});

  if (num_humans_helper() == 0) {
    reset();
  }
}

void SessionCoordinator::shutdown() {
  std::unique_lock lock(mutex_);

  LOG_INFO("Shutting down table");
  broadcast(ServerShutdown{});
  for (const seat_t& seat : seats_) {
    if (!seat) continue;
    if (const HumanSeat* human = std::get_if<HumanSeat>(&*seat)) {
      human->channel->close();
    }
  }
}

gomoku::Board SessionCoordinator::board() const {
  std::unique_lock lock(mutex_);
  return board_;
}

SessionCoordinator::table_state_t SessionCoordinator::state() const {
  std::unique_lock lock(mutex_);
  return state_helper();
}

gomoku::Outcome SessionCoordinator::outcome() const {
  std::unique_lock lock(mutex_);
  return gomoku::WinDetector::outcome(board_);
}

bool SessionCoordinator::is_ai_controlled(gomoku::role_t role) const {
  std::unique_lock lock(mutex_);
  return get_ai(role) != nullptr;
}

bool SessionCoordinator::is_human_controlled(gomoku::role_t role) const {
  std::unique_lock lock(mutex_);
  return get_human(role) != nullptr;
}

int SessionCoordinator::num_humans() const {
  std::unique_lock lock(mutex_);
  return num_humans_helper();
}

const char* SessionCoordinator::state_to_str(table_state_t state) {
  switch (state) {
    case kEmpty:
      return "Empty";
    case kAwaitingSecondPlayer:
      return "AwaitingSecondPlayer";
    case kInPlay:
      return "InPlay";
    case kFinished:
      return "Finished";
    default:
      throw util::Exception("Unknown table state {}", int(state));
  }
}

SessionCoordinator::table_state_t SessionCoordinator::state_helper() const {
  if (num_humans_helper() == 0) return kEmpty;
  if (gomoku::WinDetector::outcome(board_).terminal()) return kFinished;
  if (seats_[gomoku::kBlack] && seats_[gomoku::kWhite]) return kInPlay;
  return kAwaitingSecondPlayer;
}

const SessionCoordinator::HumanSeat* SessionCoordinator::get_human(gomoku::role_t role) const {
  const seat_t& seat = seats_[role];
  return seat ? std::get_if<HumanSeat>(&*seat) : nullptr;
}

const SessionCoordinator::AiSeat* SessionCoordinator::get_ai(gomoku::role_t role) const {
  const seat_t& seat = seats_[role];
  return seat ? std::get_if<AiSeat>(&*seat) : nullptr;
}

int SessionCoordinator::num_humans_helper() const {
  int n = 0;
  for (int r = 0; r < gomoku::kNumPlayers; ++r) {
    n += get_human(gomoku::role_t(r)) != nullptr;
  }
  return n;
}

void SessionCoordinator::apply_move(const gomoku::Move& move, gomoku::role_t role) {
  board_.place(move, role);
  LOG_INFO("{} plays {}", gomoku::role_to_str(role), move.to_str());

  broadcast(MoveApplied{move.row, move.col});
  broadcast(BoardState::from_board(board_));

  gomoku::Outcome outcome = gomoku::WinDetector::outcome(board_);
  if (outcome.terminal()) {
    LOG_INFO("Game over: {}", outcome.to_str());
    broadcast(GameOver{outcome.winner});
  }
}

// Lets the AI move while it holds the current turn, then notifies the human whose turn it is.
void SessionCoordinator::advance() {
  while (state_helper() == kInPlay) {
    gomoku::role_t turn = board_.current_turn();
    const AiSeat* ai = get_ai(turn);
    if (!ai) {
      send(turn, TurnNotification{turn});
      return;
    }
    gomoku::Move move = ai->engine.recommend(board_, turn);
    apply_move(move, turn);
  }
}

void SessionCoordinator::send(gomoku::role_t role, const Event& event) {
  const HumanSeat* human = get_human(role);
  if (!human) return;

  switch (human->channel->try_push(event)) {
    case EventChannel::kPushed:
      break;
    case EventChannel::kFull:
      LOG_WARN("{} ({}) fell {} events behind, closing its channel", human->display_name,
               gomoku::role_to_str(role), human->channel->capacity());
      human->channel->close();
      break;
    case EventChannel::kClosed:
      LOG_DEBUG("Dropped {} event for {}: channel closed",
                MessageCodec::type_name(get_type(event)), gomoku::role_to_str(role));
      break;
  }
}

void SessionCoordinator::broadcast(const Event& event) {
  for (int r = 0; r < gomoku::kNumPlayers; ++r) {
    send(gomoku::role_t(r), event);
  }
}

void SessionCoordinator::reset() {
  LOG_INFO("Resetting table");
  board_ = gomoku::Board();
  for (seat_t& seat : seats_) {
    seat.reset();
  }
}

}  // namespace arena
