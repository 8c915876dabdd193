#pragma once

#include "games/gomoku/Board.hpp"
#include "games/gomoku/Types.hpp"
#include "util/BoundedQueue.hpp"
#include "util/CppUtil.hpp"

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

/*
 * Vocabulary exchanged between participants and a table.
 *
 * Commands flow from a participant to the table, events flow from the table to participants. The
 * wire name of each message is the name of its type enum value without the leading 'k' (see
 * MessageCodec).
 */

namespace arena {

enum event_type_t : uint8_t {
  kJoinAccepted,
  kJoinRejected,
  kMoveApplied,
  kBoardState,
  kTurnNotification,
  kParticipantJoined,
  kParticipantLeft,
  kGameOver,
  kError,
  kServerShutdown,
  kNumEventTypes
};

enum command_type_t : uint8_t { kJoinRequest, kMoveRequest, kDisconnect, kNumCommandTypes };

namespace concepts {

template <class T>
concept EventPayload = requires(T t) {
  { util::decay_copy(T::kType) } -> std::same_as<event_type_t>;
};

template <class T>
concept CommandPayload = requires(T t) {
  { util::decay_copy(T::kType) } -> std::same_as<command_type_t>;
};

}  // namespace concepts

struct JoinAccepted {
  static constexpr event_type_t kType = kJoinAccepted;

  gomoku::role_t role;
};

struct JoinRejected {
  static constexpr event_type_t kType = kJoinRejected;

  std::string reason;
};

struct MoveApplied {
  static constexpr event_type_t kType = kMoveApplied;

  int row;
  int col;
};

struct BoardState {
  static constexpr event_type_t kType = kBoardState;

  static BoardState from_board(const gomoku::Board& board) {
    return BoardState{board.grid(), board.current_turn()};
  }

  gomoku::Board::grid_t grid;
  gomoku::role_t current_turn;
};

struct TurnNotification {
  static constexpr event_type_t kType = kTurnNotification;

  gomoku::role_t role;
};

struct ParticipantJoined {
  static constexpr event_type_t kType = kParticipantJoined;

  gomoku::role_t role;
  std::string display_name;
};

struct ParticipantLeft {
  static constexpr event_type_t kType = kParticipantLeft;

  gomoku::role_t role;
};

struct GameOver {
  static constexpr event_type_t kType = kGameOver;

  std::optional<gomoku::role_t> winner;  // std::nullopt means draw
};

struct Error {
  static constexpr event_type_t kType = kError;

  std::string message;
};

struct ServerShutdown {
  static constexpr event_type_t kType = kServerShutdown;
};

// Alternatives are listed in event_type_t order
using Event = std::variant<JoinAccepted, JoinRejected, MoveApplied, BoardState, TurnNotification,
                           ParticipantJoined, ParticipantLeft, GameOver, Error, ServerShutdown>;
static_assert(std::variant_size_v<Event> == kNumEventTypes);

struct JoinRequest {
  static constexpr command_type_t kType = kJoinRequest;

  std::string display_name;
  std::optional<gomoku::role_t> role;  // preferred role, if any
};

struct MoveRequest {
  static constexpr command_type_t kType = kMoveRequest;

  gomoku::Move move() const { return gomoku::Move{row, col}; }

  int row;
  int col;
};

struct Disconnect {
  static constexpr command_type_t kType = kDisconnect;
};

// Alternatives are listed in command_type_t order
using Command = std::variant<JoinRequest, MoveRequest, Disconnect>;
static_assert(std::variant_size_v<Command> == kNumCommandTypes);

template <concepts::EventPayload T>
constexpr bool is_event_index_consistent() {
  return std::is_same_v<std::variant_alternative_t<T::kType, Event>, T>;
}

static_assert(is_event_index_consistent<JoinAccepted>());
static_assert(is_event_index_consistent<JoinRejected>());
static_assert(is_event_index_consistent<MoveApplied>());
static_assert(is_event_index_consistent<BoardState>());
static_assert(is_event_index_consistent<TurnNotification>());
static_assert(is_event_index_consistent<ParticipantJoined>());
static_assert(is_event_index_consistent<ParticipantLeft>());
static_assert(is_event_index_consistent<GameOver>());
static_assert(is_event_index_consistent<Error>());
static_assert(is_event_index_consistent<ServerShutdown>());

inline event_type_t get_type(const Event& event) {
  return std::visit([](const auto& e) { return e.kType; }, event);
}

inline command_type_t get_type(const Command& command) {
  return std::visit([](const auto& c) { return c.kType; }, command);
}

/*
 * Per-participant outbound queue. The table pushes, the participant's delivery task pops.
 */
using EventChannel = util::BoundedQueue<Event>;
using channel_ptr_t = std::shared_ptr<EventChannel>;

}  // namespace arena
