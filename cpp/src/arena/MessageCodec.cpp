#include "arena/MessageCodec.hpp"

#include "arena/Constants.hpp"
#include "games/gomoku/Constants.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <climits>
#include <cstdint>
#include <string>

namespace arena {

namespace {

namespace json = boost::json;

const json::object& as_object(const json::value& jv) {
  const json::object* obj = jv.if_object();
  if (!obj) {
    throw util::CleanException("message is not a json object");
  }
  return *obj;
}

const json::value& get_field(const json::object& obj, const char* key) {
  const json::value* value = obj.if_contains(key);
  if (!value) {
    throw util::CleanException("missing field \"{}\"", key);
  }
  return *value;
}

int get_int(const json::object& obj, const char* key) {
  const json::value& value = get_field(obj, key);
  if (value.is_int64()) {
    int64_t x = value.get_int64();
    if (x >= INT_MIN && x <= INT_MAX) return static_cast<int>(x);
  } else if (value.is_uint64()) {
    uint64_t x = value.get_uint64();
    if (x <= INT_MAX) return static_cast<int>(x);
  }
  throw util::CleanException("field \"{}\" is not a valid integer", key);
}

std::string get_string(const json::object& obj, const char* key) {
  const json::string* s = get_field(obj, key).if_string();
  if (!s) {
    throw util::CleanException("field \"{}\" is not a string", key);
  }
  return std::string(s->data(), s->size());
}

json::value encode_role(gomoku::role_t role) { return json::string(gomoku::role_to_str(role)); }

json::value encode_role(const std::optional<gomoku::role_t>& role) {
  if (!role) return nullptr;
  return encode_role(*role);
}

std::optional<gomoku::role_t> decode_optional_role(const json::value& value, const char* key) {
  if (value.is_null()) return std::nullopt;
  const json::string* s = value.if_string();
  std::optional<gomoku::role_t> role;
  if (s) {
    role = gomoku::role_from_str(std::string(s->data(), s->size()));
  }
  if (!role) {
    throw util::CleanException("field \"{}\" is not a valid role", key);
  }
  return role;
}

gomoku::role_t decode_role(const json::object& obj, const char* key) {
  std::optional<gomoku::role_t> role = decode_optional_role(get_field(obj, key), key);
  if (!role) {
    throw util::CleanException("field \"{}\" must not be null", key);
  }
  return *role;
}

json::value encode_grid(const gomoku::Board::grid_t& grid) {
  json::array rows;
  for (int row = 0; row < gomoku::kBoardDimension; ++row) {
    json::array cells;
    for (int col = 0; col < gomoku::kBoardDimension; ++col) {
      cells.push_back(encode_role(grid[gomoku::Board::index(row, col)]));
    }
    rows.push_back(std::move(cells));
  }
  return rows;
}

gomoku::Board::grid_t decode_grid(const json::object& obj) {
  const json::array* rows = get_field(obj, "grid").if_array();
  if (!rows || rows->size() != gomoku::kBoardDimension) {
    throw util::CleanException("field \"grid\" must be an array of {} rows",
                               gomoku::kBoardDimension);
  }

  gomoku::Board::grid_t grid;
  for (int row = 0; row < gomoku::kBoardDimension; ++row) {
    const json::array* cells = (*rows)[row].if_array();
    if (!cells || cells->size() != gomoku::kBoardDimension) {
      throw util::CleanException("grid row {} must be an array of {} cells", row,
                                 gomoku::kBoardDimension);
    }
    for (int col = 0; col < gomoku::kBoardDimension; ++col) {
      grid[gomoku::Board::index(row, col)] = decode_optional_role((*cells)[col], "grid");
    }
  }
  return grid;
}

template <typename E>
E decode_type(const json::object& obj, E num_types) {
  std::string name = get_string(obj, "type");
  auto type = magic_enum::enum_cast<E>("k" + name);
  if (!type || *type == num_types) {
    throw util::CleanException("unknown message type \"{}\"", name);
  }
  return *type;
}

}  // namespace

json::value MessageCodec::encode(const Event& event) {
  json::object obj;
  obj["type"] = type_name(get_type(event));

  std::visit(util::overloaded{
               [&](const JoinAccepted& e) { obj["role"] = encode_role(e.role); },
               [&](const JoinRejected& e) { obj["reason"] = e.reason; },
               [&](const MoveApplied& e) {
                 obj["row"] = e.row;
                 obj["col"] = e.col;
               },
               [&](const BoardState& e) {
                 obj["grid"] = encode_grid(e.grid);
                 obj["current_turn"] = encode_role(e.current_turn);
               },
               [&](const TurnNotification& e) { obj["role"] = encode_role(e.role); },
               [&](const ParticipantJoined& e) {
                 obj["role"] = encode_role(e.role);
                 obj["display_name"] = e.display_name;
               },
               [&](const ParticipantLeft& e) { obj["role"] = encode_role(e.role); },
               [&](const GameOver& e) { obj["winner"] = encode_role(e.winner); },
               [&](const Error& e) { obj["message"] = e.message; },
               [&](const ServerShutdown&) {},
             },
             event);
  return obj;
}

json::value MessageCodec::encode(const Command& command) {
  json::object obj;
  obj["type"] = type_name(get_type(command));

  std::visit(util::overloaded{
               [&](const JoinRequest& c) {
                 obj["display_name"] = c.display_name;
                 if (c.role) obj["role"] = encode_role(*c.role);
               },
               [&](const MoveRequest& c) {
                 obj["row"] = c.row;
                 obj["col"] = c.col;
               },
               [&](const Disconnect&) {},
             },
             command);
  return obj;
}

Event MessageCodec::decode_event(const json::value& jv) {
  const json::object& obj = as_object(jv);
  switch (decode_type(obj, kNumEventTypes)) {
    case kJoinAccepted:
      return JoinAccepted{decode_role(obj, "role")};
    case kJoinRejected:
      return JoinRejected{get_string(obj, "reason")};
    case kMoveApplied:
      return MoveApplied{get_int(obj, "row"), get_int(obj, "col")};
    case kBoardState:
      return BoardState{decode_grid(obj), decode_role(obj, "current_turn")};
    case kTurnNotification:
      return TurnNotification{decode_role(obj, "role")};
    case kParticipantJoined:
      return ParticipantJoined{decode_role(obj, "role"), get_string(obj, "display_name")};
    case kParticipantLeft:
      return ParticipantLeft{decode_role(obj, "role")};
    case kGameOver:
      return GameOver{decode_optional_role(get_field(obj, "winner"), "winner")};
    case kError:
      return Error{get_string(obj, "message")};
    case kServerShutdown:
      return ServerShutdown{};
    default:
      throw util::Exception("unhandled event type");
  }
}

Command MessageCodec::decode_command(const json::value& jv) {
  const json::object& obj = as_object(jv);
  switch (decode_type(obj, kNumCommandTypes)) {
    case kJoinRequest: {
      JoinRequest request;
      request.display_name = get_string(obj, "display_name");
      if (request.display_name.size() > size_t(kMaxNameLength)) {
        throw util::CleanException("display_name exceeds {} characters", kMaxNameLength);
      }
      if (const json::value* role = obj.if_contains("role")) {
        request.role = decode_optional_role(*role, "role");
      }
      return request;
    }
    case kMoveRequest:
      return MoveRequest{get_int(obj, "row"), get_int(obj, "col")};
    case kDisconnect:
      return Disconnect{};
    default:
      throw util::Exception("unhandled command type");
  }
}

}  // namespace arena
