#pragma once

#include "arena/Events.hpp"

#include <boost/json.hpp>

#include <magic_enum/magic_enum.hpp>

#include <string_view>

namespace arena {

/*
 * Converts events and commands to and from their json wire form.
 *
 * Every message is a json object whose "type" field holds the message name ("JoinRequest",
 * "BoardState", ...). Roles are written as "Black"/"White". A board grid is written as an array of
 * kBoardDimension rows, each an array of kBoardDimension cells, where a cell is null, "Black" or
 * "White".
 *
 * Example:
 *
 * {"type": "MoveRequest", "row": 7, "col": 7}
 *
 * The decode methods throw util::CleanException on malformed input (wrong json kind, unknown type,
 * missing or ill-typed fields, out-of-range values).
 */
class MessageCodec {
 public:
  static boost::json::value encode(const Event& event);
  static boost::json::value encode(const Command& command);

  static Event decode_event(const boost::json::value& jv);
  static Command decode_command(const boost::json::value& jv);

  // kJoinAccepted -> "JoinAccepted"
  template <typename E>
  static std::string_view type_name(E type) {
    return magic_enum::enum_name(type).substr(1);
  }
};

}  // namespace arena
