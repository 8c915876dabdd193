#include "games/gomoku/Types.hpp"

namespace gomoku {

std::optional<role_t> role_from_str(const std::string& s) {
  if (s == "Black") return kBlack;
  if (s == "White") return kWhite;
  return std::nullopt;
}

std::string Outcome::to_str() const {
  switch (status) {
    case kInProgress:
      return "InProgress";
    case kWin:
      return fmt::format("Win({})", role_to_str(*winner));
    case kDraw:
      return "Draw";
    default:
      throw util::Exception("Unknown outcome status {}", int(status));
  }
}

const char* error_code_to_str(error_code_t code) {
  switch (code) {
    case kOutOfBounds:
      return "OutOfBounds";
    case kPositionOccupied:
      return "PositionOccupied";
    case kNotYourTurn:
      return "NotYourTurn";
    case kTableFull:
      return "TableFull";
    case kTableNotReady:
      return "TableNotReady";
    case kNoLegalMove:
      return "NoLegalMove";
    case kGameOver:
      return "GameOver";
    default:
      throw util::Exception("Unknown error code {}", int(code));
  }
}

}  // namespace gomoku
