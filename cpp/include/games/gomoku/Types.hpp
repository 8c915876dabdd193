#pragma once

#include "games/gomoku/Constants.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace gomoku {

enum role_t : int8_t { kBlack = 0, kWhite = 1 };

inline role_t other(role_t role) { return role == kBlack ? kWhite : kBlack; }
inline const char* role_to_str(role_t role) { return role == kBlack ? "Black" : "White"; }

// Parses "Black"/"White". Returns std::nullopt for anything else.
std::optional<role_t> role_from_str(const std::string& s);

// Empty, or occupied by a role
using cell_t = std::optional<role_t>;

struct Move {
  int row;
  int col;

  bool operator==(const Move&) const = default;
  std::string to_str() const { return fmt::format("({}, {})", row, col); }
};

/*
 * Result of a game position. Derived from a Board by WinDetector::outcome(), never stored.
 */
struct Outcome {
  enum status_t : int8_t { kInProgress, kWin, kDraw };

  static Outcome in_progress() { return Outcome{kInProgress, std::nullopt}; }
  static Outcome win(role_t role) { return Outcome{kWin, role}; }
  static Outcome draw() { return Outcome{kDraw, std::nullopt}; }

  bool terminal() const { return status != kInProgress; }
  bool operator==(const Outcome&) const = default;
  std::string to_str() const;

  status_t status;
  std::optional<role_t> winner;  // set iff status == kWin
};

enum error_code_t : int8_t {
  kOutOfBounds,
  kPositionOccupied,
  kNotYourTurn,
  kTableFull,
  kTableNotReady,
  kNoLegalMove,
  kGameOver
};

const char* error_code_to_str(error_code_t code);

/*
 * Rule violation or table-state error. These are always the caller's fault, never a bug, hence
 * the util::CleanException base. The message is what gets reported back to the participant.
 */
class GameError : public util::CleanException {
 public:
  template <typename... Ts>
  GameError(error_code_t code, fmt::format_string<Ts...> format_str, Ts&&... ts)
      : util::CleanException(format_str, std::forward<Ts>(ts)...), code_(code) {}

  error_code_t code() const { return code_; }

 private:
  error_code_t code_;
};

}  // namespace gomoku
