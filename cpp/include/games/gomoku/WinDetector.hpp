#pragma once

#include "games/gomoku/Board.hpp"
#include "games/gomoku/Types.hpp"

#include <array>
#include <optional>

namespace gomoku {

/*
 * Stateless line detection over a Board.
 *
 * A line is a maximal run of same-role marks along one of the four axis directions. Lines are
 * counted in both directions from a cell and are bounded by the grid edges, so a run of five or
 * more anywhere on the board is a win.
 */
class WinDetector {
 public:
  struct direction_t {
    int drow;
    int dcol;
  };

  // horizontal, vertical, diagonal, anti-diagonal
  static constexpr std::array<direction_t, 4> kDirections = {{{0, 1}, {1, 0}, {1, 1}, {1, -1}}};

  /*
   * Returns the role that owns a line of at least kWinLength marks, or std::nullopt if there is
   * none.
   */
  static std::optional<role_t> check(const Board& board);

  /*
   * InProgress, Win(role) or Draw (full board without a winner).
   */
  static Outcome outcome(const Board& board);

  /*
   * Length of the run of role marks through (row, col) along dir, counting both directions. The
   * cell (row, col) itself is counted as a role mark whether or not it is occupied, which makes
   * this usable for hypothetical moves.
   */
  static int line_length(const Board& board, int row, int col, direction_t dir, role_t role);

  /*
   * Number of consecutive role marks starting at the neighbor of (row, col) in direction
   * (drow, dcol), excluding (row, col) itself.
   */
  static int count_from(const Board& board, int row, int col, int drow, int dcol, role_t role);

  /*
   * Whether marking move for role would complete a line of at least kWinLength.
   */
  static bool completes_line(const Board& board, const Move& move, role_t role);
};

}  // namespace gomoku
