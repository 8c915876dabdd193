#pragma once

#include "games/gomoku/Board.hpp"
#include "games/gomoku/Constants.hpp"
#include "games/gomoku/Types.hpp"

#include <optional>

namespace gomoku {

/*
 * Heuristic move picker.
 *
 * recommend() applies, in order:
 *
 * 1. Immediate win: the first empty cell (row-major) that completes a line of kWinLength for role.
 * 2. Immediate block: the first empty cell that, if taken by the opponent, would give the opponent
 *    a line of kWinLength. Failing that, the first empty cell that would give the opponent a run
 *    of exactly four with at least one open end.
 * 3. Heuristic search: the empty cell maximizing
 *
 *      position_score(cell, role) - best_response(opponent, depth - 1) / 2
 *
 *    where best_response(r, d) is the best such value available to r, recursing with the roles
 *    swapped down to depth 0 (pure position score). Ties go to the first cell in row-major order.
 *
 * The look-ahead scores every hypothetical reply against the same snapshot, without placing the
 * hypothetical marks. Consequently best_response() depends only on (role, depth), and is computed
 * once per call rather than once per cell.
 *
 * In random mode, steps 1-3 are skipped and a uniformly random empty cell is returned.
 *
 * An engine holds no state besides its Params; it can be shared freely across calls.
 */
class SearchEngine {
 public:
  struct Params {
    auto make_options_description();

    int depth = kDefaultSearchDepth;
    bool random_mode = false;
  };

  SearchEngine() : params_() {}
  explicit SearchEngine(const Params& params) : params_(params) {}

  const Params& params() const { return params_; }

  /*
   * Returns the recommended move for role on board. Throws GameError(kNoLegalMove) if the board
   * is full.
   */
  Move recommend(const Board& board, role_t role) const;

  /*
   * Positional bias + adjacency bias + pattern bias for marking (row, col) with role. The cell is
   * assumed to be empty.
   */
  static int position_score(const Board& board, int row, int col, role_t role);

  static std::optional<Move> find_winning_move(const Board& board, role_t role);
  static std::optional<Move> find_blocking_move(const Board& board, role_t role);

 private:
  Move search(const Board& board, role_t role) const;
  Move random_move(const Board& board) const;

  // Whether marking (row, col) for role yields a run of exactly four with an open end
  static bool makes_open_four(const Board& board, int row, int col, role_t role);
  static int pattern_score(const Board& board, int row, int col, role_t role);
  static bool is_open_end(const Board& board, int row, int col);

  const Params params_;
};

}  // namespace gomoku

#include "inline/games/gomoku/SearchEngine.inl"
