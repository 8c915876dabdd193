#pragma once

#include "games/gomoku/Constants.hpp"
#include "games/gomoku/Types.hpp"

#include <array>
#include <ostream>
#include <string>

namespace gomoku {

/*
 * A 15x15 grid of optional role marks plus the role whose turn it is.
 *
 * place() is the only mutator. It validates the move completely before touching any state, so a
 * rejected move leaves the board exactly as it was, and an accepted move sets exactly one cell
 * and flips the turn.
 *
 * Board has value semantics. WinDetector and SearchEngine work on copies (snapshots), so they can
 * never observe a mutation in progress.
 */
class Board {
 public:
  using grid_t = std::array<cell_t, kNumCells>;

  Board() = default;

  /*
   * Constructs a board with the given marks and turn, bypassing move validation. Used to mirror a
   * remote board and to set up positions in tests.
   */
  static Board from_grid(const grid_t& grid, role_t current_turn);

  /*
   * Places a mark for role at move.
   *
   * Throws GameError with code:
   *   kOutOfBounds      if move is outside the grid
   *   kNotYourTurn      if role is not current_turn()
   *   kPositionOccupied if the target cell already holds a mark
   */
  void place(const Move& move, role_t role);

  static bool in_bounds(int row, int col) {
    return row >= 0 && row < kBoardDimension && col >= 0 && col < kBoardDimension;
  }
  static int index(int row, int col) { return row * kBoardDimension + col; }

  cell_t get(int row, int col) const { return grid_[index(row, col)]; }
  bool is_empty(int row, int col) const { return !grid_[index(row, col)].has_value(); }
  bool is_full() const { return num_occupied_ == kNumCells; }
  int num_occupied() const { return num_occupied_; }
  role_t current_turn() const { return current_turn_; }
  const grid_t& grid() const { return grid_; }

  bool operator==(const Board&) const = default;

  /*
   * Prints the board as 15 rows of '.', 'X' (Black) and 'O' (White) with row/col headers.
   */
  void print(std::ostream& os) const;
  std::string to_str() const;

 private:
  grid_t grid_ = {};
  role_t current_turn_ = kBlack;
  int num_occupied_ = 0;
};

}  // namespace gomoku
