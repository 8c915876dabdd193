#include "games/gomoku/Board.hpp"

#include <sstream>

namespace gomoku {

Board Board::from_grid(const grid_t& grid, role_t current_turn) {
  Board board;
  board.grid_ = grid;
  board.current_turn_ = current_turn;
  for (const cell_t& cell : grid) {
    board.num_occupied_ += cell.has_value();
  }
  return board;
}

void Board::place(const Move& move, role_t role) {
  if (!in_bounds(move.row, move.col)) {
    throw GameError(kOutOfBounds, "Move {} is out of bounds", move.to_str());
  }
  if (role != current_turn_) {
    throw GameError(kNotYourTurn, "It is not {}'s turn", role_to_str(role));
  }
  cell_t& cell = grid_[index(move.row, move.col)];
  if (cell.has_value()) {
    throw GameError(kPositionOccupied, "Position {} is already occupied", move.to_str());
  }

  cell = role;
  num_occupied_++;
  current_turn_ = other(role);
}

void Board::print(std::ostream& os) const {
  os << "   ";
  for (int col = 0; col < kBoardDimension; ++col) {
    os << (col % 10) << ' ';
  }
  os << '\n';
  for (int row = 0; row < kBoardDimension; ++row) {
    os << (row < 10 ? " " : "") << row << ' ';
    for (int col = 0; col < kBoardDimension; ++col) {
      cell_t cell = get(row, col);
      char c = !cell ? '.' : (*cell == kBlack ? 'X' : 'O');
      os << c << ' ';
    }
    os << '\n';
  }
}

std::string Board::to_str() const {
  std::ostringstream ss;
  print(ss);
  return ss.str();
}

}  // namespace gomoku
