#include "games/gomoku/WinDetector.hpp"

namespace gomoku {

std::optional<role_t> WinDetector::check(const Board& board) {
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      cell_t cell = board.get(row, col);
      if (!cell) continue;
      for (direction_t dir : kDirections) {
        if (line_length(board, row, col, dir, *cell) >= kWinLength) {
          return *cell;
        }
      }
    }
  }
  return std::nullopt;
}

Outcome WinDetector::outcome(const Board& board) {
  std::optional<role_t> winner = check(board);
  if (winner) return Outcome::win(*winner);
  if (board.is_full()) return Outcome::draw();
  return Outcome::in_progress();
}

int WinDetector::line_length(const Board& board, int row, int col, direction_t dir,
                             role_t role) {
  return 1 + count_from(board, row, col, dir.drow, dir.dcol, role) +
         count_from(board, row, col, -dir.drow, -dir.dcol, role);
}

int WinDetector::count_from(const Board& board, int row, int col, int drow, int dcol,
                            role_t role) {
  int count = 0;
  int r = row + drow;
  int c = col + dcol;
  while (Board::in_bounds(r, c) && board.get(r, c) == role) {
    count++;
    r += drow;
    c += dcol;
  }
  return count;
}

bool WinDetector::completes_line(const Board& board, const Move& move, role_t role) {
  for (direction_t dir : kDirections) {
    if (line_length(board, move.row, move.col, dir, role) >= kWinLength) {
      return true;
    }
  }
  return false;
}

}  // namespace gomoku
