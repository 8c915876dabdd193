#include "games/gomoku/SearchEngine.hpp"

#include "games/gomoku/WinDetector.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace gomoku {

Move SearchEngine::recommend(const Board& board, role_t role) const {
  if (board.is_full()) {
    throw GameError(kNoLegalMove, "No legal move available for {}", role_to_str(role));
  }

  if (params_.random_mode) {
    return random_move(board);
  }

  if (auto move = find_winning_move(board, role)) {
    LOG_DEBUG("SearchEngine: {} wins at {}", role_to_str(role), move->to_str());
    return *move;
  }

  if (auto move = find_blocking_move(board, role)) {
    LOG_DEBUG("SearchEngine: {} blocks at {}", role_to_str(role), move->to_str());
    return *move;
  }

  return search(board, role);
}

std::optional<Move> SearchEngine::find_winning_move(const Board& board, role_t role) {
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      if (!board.is_empty(row, col)) continue;
      Move move{row, col};
      if (WinDetector::completes_line(board, move, role)) return move;
    }
  }
  return std::nullopt;
}

std::optional<Move> SearchEngine::find_blocking_move(const Board& board, role_t role) {
  role_t opponent = other(role);

  // A five anywhere on the board outranks every four
  if (auto move = find_winning_move(board, opponent)) return move;

  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      if (!board.is_empty(row, col)) continue;
      if (makes_open_four(board, row, col, opponent)) return Move{row, col};
    }
  }
  return std::nullopt;
}

bool SearchEngine::makes_open_four(const Board& board, int row, int col, role_t role) {
  for (const auto& dir : WinDetector::kDirections) {
    int forward = WinDetector::count_from(board, row, col, dir.drow, dir.dcol, role);
    int backward = WinDetector::count_from(board, row, col, -dir.drow, -dir.dcol, role);
    if (1 + forward + backward != kWinLength - 1) continue;

    bool open_forward =
      is_open_end(board, row + dir.drow * (forward + 1), col + dir.dcol * (forward + 1));
    bool open_backward =
      is_open_end(board, row - dir.drow * (backward + 1), col - dir.dcol * (backward + 1));
    if (open_forward || open_backward) return true;
  }
  return false;
}

int SearchEngine::position_score(const Board& board, int row, int col, role_t role) {
  int distance_to_center = std::abs(row - kCenter) + std::abs(col - kCenter);
  int score = (kCenterBiasBase - distance_to_center) * kCenterBiasScale;

  // Only the four forward neighbors are considered
  int own_neighbors = 0;
  int opponent_neighbors = 0;
  for (const auto& dir : WinDetector::kDirections) {
    int r = row + dir.drow;
    int c = col + dir.dcol;
    if (!Board::in_bounds(r, c)) continue;
    cell_t cell = board.get(r, c);
    if (!cell) continue;
    if (*cell == role) {
      own_neighbors++;
    } else {
      opponent_neighbors++;
    }
  }
  score += own_neighbors * kOwnNeighborScore;
  score -= opponent_neighbors * kOpponentNeighborScore;

  return score + pattern_score(board, row, col, role);
}

int SearchEngine::pattern_score(const Board& board, int row, int col, role_t role) {
  int score = 0;
  for (const auto& dir : WinDetector::kDirections) {
    int forward = WinDetector::count_from(board, row, col, dir.drow, dir.dcol, role);
    int backward = WinDetector::count_from(board, row, col, -dir.drow, -dir.dcol, role);
    int count = forward + backward;

    int open_ends = 0;
    open_ends +=
      is_open_end(board, row + dir.drow * (forward + 1), col + dir.dcol * (forward + 1));
    open_ends +=
      is_open_end(board, row - dir.drow * (backward + 1), col - dir.dcol * (backward + 1));

    if (count >= 4) {
      score += kFourScore;
    } else if (count == 3 && open_ends >= 1) {
      score += kOpenThreeScore;
    } else if (count == 2 && open_ends == 2) {
      score += kOpenTwoScore;
    }
  }
  return score;
}

bool SearchEngine::is_open_end(const Board& board, int row, int col) {
  return Board::in_bounds(row, col) && board.is_empty(row, col);
}

Move SearchEngine::search(const Board& board, role_t role) const {
  RELEASE_ASSERT(params_.depth >= 0, "invalid search depth {}", params_.depth);

  // best_response[r] holds the best value available to role r at the current level, clamped below
  // at zero. Level 0 is the pure position score.
  std::array<int, kNumPlayers> best_response = {0, 0};
  for (int level = 0; level < params_.depth; ++level) {
    std::array<int, kNumPlayers> next = {0, 0};
    for (role_t r : {kBlack, kWhite}) {
      int penalty = level == 0 ? 0 : best_response[other(r)] / 2;
      for (int row = 0; row < kBoardDimension; ++row) {
        for (int col = 0; col < kBoardDimension; ++col) {
          if (!board.is_empty(row, col)) continue;
          next[r] = std::max(next[r], position_score(board, row, col, r) - penalty);
        }
      }
    }
    best_response = next;
  }

  int penalty = params_.depth == 0 ? 0 : best_response[other(role)] / 2;

  std::optional<Move> best_move;
  int best_score = 0;
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      if (!board.is_empty(row, col)) continue;
      int score = position_score(board, row, col, role) - penalty;
      if (!best_move || score > best_score) {
        best_score = score;
        best_move = Move{row, col};
      }
    }
  }

  RELEASE_ASSERT(best_move.has_value());
  LOG_DEBUG("SearchEngine: {} picks {} (score={} depth={})", role_to_str(role),
            best_move->to_str(), best_score, params_.depth);
  return *best_move;
}

Move SearchEngine::random_move(const Board& board) const {
  int num_empty = kNumCells - board.num_occupied();
  int k = util::Random::uniform_sample(0, num_empty);
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      if (!board.is_empty(row, col)) continue;
      if (k-- == 0) return Move{row, col};
    }
  }
  throw util::Exception("SearchEngine::random_move() found no empty cell");
}

}  // namespace gomoku
