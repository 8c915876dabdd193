#include "games/gomoku/Board.hpp"
#include "games/gomoku/Constants.hpp"
#include "games/gomoku/SearchEngine.hpp"
#include "games/gomoku/Types.hpp"
#include "games/gomoku/WinDetector.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <utility>

using namespace gomoku;

using marks_t = std::initializer_list<std::pair<int, int>>;

Board make_board(marks_t black, marks_t white, role_t current_turn = kBlack) {
  Board::grid_t grid = {};
  for (auto [row, col] : black) grid[Board::index(row, col)] = kBlack;
  for (auto [row, col] : white) grid[Board::index(row, col)] = kWhite;
  return Board::from_grid(grid, current_turn);
}

// No line of two or more anywhere along a row, and at most two along the other axes.
Board make_drawn_board() {
  Board::grid_t grid;
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      grid[Board::index(row, col)] = ((col + row / 2) % 2 == 0) ? kBlack : kWhite;
    }
  }
  return Board::from_grid(grid, kBlack);
}

template <typename F>
error_code_t get_error_code(F&& f) {
  try {
    f();
  } catch (const GameError& e) {
    return e.code();
  }
  throw util::Exception("expected GameError");
}

TEST(Board, initial_state) {
  Board board;
  EXPECT_EQ(board.current_turn(), kBlack);
  EXPECT_EQ(board.num_occupied(), 0);
  EXPECT_FALSE(board.is_full());
  for (const cell_t& cell : board.grid()) {
    EXPECT_FALSE(cell.has_value());
  }
}

TEST(Board, place_flips_turn) {
  Board board;
  board.place({7, 7}, kBlack);
  EXPECT_EQ(board.get(7, 7), kBlack);
  EXPECT_EQ(board.current_turn(), kWhite);
  EXPECT_EQ(board.num_occupied(), 1);
  EXPECT_FALSE(WinDetector::check(board).has_value());

  board.place({0, 0}, kWhite);
  EXPECT_EQ(board.get(0, 0), kWhite);
  EXPECT_EQ(board.current_turn(), kBlack);
}

TEST(Board, place_changes_one_cell) {
  Board board;
  board.place({3, 4}, kBlack);
  Board before = board;
  board.place({9, 2}, kWhite);

  int num_changed = 0;
  for (int i = 0; i < kNumCells; ++i) {
    num_changed += before.grid()[i] != board.grid()[i];
  }
  EXPECT_EQ(num_changed, 1);
}

TEST(Board, out_of_bounds) {
  Board board;
  for (Move move : {Move{-1, 0}, Move{0, -1}, Move{15, 0}, Move{0, 15}, Move{100, 100}}) {
    EXPECT_EQ(get_error_code([&] { board.place(move, kBlack); }), kOutOfBounds);
  }
  EXPECT_EQ(board, Board());
}

TEST(Board, not_your_turn) {
  Board board;
  EXPECT_EQ(get_error_code([&] { board.place({7, 7}, kWhite); }), kNotYourTurn);
  EXPECT_EQ(board, Board());
  EXPECT_EQ(board.current_turn(), kBlack);
}

TEST(Board, position_occupied) {
  Board board;
  board.place({7, 7}, kBlack);
  EXPECT_EQ(get_error_code([&] { board.place({7, 7}, kWhite); }), kPositionOccupied);
  EXPECT_EQ(board.current_turn(), kWhite);
  EXPECT_EQ(board.get(7, 7), kBlack);
}

TEST(Board, repeated_rejection_is_idempotent) {
  Board board;
  board.place({7, 7}, kBlack);
  Board snapshot = board;

  EXPECT_EQ(get_error_code([&] { board.place({7, 7}, kWhite); }), kPositionOccupied);
  EXPECT_EQ(board, snapshot);
  EXPECT_EQ(get_error_code([&] { board.place({7, 7}, kWhite); }), kPositionOccupied);
  EXPECT_EQ(board, snapshot);
}

TEST(Board, bounds_checked_before_turn) {
  Board board;
  EXPECT_EQ(get_error_code([&] { board.place({20, 20}, kWhite); }), kOutOfBounds);
}

TEST(Board, from_grid) {
  Board board = make_board({{1, 1}, {2, 2}}, {{3, 3}}, kWhite);
  EXPECT_EQ(board.num_occupied(), 3);
  EXPECT_EQ(board.current_turn(), kWhite);
  EXPECT_EQ(board.get(2, 2), kBlack);
  EXPECT_EQ(board.get(3, 3), kWhite);
  EXPECT_TRUE(make_drawn_board().is_full());
}

TEST(WinDetector, empty_board) {
  Board board;
  EXPECT_FALSE(WinDetector::check(board).has_value());
  EXPECT_EQ(WinDetector::outcome(board), Outcome::in_progress());
}

TEST(WinDetector, horizontal) {
  Board board = make_board({{7, 3}, {7, 4}, {7, 5}, {7, 6}, {7, 7}}, {});
  EXPECT_EQ(WinDetector::check(board), kBlack);
}

TEST(WinDetector, vertical) {
  Board board = make_board({}, {{2, 9}, {3, 9}, {4, 9}, {5, 9}, {6, 9}});
  EXPECT_EQ(WinDetector::check(board), kWhite);
}

TEST(WinDetector, diagonal) {
  Board board = make_board({{0, 0}, {1, 1}, {2, 2}, {3, 3}, {4, 4}}, {});
  EXPECT_EQ(WinDetector::check(board), kBlack);
}

TEST(WinDetector, anti_diagonal) {
  Board board = make_board({}, {{10, 4}, {11, 3}, {12, 2}, {13, 1}, {14, 0}});
  EXPECT_EQ(WinDetector::check(board), kWhite);
  EXPECT_EQ(WinDetector::outcome(board), Outcome::win(kWhite));
}

TEST(WinDetector, edge_of_board) {
  Board board = make_board({{14, 10}, {14, 11}, {14, 12}, {14, 13}, {14, 14}}, {});
  EXPECT_EQ(WinDetector::check(board), kBlack);

  // A run must not wrap around from the end of one row to the start of the next
  Board wrapped = make_board({{3, 12}, {3, 13}, {3, 14}, {4, 0}, {4, 1}}, {});
  EXPECT_FALSE(WinDetector::check(wrapped).has_value());
}

TEST(WinDetector, four_is_not_a_win) {
  Board board = make_board({{7, 7}, {7, 8}, {7, 9}, {7, 10}}, {{8, 7}, {8, 8}, {8, 9}, {8, 10}});
  EXPECT_FALSE(WinDetector::check(board).has_value());
}

TEST(WinDetector, six_in_a_row) {
  Board board = make_board({{5, 2}, {6, 2}, {7, 2}, {8, 2}, {9, 2}, {10, 2}}, {});
  EXPECT_EQ(WinDetector::check(board), kBlack);
}

TEST(WinDetector, broken_line) {
  Board board = make_board({{7, 3}, {7, 4}, {7, 6}, {7, 7}, {7, 8}}, {{7, 5}});
  EXPECT_FALSE(WinDetector::check(board).has_value());
}

TEST(WinDetector, draw) {
  Board board = make_drawn_board();
  EXPECT_FALSE(WinDetector::check(board).has_value());
  EXPECT_EQ(WinDetector::outcome(board), Outcome::draw());
}

TEST(WinDetector, completes_line) {
  Board board = make_board({{7, 7}, {7, 8}, {7, 9}, {7, 10}}, {});
  EXPECT_TRUE(WinDetector::completes_line(board, {7, 11}, kBlack));
  EXPECT_TRUE(WinDetector::completes_line(board, {7, 6}, kBlack));
  EXPECT_FALSE(WinDetector::completes_line(board, {7, 12}, kBlack));
  EXPECT_FALSE(WinDetector::completes_line(board, {7, 11}, kWhite));
}

TEST(SearchEngine, immediate_win_horizontal) {
  Board board = make_board({{7, 7}, {7, 8}, {7, 9}, {7, 10}}, {{0, 0}, {0, 2}, {0, 4}, {0, 6}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{7, 6}));
}

TEST(SearchEngine, immediate_win_vertical) {
  Board board = make_board({{3, 4}, {4, 4}, {5, 4}, {6, 4}}, {{0, 10}, {0, 12}, {2, 14}, {4, 14}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{2, 4}));
}

TEST(SearchEngine, immediate_win_diagonal) {
  Board board = make_board({{3, 3}, {4, 4}, {5, 5}, {6, 6}}, {{14, 0}, {14, 2}, {14, 4}, {14, 6}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{2, 2}));
}

TEST(SearchEngine, immediate_win_anti_diagonal) {
  Board board =
    make_board({{14, 8}, {14, 10}, {14, 12}, {12, 14}}, {{3, 10}, {4, 9}, {5, 8}, {6, 7}}, kWhite);
  EXPECT_EQ(SearchEngine().recommend(board, kWhite), (Move{2, 11}));
}

TEST(SearchEngine, win_past_blocked_end) {
  Board board = make_board({{7, 7}, {7, 8}, {7, 9}, {7, 10}}, {{7, 6}, {0, 2}, {0, 4}, {0, 6}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{7, 11}));
}

TEST(SearchEngine, win_preferred_over_block) {
  Board board = make_board({{2, 2}, {2, 3}, {2, 4}, {2, 5}}, {{9, 9}, {10, 9}, {11, 9}, {12, 9}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{2, 1}));
}

TEST(SearchEngine, blocks_four) {
  Board board = make_board({{0, 0}, {0, 2}, {0, 4}}, {{7, 7}, {7, 8}, {7, 9}, {7, 10}});
  Move move = SearchEngine().recommend(board, kBlack);
  EXPECT_TRUE(move == (Move{7, 6}) || move == (Move{7, 11})) << move.to_str();
}

TEST(SearchEngine, blocks_four_with_gap) {
  Board board = make_board({{0, 0}, {0, 2}, {0, 4}}, {{4, 4}, {5, 5}, {7, 7}, {8, 8}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{6, 6}));
}

TEST(SearchEngine, blocks_open_four) {
  Board board = make_board({{0, 0}, {0, 2}}, {{7, 7}, {7, 8}, {7, 9}});
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{7, 6}));
}

TEST(SearchEngine, blocks_five_before_earlier_four) {
  // (0, 3) would give Black an open four, but (10, 4) and (10, 9) each stop an immediate five
  Board board = make_board({{0, 0}, {0, 1}, {0, 2}, {10, 5}, {10, 6}, {10, 7}, {10, 8}},
                           {{14, 0}, {14, 2}, {14, 4}, {14, 6}, {14, 8}, {14, 10}, {14, 12}},
                           kWhite);
  EXPECT_EQ(SearchEngine::find_blocking_move(board, kWhite), (Move{10, 4}));
  EXPECT_EQ(SearchEngine().recommend(board, kWhite), (Move{10, 4}));

  board.place({10, 4}, kWhite);
  board.place({0, 3}, kBlack);
  EXPECT_FALSE(WinDetector::check(board).has_value());
  // Now two fives are threatened; the first in row-major order is blocked
  EXPECT_EQ(SearchEngine::find_blocking_move(board, kWhite), (Move{0, 4}));
}

TEST(SearchEngine, ignores_closed_three) {
  Board board = make_board({{7, 6}, {7, 10}}, {{7, 7}, {7, 8}, {7, 9}});
  EXPECT_FALSE(SearchEngine::find_blocking_move(board, kBlack).has_value());
}

TEST(SearchEngine, empty_board_takes_center) {
  Board board;
  EXPECT_EQ(SearchEngine().recommend(board, kBlack), (Move{kCenter, kCenter}));
}

TEST(SearchEngine, position_score) {
  Board board;
  EXPECT_EQ(SearchEngine::position_score(board, kCenter, kCenter, kBlack), 100);
  EXPECT_EQ(SearchEngine::position_score(board, 0, 0, kBlack), -40);

  // forward neighbor of the same role adds, of the other role subtracts
  Board with_neighbors = make_board({{7, 8}}, {{8, 7}});
  EXPECT_EQ(SearchEngine::position_score(with_neighbors, 7, 7, kBlack), 100 + 50 - 30);
}

TEST(SearchEngine, recommends_empty_cell_at_every_depth) {
  Board board = make_board({{7, 7}, {8, 8}, {6, 5}}, {{7, 8}, {6, 6}, {9, 9}});
  for (int depth = 0; depth <= 3; ++depth) {
    SearchEngine engine(SearchEngine::Params{depth, false});
    Move move = engine.recommend(board, kBlack);
    EXPECT_TRUE(Board::in_bounds(move.row, move.col));
    EXPECT_TRUE(board.is_empty(move.row, move.col)) << "depth=" << depth;
  }
}

TEST(SearchEngine, no_legal_move) {
  Board board = make_drawn_board();
  EXPECT_EQ(get_error_code([&] { SearchEngine().recommend(board, kBlack); }), kNoLegalMove);
}

TEST(SearchEngine, random_mode_is_legal) {
  util::Random::set_seed(1);
  SearchEngine engine(SearchEngine::Params{kDefaultSearchDepth, true});

  Board board;
  role_t role = kBlack;
  while (!board.is_full()) {
    Move move = engine.recommend(board, role);
    ASSERT_TRUE(board.is_empty(move.row, move.col));
    board.place(move, role);
    role = other(role);
  }
  EXPECT_EQ(get_error_code([&] { engine.recommend(board, role); }), kNoLegalMove);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
