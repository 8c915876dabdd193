#pragma once

#include <cstdint>

namespace gomoku {

const int kBoardDimension = 15;
const int kNumCells = kBoardDimension * kBoardDimension;
const int kNumPlayers = 2;
const int kWinLength = 5;
const int kCenter = kBoardDimension / 2;

const int kDefaultSearchDepth = 3;

// SearchEngine scoring weights
const int kCenterBiasBase = 10;
const int kCenterBiasScale = 10;
const int kOwnNeighborScore = 50;
const int kOpponentNeighborScore = 30;
const int kFourScore = 100000;
const int kOpenThreeScore = 10000;
const int kOpenTwoScore = 1000;

}  // namespace gomoku
