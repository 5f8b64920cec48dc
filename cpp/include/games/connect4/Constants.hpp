#pragma once

#include <cstdint>

namespace c4 {

using column_t = int16_t;
using row_t = int16_t;

const int kDefaultNumRows = 6;
const int kDefaultNumColumns = 7;

// Board dimensions must lie in [kMinDimension, kMaxDimension] along both axes. The upper bound only
// guards against absurd allocations; num_cells() stays far below INT_MAX.
const int kMinDimension = 4;
const int kMaxDimension = 1024;

const int kWinLength = 4;
const int kNumPlayers = 2;

enum Player : int8_t { kPlayerA = 0, kPlayerB = 1 };

enum Cell : int8_t { kEmptyCell, kPlayerACell, kPlayerBCell };

enum Phase : int8_t { kInProgress, kWon, kTied };

enum RejectReason : int8_t { kNotRejected, kColumnFull, kInvalidColumn, kGameOver };

inline Cell to_cell(Player player) { return player == kPlayerA ? kPlayerACell : kPlayerBCell; }

// Requires cell != kEmptyCell
inline Player to_player(Cell cell) { return cell == kPlayerACell ? kPlayerA : kPlayerB; }

inline Player opponent(Player player) { return player == kPlayerA ? kPlayerB : kPlayerA; }

// 1 for kPlayerA, 2 for kPlayerB, matching how players are addressed in the UI
inline int player_number(Player player) { return int(player) + 1; }

}  // namespace c4
