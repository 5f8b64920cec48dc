#include "games/connect4/Board.hpp"

#include "util/Asserts.hpp"

#include <algorithm>

namespace c4 {

inline Board::Board(int num_rows, int num_columns)
    : num_rows_(num_rows), num_columns_(num_columns) {
  validate_dimensions(num_rows, num_columns);
  cells_.resize(num_cells(), kEmptyCell);
}

inline void Board::validate_dimensions(int num_rows, int num_columns) {
  if (num_rows < kMinDimension || num_rows > kMaxDimension || num_columns < kMinDimension ||
      num_columns > kMaxDimension) {
    throw InvalidConfiguration("Invalid board dimensions {}x{} (each must be in [{}, {}])",
                               num_rows, num_columns, kMinDimension, kMaxDimension);
  }
}

inline bool Board::in_bounds(int row, int col) const {
  return row >= 0 && row < num_rows_ && is_valid_column(col);
}

inline std::optional<row_t> Board::drop_row(column_t col) const {
  RELEASE_ASSERT(is_valid_column(col), "Invalid column {}", col);
  for (int row = num_rows_ - 1; row >= 0; --row) {
    if (cells_[index(row, col)] == kEmptyCell) {
      return static_cast<row_t>(row);
    }
  }
  return std::nullopt;
}

inline void Board::place(row_t row, column_t col, Player player) {
  RELEASE_ASSERT(in_bounds(row, col), "Out of bounds ({},{})", row, col);
  Cell& cell = cells_[index(row, col)];
  RELEASE_ASSERT(cell == kEmptyCell, "Cell ({},{}) is already occupied", row, col);
  cell = to_cell(player);
}

inline Cell Board::occupant_at(row_t row, column_t col) const {
  RELEASE_ASSERT(in_bounds(row, col), "Out of bounds ({},{})", row, col);
  return cells_[index(row, col)];
}

inline bool Board::is_column_full(column_t col) const { return occupant_at(0, col) != kEmptyCell; }

inline bool Board::is_full() const {
  for (int col = 0; col < num_columns_; ++col) {
    if (!is_column_full(col)) return false;
  }
  return true;
}

inline int Board::column_height(column_t col) const {
  std::optional<row_t> row = drop_row(col);
  return row ? num_rows_ - 1 - *row : num_rows_;
}

inline void Board::reset() { std::fill(cells_.begin(), cells_.end(), kEmptyCell); }

}  // namespace c4
