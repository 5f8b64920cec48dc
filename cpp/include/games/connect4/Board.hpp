#pragma once

#include "games/connect4/Constants.hpp"
#include "games/connect4/Types.hpp"

#include <optional>
#include <vector>

namespace c4 {

/*
 * A num_rows x num_columns grid of cells. Row 0 is the top row; checkers fall towards row
 * num_rows - 1.
 *
 * The Board only knows about occupancy. It does not know whose turn it is or whether the game is
 * over; that is the job of GameEngine.
 */
class Board {
 public:
  // Throws InvalidConfiguration on bad dimensions, see validate_dimensions().
  Board(int num_rows = kDefaultNumRows, int num_columns = kDefaultNumColumns);

  // Throws InvalidConfiguration if either dimension is outside [kMinDimension, kMaxDimension].
  static void validate_dimensions(int num_rows, int num_columns);

  int num_rows() const { return num_rows_; }
  int num_columns() const { return num_columns_; }
  int num_cells() const { return num_rows_ * num_columns_; }

  bool is_valid_column(int col) const { return col >= 0 && col < num_columns_; }
  bool in_bounds(int row, int col) const;

  // Scans col from the bottom row upward and returns the lowest empty row. Returns std::nullopt if
  // the column is full.
  std::optional<row_t> drop_row(column_t col) const;

  // Requires that (row, col) is in bounds and empty.
  void place(row_t row, column_t col, Player player);

  Cell occupant_at(row_t row, column_t col) const;

  bool is_column_full(column_t col) const;
  bool is_full() const;

  // Number of checkers in col
  int column_height(column_t col) const;

  void reset();

 private:
  int index(row_t row, column_t col) const { return row * num_columns_ + col; }

  const int num_rows_;
  const int num_columns_;
  std::vector<Cell> cells_;
};

}  // namespace c4

#include "inline/games/connect4/Board.inl"
