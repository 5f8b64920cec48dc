#include "games/connect4/GameEngine.hpp"

namespace c4 {

inline ColumnMask GameEngine::legal_columns() const {
  ColumnMask mask(board_.num_columns());
  if (state_.phase != kInProgress) return mask;

  for (int col = 0; col < board_.num_columns(); ++col) {
    mask[col] = !board_.is_column_full(col);
  }
  return mask;
}

}  // namespace c4
