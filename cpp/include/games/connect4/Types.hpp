#pragma once

#include "games/connect4/Constants.hpp"
#include "util/Exception.hpp"

#include <boost/dynamic_bitset.hpp>

#include <array>
#include <compare>
#include <format>
#include <ostream>
#include <string>

namespace c4 {

// Rows are indexed top = 0, columns left = 0.
struct Coord {
  Coord() = default;
  Coord(int r, int c) : row(r), col(c) {}

  auto operator<=>(const Coord& other) const = default;
  bool is_null() const { return row < 0; }
  std::string to_str() const { return std::format("({},{})", row, col); }

  friend std::ostream& operator<<(std::ostream& os, const Coord& coord) {
    return os << coord.to_str();
  }

  row_t row = -1;
  column_t col = -1;
};

const Coord kNullCoord{};

// The kWinLength coordinates of a four-in-a-row, ordered along the direction of the line.
using WinningLine = std::array<Coord, kWinLength>;

// Bit c is set iff column c currently accepts a drop.
using ColumnMask = boost::dynamic_bitset<>;

// Board too small/large, duplicate player colors, etc. Thrown at construction time.
class InvalidConfiguration : public util::CleanException {
 public:
  using CleanException::CleanException;
};

}  // namespace c4
