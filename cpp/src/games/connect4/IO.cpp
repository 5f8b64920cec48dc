#include "games/connect4/IO.hpp"

#include "util/AnsiCodes.hpp"
#include "util/BoostUtil.hpp"
#include "util/Rendering.hpp"

#include <algorithm>
#include <format>

namespace c4 {

void IO::print_state(std::ostream& ss, const GameEngine& engine, const GameConfig& config) {
  const GameState& state = engine.state();
  const Board& board = engine.board();

  std::string out;
  if (util::Rendering::mode() == util::Rendering::kText && !state.last_move.is_null()) {
    out += std::string(2 * state.last_move.col + 1, ' ');
    out += "x\n";
  }

  for (int row = 0; row < board.num_rows(); ++row) {
    out += row_str(engine, config, row);
  }
  out += column_labels(board.num_columns());
  out += '\n';

  for (Player player : {kPlayerA, kPlayerB}) {
    out += std::format("{}: Player {} ({})\n", player_to_str(player, config),
                       player_number(player), color_to_str(config.color_of(player)));
  }
  out += '\n';
  out += status_str(engine);

  ss << out << std::endl;
}

std::string IO::compact_state_repr(const Board& board) {
  std::string repr;
  for (int row = 0; row < board.num_rows(); ++row) {
    for (int col = 0; col < board.num_columns(); ++col) {
      switch (board.occupant_at(row, col)) {
        case kEmptyCell:
          repr += '_';
          break;
        case kPlayerACell:
          repr += 'A';
          break;
        case kPlayerBCell:
          repr += 'B';
          break;
      }
    }
    repr += '\n';
  }
  return repr;
}

boost::json::value IO::state_to_json(const GameEngine& engine) {
  const GameState& state = engine.state();
  const Board& board = engine.board();

  boost::json::array cells;
  for (int row = 0; row < board.num_rows(); ++row) {
    boost::json::array cells_row;
    for (int col = 0; col < board.num_columns(); ++col) {
      cells_row.push_back(int(board.occupant_at(row, col)));
    }
    cells.push_back(std::move(cells_row));
  }

  boost::json::array col_heights;
  for (int col = 0; col < board.num_columns(); ++col) {
    col_heights.push_back(board.column_height(col));
  }

  boost::json::array legal_columns;
  for (int col : boost_util::get_set_indices(engine.legal_columns())) {
    legal_columns.push_back(col);
  }

  auto coord_to_json = [](const Coord& coord) {
    return boost::json::array{int(coord.row), int(coord.col)};
  };

  boost::json::object obj;
  obj["rows"] = board.num_rows();
  obj["columns"] = board.num_columns();
  obj["cells"] = std::move(cells);
  obj["col_heights"] = std::move(col_heights);
  obj["legal_columns"] = std::move(legal_columns);
  obj["current_player"] = int(state.current_player);
  obj["phase"] = phase_to_str(state.phase);
  obj["num_moves"] = state.num_moves;

  if (state.phase == kWon) {
    boost::json::array line;
    for (const Coord& coord : state.winning_line) {
      line.push_back(coord_to_json(coord));
    }
    obj["winner"] = int(state.winner);
    obj["winning_line"] = std::move(line);
  } else {
    obj["winner"] = nullptr;
    obj["winning_line"] = boost::json::array();
  }

  if (state.last_move.is_null()) {
    obj["last_move"] = nullptr;
  } else {
    obj["last_move"] = coord_to_json(state.last_move);
  }

  return obj;
}

std::string IO::player_to_str(Player player, const GameConfig& config) {
  const char* letter = player == kPlayerA ? "A" : "B";
  return std::format("{}{}{}", color_code(config.color_of(player)), ansi::kCircle(letter),
                     ansi::kReset(""));
}

std::string IO::status_str(const GameEngine& engine) {
  const GameState& state = engine.state();
  switch (state.phase) {
    case kInProgress:
      return std::format("Player {}'s turn...", player_number(state.current_player));
    case kWon:
      return std::format("Player {} Wins!", player_number(state.winner));
    case kTied:
      return "It's A Tie";
  }
  return "";
}

const char* IO::phase_to_str(Phase phase) {
  switch (phase) {
    case kInProgress:
      return "in_progress";
    case kWon:
      return "won";
    case kTied:
      return "tied";
  }
  return "?";
}

std::string IO::row_str(const GameEngine& engine, const GameConfig& config, row_t row) {
  const GameState& state = engine.state();
  const Board& board = engine.board();
  const std::string frame = std::format("{}|{}", color_code(GameConfig::kBoardColor),
                                        ansi::kReset(""));

  std::string out;
  for (int col = 0; col < board.num_columns(); ++col) {
    Coord coord(row, col);
    Cell cell = board.occupant_at(row, col);

    out += frame;
    if (cell == kEmptyCell) {
      out += std::format("{}{}{}", color_code(GameConfig::kEmptyColor), ansi::kHollowCircle(" "),
                         ansi::kReset(""));
      continue;
    }

    bool highlight =
      state.phase == kWon && std::find(state.winning_line.begin(), state.winning_line.end(),
                                       coord) != state.winning_line.end();
    bool blink = coord == state.last_move;

    Player player = to_player(cell);
    Color color = highlight ? GameConfig::kHighlightColor : config.color_of(player);
    const char* letter = highlight ? "*" : (player == kPlayerA ? "A" : "B");

    out += std::format("{}{}{}{}", blink ? ansi::kBlink("") : "", color_code(color),
                       ansi::kCircle(letter), ansi::kReset(""));
  }
  out += frame;
  out += '\n';
  return out;
}

std::string IO::column_labels(int num_columns) {
  // One line per decimal digit, most significant first. Each label is read top to bottom.
  int place = 1;
  while (place * 10 <= num_columns) place *= 10;

  std::string out;
  for (; place > 0; place /= 10) {
    for (int col = 0; col < num_columns; ++col) {
      int label = col + 1;
      out += '|';
      out += (label >= place || place == 1) ? char('0' + label / place % 10) : ' ';
    }
    out += "|\n";
  }
  return out;
}

const char* IO::color_code(Color color) {
  switch (color) {
    case kRed:
      return ansi::kRed("");
    case kYellow:
      return ansi::kYellow("");
    case kBlack:
      return ansi::kBlack("");
    case kGreen:
      return ansi::kGreen("");
    case kBlue:
      return ansi::kBlue("");
    case kWhite:
      return ansi::kWhite("");
    case kCyan:
      return ansi::kCyan("");
    case kGray:
      return ansi::kGray("");
  }
  return "";
}

}  // namespace c4
