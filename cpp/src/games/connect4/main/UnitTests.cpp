#include "games/connect4/Board.hpp"
#include "games/connect4/Constants.hpp"
#include "games/connect4/GameConfig.hpp"
#include "games/connect4/GameEngine.hpp"
#include "games/connect4/HumanTuiShell.hpp"
#include "games/connect4/IO.hpp"
#include "games/connect4/MoveResult.hpp"
#include "games/connect4/Types.hpp"
#include "util/BoostUtil.hpp"
#include "util/GTestUtil.hpp"
#include "util/Rendering.hpp"

#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

/*
 * Connect4 tests.
 *
 * Rows are indexed top = 0, so on the default board checkers dropped into an empty column land in
 * row 5.
 */

using namespace c4;

namespace {

// Plays all moves, expecting each one to be accepted. Returns the result of the last one.
MoveResult play(GameEngine& engine, const std::vector<int>& moves) {
  MoveResult result = MoveResult::rejected(kInvalidColumn);
  for (int col : moves) {
    result = engine.apply_move(col);
    EXPECT_TRUE(result.accepted()) << "column " << col << ": " << result.to_str();
  }
  return result;
}

WinningLine make_line(std::vector<std::pair<int, int>> coords) {
  WinningLine line;
  for (int i = 0; i < kWinLength; ++i) {
    line[i] = Coord(coords[i].first, coords[i].second);
  }
  return line;
}

std::string render(const GameEngine& engine, const GameConfig& config = GameConfig()) {
  std::ostringstream ss;
  IO::print_state(ss, engine, config);
  return ss.str();
}

const std::vector<int> kHorizontalWin = {0, 0, 1, 1, 2, 2, 3};
const std::vector<int> kVerticalWin = {0, 1, 2, 1, 3, 1, 5, 1};
const std::vector<int> kUpRightWin = {0, 1, 1, 2, 2, 3, 2, 3, 3, 6, 3};
const std::vector<int> kDownRightWin = {6, 5, 5, 4, 4, 3, 4, 3, 3, 0, 3};

// Fills the default board without either player ever connecting four
const std::vector<int> kTieGame = {6, 4, 6, 2, 3, 0, 0, 2, 1, 6, 6, 2, 4, 6, 4, 5, 3, 6, 1, 5, 1,
                                   3, 0, 5, 2, 1, 2, 0, 2, 3, 5, 4, 1, 1, 4, 3, 5, 4, 3, 5, 0, 0};

}  // namespace

TEST(Board, initial_state) {
  Board board;
  EXPECT_EQ(board.num_rows(), 6);
  EXPECT_EQ(board.num_columns(), 7);
  EXPECT_EQ(board.num_cells(), 42);
  for (int row = 0; row < board.num_rows(); ++row) {
    for (int col = 0; col < board.num_columns(); ++col) {
      EXPECT_EQ(board.occupant_at(row, col), kEmptyCell);
    }
  }
  EXPECT_FALSE(board.is_full());
  EXPECT_EQ(board.drop_row(3), std::optional<row_t>(5));
}

TEST(Board, drop_row) {
  Board board(4, 5);
  for (int i = 0; i < 4; ++i) {
    std::optional<row_t> row = board.drop_row(2);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(*row, 3 - i);
    EXPECT_EQ(board.column_height(2), i);
    board.place(*row, 2, i % 2 ? kPlayerB : kPlayerA);
  }
  EXPECT_FALSE(board.drop_row(2).has_value());
  EXPECT_TRUE(board.is_column_full(2));
  EXPECT_EQ(board.column_height(2), 4);
  EXPECT_FALSE(board.is_column_full(1));

  board.reset();
  EXPECT_EQ(board.column_height(2), 0);
  EXPECT_EQ(board.occupant_at(3, 2), kEmptyCell);
}

TEST(Board, bounds) {
  Board board;
  EXPECT_TRUE(board.in_bounds(0, 0));
  EXPECT_TRUE(board.in_bounds(5, 6));
  EXPECT_FALSE(board.in_bounds(6, 0));
  EXPECT_FALSE(board.in_bounds(0, 7));
  EXPECT_FALSE(board.in_bounds(-1, 0));
  EXPECT_FALSE(board.is_valid_column(-1));
  EXPECT_FALSE(board.is_valid_column(7));

  EXPECT_THROW(board.occupant_at(6, 0), util::ReleaseAssertionError);
  EXPECT_THROW(board.drop_row(7), util::ReleaseAssertionError);

  board.place(5, 0, kPlayerA);
  EXPECT_THROW(board.place(5, 0, kPlayerB), util::ReleaseAssertionError);
  EXPECT_EQ(board.occupant_at(5, 0), kPlayerACell);
}

TEST(Board, dimensions) {
  EXPECT_THROW(Board(3, 7), InvalidConfiguration);
  EXPECT_THROW(Board(6, 3), InvalidConfiguration);
  EXPECT_THROW(Board(1025, 7), InvalidConfiguration);
  EXPECT_THROW(Board(6, 1025), InvalidConfiguration);
  EXPECT_NO_THROW(Board(4, 4));
  EXPECT_NO_THROW(Board(1024, 4));
  EXPECT_NO_THROW(Board(4, 1024));
}

TEST(GameEngine, initial_state) {
  Board board;
  board.place(5, 0, kPlayerB);

  // the engine always starts from an empty grid
  GameEngine engine(board);
  EXPECT_EQ(board.occupant_at(5, 0), kEmptyCell);
  EXPECT_EQ(engine.current_player(), kPlayerA);
  EXPECT_EQ(engine.phase(), kInProgress);
  EXPECT_EQ(engine.state().num_moves, 0);
  EXPECT_TRUE(engine.state().last_move.is_null());
  EXPECT_TRUE(engine.legal_columns().all());
  EXPECT_EQ(engine.legal_columns().size(), 7);
}

TEST(GameEngine, alternating_turns) {
  Board board;
  GameEngine engine(board);

  MoveResult result = engine.apply_move(3);
  EXPECT_EQ(result.outcome(), MoveResult::kContinue);
  EXPECT_EQ(result.player(), kPlayerB);
  EXPECT_EQ(result.landing(), Coord(5, 3));
  EXPECT_EQ(engine.occupant_at(5, 3), kPlayerACell);
  EXPECT_EQ(result.to_str(), "Continue(next=Player 2, landing=(5,3))");

  result = engine.apply_move(3);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.landing(), Coord(4, 3));
  EXPECT_EQ(engine.occupant_at(4, 3), kPlayerBCell);
  EXPECT_EQ(engine.state().last_move, Coord(4, 3));
  EXPECT_EQ(engine.state().num_moves, 2);
}

TEST(GameEngine, column_fills_up) {
  Board board;
  GameEngine engine(board);

  for (int i = 0; i < board.num_rows(); ++i) {
    MoveResult result = engine.apply_move(2);
    ASSERT_TRUE(result.accepted());
    EXPECT_EQ(result.landing(), Coord(board.num_rows() - 1 - i, 2));
  }
  EXPECT_FALSE(engine.legal_columns()[2]);
  EXPECT_EQ(engine.legal_columns().count(), 6);

  std::string before = IO::compact_state_repr(board);
  GameState state = engine.state();

  MoveResult result = engine.apply_move(2);
  EXPECT_EQ(result.outcome(), MoveResult::kRejected);
  EXPECT_EQ(result.reason(), kColumnFull);
  EXPECT_EQ(result.to_str(), "Rejected(kColumnFull)");

  EXPECT_EQ(IO::compact_state_repr(board), before);
  EXPECT_EQ(engine.current_player(), state.current_player);
  EXPECT_EQ(engine.state().num_moves, state.num_moves);
  EXPECT_EQ(engine.state().last_move, state.last_move);
}

TEST(GameEngine, invalid_column) {
  Board board;
  GameEngine engine(board);
  engine.apply_move(0);

  for (int col : {-1, 7, 100}) {
    MoveResult result = engine.apply_move(col);
    EXPECT_FALSE(result.accepted());
    EXPECT_EQ(result.reason(), kInvalidColumn);
    EXPECT_THROW(result.landing(), util::ReleaseAssertionError);
  }
  EXPECT_EQ(engine.current_player(), kPlayerB);
  EXPECT_EQ(engine.state().num_moves, 1);
  EXPECT_EQ(IO::compact_state_repr(board),
            "_______\n"
            "_______\n"
            "_______\n"
            "_______\n"
            "_______\n"
            "A______\n");
}

TEST(GameEngine, horizontal_win) {
  Board board;
  GameEngine engine(board);

  MoveResult result = play(engine, kHorizontalWin);
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.winning_line(), make_line({{5, 0}, {5, 1}, {5, 2}, {5, 3}}));
  EXPECT_EQ(result.to_str(), "Win(Player 1, line=(5,0)(5,1)(5,2)(5,3))");

  EXPECT_EQ(engine.phase(), kWon);
  EXPECT_EQ(engine.state().winner, kPlayerA);
  EXPECT_EQ(engine.state().winning_line, result.winning_line());
}

TEST(GameEngine, vertical_win) {
  Board board;
  GameEngine engine(board);

  MoveResult result = play(engine, kVerticalWin);
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerB);
  EXPECT_EQ(result.winning_line(), make_line({{2, 1}, {3, 1}, {4, 1}, {5, 1}}));
}

TEST(GameEngine, up_right_diagonal_win) {
  Board board;
  GameEngine engine(board);

  MoveResult result = play(engine, kUpRightWin);
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.winning_line(), make_line({{5, 0}, {4, 1}, {3, 2}, {2, 3}}));
}

TEST(GameEngine, down_right_diagonal_win) {
  Board board;
  GameEngine engine(board);

  MoveResult result = play(engine, kDownRightWin);
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.winning_line(), make_line({{2, 3}, {3, 4}, {4, 5}, {5, 6}}));
}

TEST(GameEngine, rows_scanned_before_columns) {
  Board board;
  GameEngine engine(board);

  // The last move completes both row 2 and column 3; the row is reported
  MoveResult result = play(engine, {3, 3, 2, 3, 5, 4, 6, 0, 6, 4, 0, 4, 4, 6, 5,
                                    4, 3, 0, 5, 3, 3, 4, 6, 1, 6, 2, 6, 2, 5});
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.winning_line(), make_line({{2, 3}, {2, 4}, {2, 5}, {2, 6}}));
  for (int row = 2; row < 6; ++row) {
    EXPECT_EQ(engine.occupant_at(row, 5), kPlayerACell);
  }
}

TEST(GameEngine, tie) {
  Board board;
  GameEngine engine(board);

  std::vector<int> moves = kTieGame;
  int last = moves.back();
  moves.pop_back();

  MoveResult result = play(engine, moves);
  EXPECT_EQ(result.outcome(), MoveResult::kContinue);

  result = engine.apply_move(last);
  ASSERT_EQ(result.outcome(), MoveResult::kTie);
  EXPECT_EQ(result.to_str(), "Tie(landing=(0,0))");
  EXPECT_THROW(result.player(), util::ReleaseAssertionError);
  EXPECT_EQ(engine.phase(), kTied);
  EXPECT_TRUE(board.is_full());
  EXPECT_EQ(engine.state().num_moves, 42);
  EXPECT_EQ(engine.apply_move(3).reason(), kGameOver);
  EXPECT_EQ(IO::compact_state_repr(board),
            "BBAABBB\n"
            "AAABAAB\n"
            "BBABBAA\n"
            "AABBABB\n"
            "AABAABA\n"
            "BABABBA\n");
}

TEST(GameEngine, win_on_last_cell_is_not_a_tie) {
  Board board;
  GameEngine engine(board);

  MoveResult result = play(engine, {1, 3, 1, 3, 2, 5, 3, 0, 6, 5, 3, 1, 3, 5, 5, 0, 4, 3, 5, 6, 4,
                                    6, 2, 1, 0, 1, 4, 4, 0, 2, 2, 4, 1, 5, 6, 4, 0, 0, 6, 2, 2, 6});
  EXPECT_TRUE(board.is_full());
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerB);
  EXPECT_EQ(result.winning_line(), make_line({{0, 3}, {0, 4}, {0, 5}, {0, 6}}));
  EXPECT_EQ(engine.phase(), kWon);
}

TEST(GameEngine, game_over) {
  Board board;
  GameEngine engine(board);
  play(engine, kHorizontalWin);

  std::string before = IO::compact_state_repr(board);
  MoveResult result = engine.apply_move(6);
  EXPECT_EQ(result.reason(), kGameOver);
  EXPECT_EQ(IO::compact_state_repr(board), before);
  EXPECT_EQ(engine.state().num_moves, 7);
  EXPECT_TRUE(engine.legal_columns().none());

  // game over takes precedence over a bad column
  EXPECT_EQ(engine.apply_move(-1).reason(), kGameOver);
}

TEST(GameEngine, reset) {
  Board board;
  GameEngine engine(board);
  play(engine, kVerticalWin);
  ASSERT_EQ(engine.phase(), kWon);

  engine.reset();
  EXPECT_EQ(engine.phase(), kInProgress);
  EXPECT_EQ(engine.current_player(), kPlayerA);
  EXPECT_EQ(engine.state().num_moves, 0);
  EXPECT_TRUE(engine.state().last_move.is_null());
  EXPECT_EQ(board.column_height(1), 0);

  // a game that reaches every column, stopped one move short of a full board
  std::vector<int> moves(kTieGame.begin(), kTieGame.end() - 1);
  play(engine, moves);
  ASSERT_EQ(engine.state().num_moves, 41);

  engine.reset();
  for (int row = 0; row < board.num_rows(); ++row) {
    for (int col = 0; col < board.num_columns(); ++col) {
      EXPECT_EQ(engine.occupant_at(row, col), kEmptyCell) << Coord(row, col);
    }
  }
  EXPECT_TRUE(engine.legal_columns().all());

  MoveResult result = play(engine, kHorizontalWin);
  EXPECT_EQ(result.outcome(), MoveResult::kWin);
}

TEST(GameEngine, occupant_at_is_read_only) {
  Board board;
  GameEngine engine(board);
  play(engine, {3, 3, 4, 2, 6});

  std::string repr = IO::compact_state_repr(board);
  GameState state = engine.state();
  ColumnMask legal = engine.legal_columns();

  for (int pass = 0; pass < 3; ++pass) {
    for (int row = 0; row < board.num_rows(); ++row) {
      for (int col = 0; col < board.num_columns(); ++col) {
        engine.occupant_at(row, col);
      }
    }
  }
  EXPECT_EQ(engine.occupant_at(5, 3), kPlayerACell);
  EXPECT_EQ(engine.occupant_at(4, 3), kPlayerBCell);

  EXPECT_EQ(IO::compact_state_repr(board), repr);
  EXPECT_EQ(engine.current_player(), state.current_player);
  EXPECT_EQ(engine.phase(), state.phase);
  EXPECT_EQ(engine.state().num_moves, state.num_moves);
  EXPECT_EQ(engine.state().last_move, state.last_move);
  EXPECT_EQ(engine.legal_columns(), legal);
}

TEST(GameEngine, large_board) {
  Board board(200, 300);
  GameEngine engine(board);

  MoveResult result = play(engine, {250, 251, 250, 251, 250, 251, 250});
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.landing(), Coord(196, 250));
  EXPECT_EQ(result.winning_line(), make_line({{196, 250}, {197, 250}, {198, 250}, {199, 250}}));
}

TEST(GameEngine, small_board) {
  Board board(4, 4);
  GameEngine engine(board);

  MoveResult result = play(engine, {0, 1, 0, 1, 0, 1, 0});
  ASSERT_EQ(result.outcome(), MoveResult::kWin);
  EXPECT_EQ(result.player(), kPlayerA);
  EXPECT_EQ(result.winning_line(), make_line({{0, 0}, {1, 0}, {2, 0}, {3, 0}}));
}

TEST(GameConfig, defaults) {
  GameConfig config = GameConfig::Params().make_config();
  EXPECT_EQ(config.num_rows, 6);
  EXPECT_EQ(config.num_columns, 7);
  EXPECT_EQ(config.color_of(kPlayerA), kRed);
  EXPECT_EQ(config.color_of(kPlayerB), kYellow);
}

TEST(GameConfig, parse_color) {
  EXPECT_EQ(parse_color("red"), kRed);
  EXPECT_EQ(parse_color("Green"), kGreen);
  EXPECT_EQ(parse_color("GRAY"), kGray);
  EXPECT_THROW(parse_color("purple"), InvalidConfiguration);
  EXPECT_THROW(parse_color(""), InvalidConfiguration);

  EXPECT_EQ(color_to_str(kYellow), "yellow");
  EXPECT_EQ(valid_color_names(), "red, yellow, black, green, blue, white, cyan, and gray");
}

TEST(GameConfig, validate) {
  GameConfig::Params params;
  params.num_rows = 3;
  EXPECT_THROW(params.make_config(), InvalidConfiguration);

  params = GameConfig::Params();
  params.num_columns = 100;
  EXPECT_THROW(params.make_config(), InvalidConfiguration);

  params = GameConfig::Params();
  params.player2_color = "Red";
  EXPECT_THROW(params.make_config(), InvalidConfiguration);

  for (const char* reserved : {"blue", "white", "cyan"}) {
    params = GameConfig::Params();
    params.player1_color = reserved;
    EXPECT_THROW(params.make_config(), InvalidConfiguration) << reserved;
  }

  params = GameConfig::Params();
  params.player1_color = "black";
  params.player2_color = "green";
  GameConfig config = params.make_config();
  EXPECT_EQ(config.color_of(kPlayerA), kBlack);
  EXPECT_EQ(config.color_of(kPlayerB), kGreen);
}

TEST(GameConfig, options) {
  namespace po2 = boost_util::program_options;

  GameConfig::Params params;
  std::vector<std::string> args = {"-r", "8", "--columns", "9", "--player1-color", "gray"};
  po2::parse_args(params.make_options_description(), args);

  GameConfig config = params.make_config();
  EXPECT_EQ(config.num_rows, 8);
  EXPECT_EQ(config.num_columns, 9);
  EXPECT_EQ(config.color_of(kPlayerA), kGray);
  EXPECT_EQ(config.color_of(kPlayerB), kYellow);
}

TEST(IO, print_initial_state) {
  Board board;
  GameEngine engine(board);

  std::string expected =
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "|1|2|3|4|5|6|7|\n"
    "\n"
    "A: Player 1 (red)\n"
    "B: Player 2 (yellow)\n"
    "\n"
    "Player 1's turn...\n";
  EXPECT_EQ(render(engine), expected);
}

TEST(IO, print_won_state) {
  Board board;
  GameEngine engine(board);
  play(engine, kHorizontalWin);

  GameConfig config;
  config.player_colors = {kGreen, kBlack};

  std::string expected =
    "       x\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "|B|B|B| | | | |\n"
    "|*|*|*|*| | | |\n"
    "|1|2|3|4|5|6|7|\n"
    "\n"
    "A: Player 1 (green)\n"
    "B: Player 2 (black)\n"
    "\n"
    "Player 1 Wins!\n";
  EXPECT_EQ(render(engine, config), expected);
}

TEST(IO, print_tied_state) {
  Board board;
  GameEngine engine(board);
  play(engine, kTieGame);

  std::string out = render(engine);
  EXPECT_EQ(out.substr(0, 2), " x");
  EXPECT_NE(out.find("|B|B|A|A|B|B|B|\n"), std::string::npos);
  EXPECT_EQ(out.substr(out.size() - 11), "It's A Tie\n");
}

TEST(IO, wide_board_labels) {
  Board board(4, 12);
  GameEngine engine(board);

  std::string out = render(engine);
  EXPECT_NE(out.find("| | | | | | | | | |1|1|1|\n"
                     "|1|2|3|4|5|6|7|8|9|0|1|2|\n"),
            std::string::npos);
}

TEST(IO, three_digit_labels) {
  Board board(4, 120);
  GameEngine engine(board);

  std::vector<std::string> lines;
  std::istringstream ss(render(engine));
  for (std::string line; std::getline(ss, line);) {
    lines.push_back(line);
  }

  // 4 grid rows, then the hundreds, tens and units digits of each label
  ASSERT_GE(lines.size(), 7u);
  const std::string& hundreds = lines[4];
  const std::string& tens = lines[5];
  const std::string& units = lines[6];
  ASSERT_EQ(hundreds.size(), 2 * 120 + 1);

  // label 7 is in column 6
  EXPECT_EQ(hundreds.substr(12, 3), "| |");
  EXPECT_EQ(tens.substr(12, 3), "| |");
  EXPECT_EQ(units.substr(12, 3), "|7|");

  // label 45
  EXPECT_EQ(hundreds.substr(88, 3), "| |");
  EXPECT_EQ(tens.substr(88, 3), "|4|");
  EXPECT_EQ(units.substr(88, 3), "|5|");

  // labels 118 through 120
  EXPECT_EQ(hundreds.substr(234), "|1|1|1|");
  EXPECT_EQ(tens.substr(234), "|1|1|2|");
  EXPECT_EQ(units.substr(234), "|8|9|0|");
}

TEST(IO, terminal_mode) {
  Board board;
  GameEngine engine(board);
  play(engine, kHorizontalWin);

  util::Rendering::Guard guard(util::Rendering::kTerminal);
  std::string out = render(engine);
  EXPECT_NE(out.find("\033[36m●"), std::string::npos);  // highlighted winning line
  EXPECT_NE(out.find("\033[5m"), std::string::npos);    // blinking last move
  EXPECT_NE(out.find("○"), std::string::npos);
  EXPECT_EQ(out.find("|*|"), std::string::npos);
}

TEST(IO, state_to_json) {
  Board board;
  GameEngine engine(board);

  boost::json::object initial = IO::state_to_json(engine).as_object();
  EXPECT_EQ(initial.at("rows").as_int64(), 6);
  EXPECT_EQ(initial.at("columns").as_int64(), 7);
  EXPECT_EQ(initial.at("phase").as_string(), "in_progress");
  EXPECT_EQ(initial.at("current_player").as_int64(), 0);
  EXPECT_TRUE(initial.at("winner").is_null());
  EXPECT_TRUE(initial.at("last_move").is_null());
  EXPECT_TRUE(initial.at("winning_line").as_array().empty());
  EXPECT_EQ(initial.at("legal_columns").as_array().size(), 7);

  play(engine, kVerticalWin);
  boost::json::object won = IO::state_to_json(engine).as_object();

  EXPECT_EQ(won.at("phase").as_string(), "won");
  EXPECT_EQ(won.at("winner").as_int64(), 1);
  EXPECT_EQ(won.at("num_moves").as_int64(), 8);
  EXPECT_EQ(won.at("last_move"), (boost::json::array{2, 1}));
  EXPECT_EQ(won.at("winning_line").as_array().size(), 4);
  EXPECT_EQ(won.at("winning_line").as_array()[0], (boost::json::array{2, 1}));
  EXPECT_TRUE(won.at("legal_columns").as_array().empty());
  EXPECT_EQ(won.at("col_heights"), (boost::json::array{1, 4, 1, 1, 0, 1, 0}));
  EXPECT_EQ(won.at("cells").as_array()[5], (boost::json::array{1, 2, 1, 1, 0, 1, 0}));
}

namespace {

struct ShellRun {
  int num_games;
  std::string output;
  Phase phase;
  int num_moves;
};

ShellRun run_shell(const std::string& input, bool dump_json = false) {
  HumanTuiShell::Params params;
  params.clear_screen = false;
  params.dump_json = dump_json;

  std::istringstream in(input);
  std::ostringstream out;
  HumanTuiShell shell(GameConfig(), params, in, out);
  int num_games = shell.run();
  return {num_games, out.str(), shell.engine().phase(), shell.engine().state().num_moves};
}

int count(const std::string& s, const std::string& sub) {
  int n = 0;
  for (size_t pos = s.find(sub); pos != std::string::npos; pos = s.find(sub, pos + 1)) n++;
  return n;
}

}  // namespace

TEST(HumanTuiShell, single_game) {
  ShellRun run = run_shell("1\n1\n2\n2\n3\n3\n4\nn\n");

  EXPECT_EQ(run.num_games, 1);
  EXPECT_EQ(run.phase, kWon);
  EXPECT_EQ(run.num_moves, 7);
  EXPECT_EQ(count(run.output, "Player 1, enter column [1-7]: "), 4);
  EXPECT_EQ(count(run.output, "Player 2, enter column [1-7]: "), 3);
  EXPECT_EQ(count(run.output, "Player 1 Wins!"), 1);
  EXPECT_NE(run.output.find("|*|*|*|*| | | |"), std::string::npos);
  EXPECT_EQ(run.output.substr(run.output.size() - 34), "Do you want to play again? [y/n]: ");
}

TEST(HumanTuiShell, invalid_input) {
  ShellRun run = run_shell("abc\n0\n8\n4 5\n\n2x\n-2147483648\n99999999999\n-3\n1\n");

  EXPECT_EQ(run.num_games, 0);
  EXPECT_EQ(run.phase, kInProgress);
  EXPECT_EQ(run.num_moves, 1);
  EXPECT_EQ(count(run.output, "Invalid input!"), 9);
  EXPECT_EQ(count(run.output, "Player 2, enter column [1-7]: "), 1);
}

TEST(HumanTuiShell, full_column) {
  ShellRun run = run_shell("1\n1\n1\n1\n1\n1\n1\n2\n");

  EXPECT_EQ(run.num_games, 0);
  EXPECT_EQ(run.num_moves, 7);
  EXPECT_EQ(count(run.output, "Column 1 is full"), 1);
}

TEST(HumanTuiShell, play_again) {
  ShellRun run = run_shell(
    "1\n1\n2\n2\n3\n3\n4\n"
    "Y\n"
    "1\n2\n3\n2\n4\n2\n6\n2\n"
    "maybe\n"
    "no\n");

  EXPECT_EQ(run.num_games, 2);
  EXPECT_EQ(run.phase, kWon);
  EXPECT_EQ(run.num_moves, 8);
  EXPECT_EQ(count(run.output, "Player 1 Wins!"), 1);
  EXPECT_EQ(count(run.output, "Player 2 Wins!"), 1);
  EXPECT_EQ(count(run.output, "Do you want to play again? [y/n]: "), 3);
  EXPECT_EQ(count(run.output, "Invalid input!"), 1);
}

TEST(HumanTuiShell, tie) {
  std::string input;
  for (int col : kTieGame) {
    input += std::to_string(col + 1) + "\n";
  }
  ShellRun run = run_shell(input);

  EXPECT_EQ(run.num_games, 1);
  EXPECT_EQ(run.phase, kTied);
  EXPECT_EQ(count(run.output, "It's A Tie"), 1);
}

TEST(HumanTuiShell, end_of_input) {
  ShellRun run = run_shell("");
  EXPECT_EQ(run.num_games, 0);
  EXPECT_EQ(run.num_moves, 0);

  // end of input at the play-again prompt counts as "no"
  run = run_shell("1\n1\n2\n2\n3\n3\n4\n");
  EXPECT_EQ(run.num_games, 1);
}

TEST(HumanTuiShell, not_copyable) {
  static_assert(!std::is_copy_constructible_v<HumanTuiShell>);
  static_assert(!std::is_move_constructible_v<HumanTuiShell>);
  static_assert(!std::is_copy_assignable_v<HumanTuiShell>);
}

TEST(HumanTuiShell, clear_screen_failure) {
  // Without TERM, clear(1) fails. The shell must keep going without clearing.
  const char* term = std::getenv("TERM");
  std::string saved_term = term ? term : "";
  unsetenv("TERM");

  HumanTuiShell::Params params;
  params.clear_screen = true;
  std::istringstream in("1\n1\n2\n2\n3\n3\n4\nn\n");
  std::ostringstream out;
  HumanTuiShell shell(GameConfig(), params, in, out);

  int num_games = -1;
  EXPECT_NO_THROW(num_games = shell.run());
  if (term) setenv("TERM", saved_term.c_str(), 1);

  EXPECT_EQ(num_games, 1);
  EXPECT_EQ(count(out.str(), "Player 1 Wins!"), 1);
}

TEST(HumanTuiShell, dump_json) {
  ShellRun run = run_shell("4\n", true);
  EXPECT_EQ(run.num_moves, 1);
  EXPECT_NE(run.output.find("\"num_moves\" : 1"), std::string::npos);
  EXPECT_NE(run.output.find("\"last_move\" : [5, 3]"), std::string::npos);
  EXPECT_NE(run.output.find("\"legal_columns\" : [0, 1, 2, 3, 4, 5, 6]"), std::string::npos);

  run = run_shell("4\n");
  EXPECT_EQ(run.output.find("num_moves"), std::string::npos);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
