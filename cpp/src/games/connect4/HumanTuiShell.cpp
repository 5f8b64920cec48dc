#include "games/connect4/HumanTuiShell.hpp"

#include "games/connect4/IO.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/ScreenUtil.hpp"
#include "util/StringUtil.hpp"

#include <format>
#include <stdexcept>
#include <vector>

namespace c4 {

HumanTuiShell::HumanTuiShell(const GameConfig& config, const Params& params, std::istream& in,
                             std::ostream& out)
    : config_(config),
      params_(params),
      clear_screen_(params.clear_screen),
      in_(in),
      out_(out),
      board_(config.num_rows, config.num_columns),
      engine_(board_) {}

int HumanTuiShell::run() {
  int num_games = 0;
  while (play_game()) {
    num_games++;
    if (!prompt_play_again()) break;
    engine_.reset();
  }
  LOG_INFO("Session over after {} completed game(s)", num_games);
  return num_games;
}

bool HumanTuiShell::play_game() {
  while (engine_.phase() == kInProgress) {
    render();

    int col;
    if (!prompt_for_column(col)) return false;

    MoveResult result = engine_.apply_move(col);
    RELEASE_ASSERT(result.accepted(), "Engine rejected pre-validated column {}: {}", col,
                   result.to_str());

    if (params_.dump_json) {
      boost_util::pretty_print(out_, IO::state_to_json(engine_));
      out_ << std::endl;
    }
  }

  render();
  return true;
}

bool HumanTuiShell::prompt_for_column(int& col) {
  ColumnMask legal = engine_.legal_columns();
  while (true) {
    int player = player_number(engine_.current_player());
    out_ << std::format("Player {}, enter column [1-{}]: ", player, board_.num_columns());
    out_.flush();

    std::string line;
    if (!read_line(line)) return false;

    std::optional<int> choice = parse_column(line);
    if (!choice || !board_.is_valid_column(*choice)) {
      LOG_DEBUG("Invalid input: \"{}\"", line);
      out_ << "Invalid input!" << std::endl;
      continue;
    }
    if (!legal[*choice]) {
      out_ << std::format("Column {} is full", *choice + 1) << std::endl;
      continue;
    }

    col = *choice;
    return true;
  }
}

bool HumanTuiShell::prompt_play_again() {
  while (true) {
    out_ << "Do you want to play again? [y/n]: ";
    out_.flush();

    std::string line;
    if (!read_line(line)) return false;

    std::vector<std::string> tokens = util::split(line);
    std::string answer = tokens.size() == 1 ? util::to_lower(tokens[0]) : "";

    if (answer == "y" || answer == "yes") return true;
    if (answer == "n" || answer == "no") return false;
    out_ << "Invalid input!" << std::endl;
  }
}

void HumanTuiShell::render() {
  if (clear_screen_ && !util::clearscreen()) {
    LOG_WARN("Failed to clear the screen, drawing boards one after another instead");
    clear_screen_ = false;
  }
  IO::print_state(out_, engine_, config_);
}

bool HumanTuiShell::read_line(std::string& line) {
  if (std::getline(in_, line)) return true;

  // Keep the shell prompt off the line of our own prompt
  out_ << std::endl;
  return false;
}

std::optional<int> HumanTuiShell::parse_column(const std::string& line) {
  std::vector<std::string> tokens = util::split(line);
  if (tokens.size() != 1) return std::nullopt;

  const std::string& token = tokens[0];
  try {
    size_t pos;
    int k = std::stoi(token, &pos);
    if (pos != token.size() || k < 1) return std::nullopt;
    return k - 1;
  } catch (std::invalid_argument& e) {
    return std::nullopt;
  } catch (std::out_of_range& e) {
    return std::nullopt;
  }
}

}  // namespace c4
