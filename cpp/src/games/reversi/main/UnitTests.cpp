#include "games/reversi/Constants.hpp"
#include "games/reversi/GameRunner.hpp"
#include "games/reversi/GameState.hpp"
#include "games/reversi/Grid.hpp"
#include "games/reversi/IO.hpp"
#include "games/reversi/Negamax.hpp"
#include "games/reversi/Piece.hpp"
#include "games/reversi/PlayerFactory.hpp"
#include "games/reversi/TilePos.hpp"
#include "games/reversi/players/HumanTuiPlayer.hpp"
#include "games/reversi/players/RandomPlayer.hpp"
#include "games/reversi/tests/Common.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using namespace reversi;
using reversi::tests::get_repr;
using reversi::tests::make_state;

namespace {

TilePos pos(const char* s) { return *TilePos::from_str(s); }

TilePosList positions(const std::vector<const char*>& strs) {
  TilePosList out;
  for (const char* s : strs) out.push_back(pos(s));
  return out;
}

const std::string init_state_repr =
  "   A B C D E F G H\n"
  " 1| | | | | | | | |\n"
  " 2| | | | | | | | |\n"
  " 3| | | |.| | | | |\n"
  " 4| | |.|0|*| | | |\n"
  " 5| | | |*|0|.| | |\n"
  " 6| | | | |.| | | |\n"
  " 7| | | | | | | | |\n"
  " 8| | | | | | | | |\n";

// Black to move. Each black capture leaves white without a reply.
const std::string pass_board =
  "   A B C D E F G H\n"
  " 1|*|0| | | | | | |\n"
  " 2| | | | | | | | |\n"
  " 3|*|0| | | | | | |\n"
  " 4| | | | | | | | |\n"
  " 5| | | | | | | | |\n"
  " 6| | | | | | | | |\n"
  " 7| | | | | | | | |\n"
  " 8| | | | | | | | |\n";

// Black everywhere except an empty H8 and a white A2: neither side can move.
Grid make_blocked_grid() {
  Grid grid;
  for (int i = 0; i < kNumCells; ++i) {
    grid.set(TilePos::from_index(i), Piece::kBlack);
  }
  grid.clear(pos("H8"));
  grid.set(pos("A2"), Piece::kWhite);
  return grid;
}

// Checks the per-state properties that must hold in every reachable position.
void check_state_properties(const GameState& state) {
  for (Piece p : kAllPieces) {
    TilePosList moves = state.valid_moves(p);
    for (int i = 0; i < kNumCells; ++i) {
      TilePos t = TilePos::from_index(i);
      bool in_list = std::find(moves.begin(), moves.end(), t) != moves.end();
      EXPECT_EQ(in_list, state.is_valid_move(t, p)) << t.to_str();
      EXPECT_EQ(in_list, !state.get_flips(t, p).empty()) << t.to_str();
    }
    EXPECT_EQ(state.has_valid_move(p), !moves.empty());
  }

  bool no_moves = state.valid_moves(Piece::kBlack).empty() &&
                  state.valid_moves(Piece::kWhite).empty();
  EXPECT_EQ(state.is_terminal(), no_moves);
  if (!state.is_terminal()) {
    EXPECT_FALSE(state.valid_moves().empty());
  }

  Scores scores = state.scores();
  EXPECT_EQ(scores[Piece::kBlack], state.grid().count(Piece::kBlack));
  EXPECT_EQ(scores[Piece::kWhite], state.grid().count(Piece::kWhite));
}

class ScriptedPlayer : public AbstractPlayer {
 public:
  explicit ScriptedPlayer(const TilePosList& moves) : moves_(moves) {}

  TilePos get_move(const GameState&) override { return moves_.at(index_++); }

 private:
  TilePosList moves_;
  size_t index_ = 0;
};

}  // namespace

TEST(TilePos, make) {
  EXPECT_TRUE(TilePos::make(0, 0).has_value());
  EXPECT_TRUE(TilePos::make(7, 7).has_value());
  EXPECT_FALSE(TilePos::make(-1, 0).has_value());
  EXPECT_FALSE(TilePos::make(0, 8).has_value());
  EXPECT_FALSE(TilePos::make(8, 3).has_value());

  TilePos p = *TilePos::make(2, 3);
  EXPECT_EQ(p.row(), 2);
  EXPECT_EQ(p.col(), 3);
  EXPECT_EQ(p.index(), 19);
  EXPECT_EQ(TilePos::from_index(19), p);
}

TEST(TilePos, from_index_out_of_range) {
  EXPECT_THROW(TilePos::from_index(-1), util::ReleaseAssertionError);
  EXPECT_THROW(TilePos::from_index(kNumCells), util::ReleaseAssertionError);
}

TEST(TilePos, notation) {
  EXPECT_EQ(pos("D3"), *TilePos::make(2, 3));
  EXPECT_EQ(pos("d3"), *TilePos::make(2, 3));
  EXPECT_EQ(pos("H8").to_str(), "H8");
  EXPECT_EQ(pos("a1").to_str(), "A1");

  EXPECT_FALSE(TilePos::from_str("").has_value());
  EXPECT_FALSE(TilePos::from_str("D").has_value());
  EXPECT_FALSE(TilePos::from_str("I1").has_value());
  EXPECT_FALSE(TilePos::from_str("A0").has_value());
  EXPECT_FALSE(TilePos::from_str("A9").has_value());
  EXPECT_FALSE(TilePos::from_str("A10").has_value());
  EXPECT_FALSE(TilePos::from_str("A1x").has_value());
  EXPECT_FALSE(TilePos::from_str("11").has_value());
}

TEST(TilePos, ordering) {
  EXPECT_LT(pos("H1"), pos("A2"));
  EXPECT_LT(pos("A2"), pos("B2"));
  EXPECT_EQ(pos("C5"), pos("c5"));
  EXPECT_NE(pos("C5"), pos("E3"));
}

TEST(TilePos, neighbors) {
  EXPECT_EQ(pos("A1").neighbors(), positions({"B1", "A2", "B2"}));
  EXPECT_EQ(pos("H8").neighbors(), positions({"G7", "H7", "G8"}));
  EXPECT_EQ(pos("D4").neighbors(),
            positions({"C3", "D3", "E3", "C4", "E4", "C5", "D5", "E5"}));
  EXPECT_EQ(pos("A5").neighbors().size(), 5u);
}

TEST(Piece, opposite) {
  for (Piece p : kAllPieces) {
    EXPECT_NE(opposite(p), p);
    EXPECT_EQ(opposite(opposite(p)), p);
  }
  EXPECT_EQ(opposite(Piece::kBlack), Piece::kWhite);
}

TEST(Grid, get_set_clear) {
  Grid grid;
  TilePos p = pos("C6");
  EXPECT_FALSE(grid.get(p).has_value());

  grid.set(p, Piece::kWhite);
  EXPECT_EQ(grid.get(p), Piece::kWhite);
  grid.set(p, Piece::kBlack);
  EXPECT_EQ(grid.get(p), Piece::kBlack);
  EXPECT_EQ(grid.count(Piece::kBlack), 1);
  EXPECT_EQ(grid.count(Piece::kWhite), 0);

  grid.clear(p);
  EXPECT_FALSE(grid.get(p).has_value());
  EXPECT_EQ(grid, Grid());
}

TEST(Grid, is_full) {
  Grid grid;
  EXPECT_FALSE(grid.is_full());
  for (int i = 0; i < kNumCells; ++i) {
    grid.set(TilePos::from_index(i), i % 2 ? Piece::kWhite : Piece::kBlack);
  }
  EXPECT_TRUE(grid.is_full());
  EXPECT_EQ(grid.count(Piece::kBlack), kNumCells / 2);

  grid.clear(pos("E5"));
  EXPECT_FALSE(grid.is_full());
}

TEST(Grid, rows) {
  GameState state;
  const Grid& grid = state.grid();

  int expected_index = 0;
  int occupied = 0;
  for (const Grid::Row& row : grid.rows()) {
    EXPECT_EQ(row.index, expected_index++);
    EXPECT_EQ(row.tiles.size(), size_t(kBoardDimension));
    for (int col = 0; col < kBoardDimension; ++col) {
      EXPECT_EQ(row.tiles[col], grid.get(*TilePos::make(row.index, col)));
      if (row.tiles[col]) occupied++;
    }
  }
  EXPECT_EQ(expected_index, kBoardDimension);
  EXPECT_EQ(occupied, kNumStartingPieces);

  // Each call is a fresh traversal.
  EXPECT_EQ(std::distance(grid.rows().begin(), grid.rows().end()), kBoardDimension);
  EXPECT_EQ(std::distance(grid.rows().begin(), grid.rows().end()), kBoardDimension);
}

TEST(GameState, initial_state) {
  GameState state;
  EXPECT_EQ(state.current_player(), Piece::kBlack);
  EXPECT_FALSE(state.is_terminal());
  EXPECT_EQ(state.scores()[Piece::kBlack], 2);
  EXPECT_EQ(state.scores()[Piece::kWhite], 2);
  EXPECT_EQ(state.grid().get(pos("D4")), Piece::kWhite);
  EXPECT_EQ(state.grid().get(pos("E5")), Piece::kWhite);
  EXPECT_EQ(state.grid().get(pos("E4")), Piece::kBlack);
  EXPECT_EQ(state.grid().get(pos("D5")), Piece::kBlack);
  EXPECT_EQ(get_repr(state), init_state_repr);
}

TEST(GameState, opening_moves) {
  GameState state;
  EXPECT_EQ(state.valid_moves(Piece::kBlack), positions({"D3", "C4", "F5", "E6"}));
  EXPECT_EQ(state.valid_moves(Piece::kWhite), positions({"E3", "F4", "C5", "D6"}));
  check_state_properties(state);
}

TEST(GameState, opening_move_flips) {
  GameState state;
  EXPECT_EQ(state.get_flips(pos("D3"), Piece::kBlack), positions({"D4"}));

  state.apply_move(pos("D3"), Piece::kBlack);
  EXPECT_EQ(state.current_player(), Piece::kWhite);
  EXPECT_EQ(state.grid().get(pos("D3")), Piece::kBlack);
  EXPECT_EQ(state.grid().get(pos("D4")), Piece::kBlack);
  EXPECT_EQ(state.grid().get(pos("E5")), Piece::kWhite);
  EXPECT_EQ(state.scores()[Piece::kBlack], 4);
  EXPECT_EQ(state.scores()[Piece::kWhite], 1);

  std::string expected_repr =
    "   A B C D E F G H\n"
    " 1| | | | | | | | |\n"
    " 2| | | | | | | | |\n"
    " 3| | |.|*|.| | | |\n"
    " 4| | | |*|*| | | |\n"
    " 5| | |.|*|0| | | |\n"
    " 6| | | | | | | | |\n"
    " 7| | | | | | | | |\n"
    " 8| | | | | | | | |\n";
  EXPECT_EQ(get_repr(state), expected_repr);
}

TEST(GameState, multi_direction_flips) {
  GameState state = make_state(
    "   A B C D E F G H\n"
    " 1| | | | | | | | |\n"
    " 2| |*| |*| |*| | |\n"
    " 3| | |0|0|0| | | |\n"
    " 4| |*|0| |0|*| | |\n"
    " 5| | |0|0|0| | | |\n"
    " 6| |*| |*| |*| | |\n"
    " 7| | | | | | | | |\n"
    " 8| | | | | | | | |\n",
    Piece::kBlack);

  TilePosList flips = state.get_flips(pos("D4"), Piece::kBlack);
  EXPECT_EQ(flips, positions({"C3", "D3", "E3", "C4", "E4", "C5", "D5", "E5"}));

  state.apply_move(pos("D4"), Piece::kBlack);
  EXPECT_EQ(state.scores()[Piece::kBlack], 17);
  EXPECT_EQ(state.scores()[Piece::kWhite], 0);
  EXPECT_TRUE(state.is_terminal());
  EXPECT_EQ(state.winner(), Piece::kBlack);
}

TEST(GameState, capture_needs_anchor) {
  // From E5, the white run toward H2 runs off the board, and the run toward A5 hits an empty tile.
  GameState state = make_state(
    "   A B C D E F G H\n"
    " 1| | | | | | | | |\n"
    " 2| | | | | | | |0|\n"
    " 3| | | | | | |0| |\n"
    " 4| | | | | |0| | |\n"
    " 5|*| |0|0| | | | |\n"
    " 6| | | | | | | | |\n"
    " 7| | | | | | | | |\n"
    " 8| | | | | | | | |\n",
    Piece::kBlack);

  EXPECT_TRUE(state.get_flips(pos("E5"), Piece::kBlack).empty());
  EXPECT_TRUE(state.get_flips(pos("B5"), Piece::kBlack).empty());
  EXPECT_TRUE(state.get_flips(pos("D5"), Piece::kBlack).empty());  // occupied
  EXPECT_TRUE(state.valid_moves(Piece::kBlack).empty());
  EXPECT_TRUE(state.valid_moves(Piece::kWhite).empty());
  EXPECT_TRUE(state.is_terminal());
}

TEST(GameState, invalid_move_is_atomic) {
  GameState state;
  GameState before = state;

  EXPECT_THROW(state.apply_move(pos("A1"), Piece::kBlack), InvalidMoveError);
  EXPECT_EQ(state, before);

  EXPECT_THROW(state.apply_move(pos("D4"), Piece::kBlack), InvalidMoveError);  // occupied
  EXPECT_EQ(state, before);

  // Legal for white, but it is black's turn.
  EXPECT_THROW(state.apply_move(pos("E3"), Piece::kWhite), InvalidMoveError);
  EXPECT_EQ(state, before);

  // InvalidMoveError is recoverable.
  EXPECT_THROW(state.apply_move(pos("A1")), util::CleanException);
  EXPECT_EQ(state, before);
}

TEST(GameState, opponent_passes) {
  GameState state = make_state(pass_board, Piece::kBlack);
  EXPECT_EQ(state.current_player(), Piece::kBlack);
  EXPECT_EQ(state.valid_moves(), positions({"C1", "C3"}));
  EXPECT_TRUE(state.valid_moves(Piece::kWhite).empty());

  state.apply_move(pos("C1"));
  EXPECT_FALSE(state.is_terminal());
  EXPECT_EQ(state.current_player(), Piece::kBlack);
  EXPECT_TRUE(state.valid_moves(Piece::kWhite).empty());
  check_state_properties(state);

  state.apply_move(pos("C3"));
  EXPECT_TRUE(state.is_terminal());
  EXPECT_EQ(state.scores()[Piece::kBlack], 6);
  EXPECT_EQ(state.scores()[Piece::kWhite], 0);
  EXPECT_EQ(state.winner(), Piece::kBlack);
}

TEST(GameState, constructor_applies_pass_rule) {
  GameState state = make_state(pass_board, Piece::kWhite);
  EXPECT_EQ(state.current_player(), Piece::kBlack);
  EXPECT_EQ(state, make_state(pass_board, Piece::kBlack));
}

TEST(GameState, blocked_board_is_terminal) {
  GameState state(make_blocked_grid(), Piece::kBlack);
  EXPECT_FALSE(state.grid().is_full());
  EXPECT_TRUE(state.valid_moves(Piece::kBlack).empty());
  EXPECT_TRUE(state.valid_moves(Piece::kWhite).empty());
  EXPECT_TRUE(state.is_terminal());
  EXPECT_EQ(state.scores()[Piece::kBlack], 62);
  EXPECT_EQ(state.scores()[Piece::kWhite], 1);
  EXPECT_EQ(state.winner(), Piece::kBlack);

  GameState before = state;
  EXPECT_THROW(state.apply_move(pos("H8"), Piece::kBlack), TerminalStateError);
  EXPECT_EQ(state, before);
}

TEST(GameState, full_board_is_terminal) {
  Grid grid;
  for (int i = 0; i < kNumCells; ++i) {
    grid.set(TilePos::from_index(i), i < kNumCells / 2 ? Piece::kBlack : Piece::kWhite);
  }
  GameState state(grid, Piece::kWhite);
  EXPECT_TRUE(state.is_terminal());
  EXPECT_EQ(state.scores().total(), kNumCells);
  EXPECT_FALSE(state.winner().has_value());
}

TEST(GameState, reachable_states) {
  // Breadth-first over every position reachable in the first 4 plies.
  std::unordered_set<GameState> seen;
  std::vector<GameState> frontier = {GameState()};
  for (int ply = 0; ply < 4; ++ply) {
    std::vector<GameState> next;
    for (const GameState& state : frontier) {
      check_state_properties(state);

      int total = state.scores().total();
      for (const TilePos& move : state.valid_moves()) {
        GameState child = state;
        child.apply_move(move);
        EXPECT_EQ(child.scores().total(), total + 1);
        EXPECT_EQ(child.grid().get(move), state.current_player());
        if (seen.insert(child).second) {
          next.push_back(child);
        }
      }

      GameState copy = state;
      for (int i = 0; i < kNumCells; ++i) {
        TilePos t = TilePos::from_index(i);
        if (state.is_valid_move(t, state.current_player())) continue;
        EXPECT_THROW(copy.apply_move(t), InvalidMoveError);
        EXPECT_EQ(copy, state);
      }
    }
    frontier = std::move(next);
  }
  EXPECT_GT(seen.size(), 100u);
}

TEST(GameState, random_playouts) {
  util::Random::set_seed(1);
  for (int game = 0; game < 20; ++game) {
    GameState state;
    while (!state.is_terminal()) {
      check_state_properties(state);
      TilePosList moves = state.valid_moves();
      int total = state.scores().total();
      state.apply_move(*util::Random::choose(moves.begin(), moves.end()));
      EXPECT_EQ(state.scores().total(), total + 1);
    }
    check_state_properties(state);
    EXPECT_THROW(state.apply_move(pos("A1")), TerminalStateError);
  }
}

TEST(GameState, hash) {
  GameState a;
  GameState b;
  EXPECT_EQ(a.hash(), b.hash());
  b.apply_move(pos("D3"));
  EXPECT_NE(a, b);
  EXPECT_NE(a.hash(), b.hash());
}

TEST(IO, piece_to_str) {
  EXPECT_EQ(IO::piece_to_str(Piece::kBlack), "*");
  EXPECT_EQ(IO::piece_to_str(Piece::kWhite), "0");
}

TEST(IO, print_state) {
  GameState state;
  state.apply_move(pos("D3"));

  std::ostringstream ss;
  IO::print_state(ss, state, pos("D3"));
  std::string expected =
    "         x\n"
    "   A B C D E F G H\n"
    " 1| | | | | | | | |\n"
    " 2| | | | | | | | |\n"
    "x3| | |.|*|.| | | |\n"
    " 4| | | |*|*| | | |\n"
    " 5| | |.|*|0| | | |\n"
    " 6| | | | | | | | |\n"
    " 7| | | | | | | | |\n"
    " 8| | | | | | | | |\n"
    "\n"
    "Score: Player\n"
    "    4: *\n"
    "    1: 0\n"
    "\n";
  EXPECT_EQ(ss.str(), expected);
}

TEST(IO, print_state_with_names) {
  GameState state;
  IO::player_name_array_t names = {"alice", "bob"};

  std::ostringstream ss;
  IO::print_state(ss, state, std::nullopt, &names);
  EXPECT_NE(ss.str().find("    2: * [alice]\n"), std::string::npos);
  EXPECT_NE(ss.str().find("    2: 0 [bob]\n"), std::string::npos);
}

TEST(HumanTuiPlayer, reprompts_until_valid) {
  std::istringstream in("zz\nA1\nd3\n");
  std::ostringstream out;
  HumanTuiPlayer player(in, out);
  player.init_game(Piece::kBlack);

  GameState state;
  EXPECT_EQ(player.get_move(state), pos("D3"));

  std::string s = out.str();
  size_t first = s.find("Invalid input!");
  ASSERT_NE(first, std::string::npos);
  EXPECT_NE(s.find("Invalid input!", first + 1), std::string::npos);
  EXPECT_NE(s.find("Enter move [A1-H8]: "), std::string::npos);
}

TEST(HumanTuiPlayer, end_of_input) {
  std::istringstream in("Q9\n");
  std::ostringstream out;
  HumanTuiPlayer player(in, out);
  player.init_game(Piece::kWhite);

  GameState state;
  state.apply_move(pos("D3"));
  EXPECT_THROW(player.get_move(state), util::CleanException);
}

TEST(PlayerFactory, create) {
  Negamax::Params params;
  params.depth = 2;

  for (const std::string& type : PlayerFactory::player_types()) {
    AbstractPlayer_sptr player = PlayerFactory::create(type, params);
    ASSERT_TRUE(player);
    EXPECT_EQ(player->get_name(), type);
  }
  EXPECT_THROW(PlayerFactory::create("minimax", params), util::CleanException);

  params.evaluator = "mobility";
  EXPECT_THROW(PlayerFactory::create("negamax", params), util::CleanException);
}

TEST(GameRunner, random_vs_negamax) {
  util::Random::set_seed(7);

  Negamax::Params negamax_params;
  negamax_params.depth = 2;
  AbstractPlayer_sptr black = PlayerFactory::create("random", negamax_params);
  AbstractPlayer_sptr white = PlayerFactory::create("negamax", negamax_params);

  GameRunner runner(GameRunner::Params{});
  GameRunner::Result result = runner.run(*black, *white);

  EXPECT_EQ(result.num_moves, result.scores.total() - kNumStartingPieces);
  EXPECT_GT(result.num_moves, 0);
  if (result.scores[Piece::kBlack] > result.scores[Piece::kWhite]) {
    EXPECT_EQ(result.winner, Piece::kBlack);
  } else if (result.scores[Piece::kWhite] > result.scores[Piece::kBlack]) {
    EXPECT_EQ(result.winner, Piece::kWhite);
  } else {
    EXPECT_FALSE(result.winner.has_value());
  }
}

TEST(GameRunner, scripted_game) {
  // A 9-move game in which white is wiped out.
  ScriptedPlayer black(positions({"E6", "E3", "G5", "E7", "C5"}));
  ScriptedPlayer white(positions({"F4", "F6", "D6", "F5"}));

  GameRunner runner(GameRunner::Params{});
  GameRunner::Result result = runner.run(black, white);

  EXPECT_EQ(result.num_moves, 9);
  EXPECT_EQ(result.scores[Piece::kBlack], 13);
  EXPECT_EQ(result.scores[Piece::kWhite], 0);
  EXPECT_EQ(result.winner, Piece::kBlack);
}

TEST(GameRunner, illegal_move) {
  ScriptedPlayer black(positions({"A1"}));
  ScriptedPlayer white(positions({}));

  GameRunner runner(GameRunner::Params{});
  try {
    runner.run(black, white);
    FAIL() << "expected util::Exception";
  } catch (const util::CleanException&) {
    FAIL() << "an illegal move from a player must not be reported as a CleanException";
  } catch (const util::Exception& e) {
    EXPECT_NE(std::string(e.what()).find("A1"), std::string::npos);
  }
}

TEST(GameRunner, run_series) {
  util::Random::set_seed(3);

  RandomPlayer black;
  RandomPlayer white;
  GameRunner::Params params;
  params.num_games = 5;

  GameRunner runner(params);
  GameRunner::SeriesResult series = runner.run_series(black, white);
  EXPECT_EQ(series.num_games(), 5);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
