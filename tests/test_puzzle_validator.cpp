#include "puzzle.h"
#include "puzzle_validator.h"
#include "test_harness.h"

using namespace breach_tests;

namespace {

const std::vector<Position> kStairPath = {{0, 0}, {1, 0}, {1, 1}};

Puzzle stair_puzzle(int buffer_size, int par) {
  Grid grid = make_grid({{"1C", "FF", "FF"},
                         {"BD", "55", "FF"},
                         {"FF", "FF", "FF"}});
  return Puzzle(std::move(grid), make_target_sequences({{"1C", "BD", "55"}}),
                buffer_size, par, Difficulty::Easy, kStairPath);
}

void stair_path_is_valid(TestCheck &check) {
  check.expect(validate_path_shape(kStairPath, 3),
               "(0,0) (1,0) (1,1) follows the selection rules");
  check.expect(validate_path_shape({{0, 2}}, 3), "a single row-0 pick");
  check.expect(validate_path_shape({{0, 1}, {2, 1}, {2, 0}, {0, 0}}, 3),
               "later picks may return to row 0");
}

void broken_paths_are_rejected(TestCheck &check) {
  check.expect(!validate_path_shape({}, 3), "empty path");
  check.expect(!validate_path_shape({{1, 0}, {2, 0}}, 3),
               "first pick outside row 0");
  check.expect(!validate_path_shape({{0, 0}, {0, 1}}, 3),
               "second pick must be vertical");
  check.expect(!validate_path_shape({{0, 0}, {1, 0}, {2, 0}}, 3),
               "third pick must be horizontal");
  check.expect(!validate_path_shape({{0, 0}, {1, 0}, {1, 0}}, 3),
               "repeated cell");
  check.expect(!validate_path_shape({{0, 0}, {3, 0}}, 3), "out of bounds");
  check.expect(!validate_path_shape({{0, -1}}, 3), "negative column");
}

void consistent_puzzle_validates(TestCheck &check) {
  const Puzzle puzzle = stair_puzzle(3, 3);
  check.expect(validate_puzzle(puzzle), "stair puzzle should validate");
  check.expect(validate_puzzle(puzzle) == validate_puzzle(puzzle),
               "validation must be repeatable");
  check.expect(validate_puzzle(stair_puzzle(5, 3)),
               "a larger buffer is fine");
}

void inconsistent_puzzles_fail(TestCheck &check) {
  check.expect(!validate_puzzle(stair_puzzle(2, 3)), "buffer below par");
  check.expect(!validate_puzzle(stair_puzzle(3, 2)),
               "par differs from path length");

  Grid grid = make_grid({{"1C", "FF", "FF"},
                         {"BD", "55", "FF"},
                         {"FF", "FF", "FF"}});
  const Puzzle wrong_order(grid, make_target_sequences({{"BD", "1C", "55"}}),
                           3, 3, Difficulty::Easy, kStairPath);
  check.expect(!validate_puzzle(wrong_order),
               "path codes do not complete the sequence");

  const Puzzle no_sequences(grid, {}, 3, 3, Difficulty::Easy, kStairPath);
  check.expect(!validate_puzzle(no_sequences), "no sequences");

  Grid ragged = grid;
  ragged[2].pop_back();
  const Puzzle non_square(ragged, make_target_sequences({{"1C", "BD", "55"}}),
                          3, 3, Difficulty::Easy, kStairPath);
  check.expect(!validate_puzzle(non_square), "non-square grid");
}

void blockers_on_path_fail_when_checked(TestCheck &check) {
  Grid grid = make_grid({{"1C", "FF", "FF"},
                         {"BD", "55", "FF"},
                         {"FF", "FF", "FF"}});
  grid[1][0].kind = CellKind::Blocker;
  const Puzzle puzzle(grid, make_target_sequences({{"1C", "BD", "55"}}), 3, 3,
                      Difficulty::Medium, kStairPath);
  check.expect(validate_puzzle(puzzle), "blockers ignored by default");
  check.expect(!validate_puzzle(puzzle, true),
               "blocker on path must fail the checked validation");
}

void wildcards_count_as_matches(TestCheck &check) {
  Grid grid = make_grid({{"1C", "FF", "FF"},
                         {"E9", "55", "FF"},
                         {"FF", "FF", "FF"}});
  const auto sequences = make_target_sequences({{"1C", "BD", "55"}});
  check.expect(!validate_puzzle(Puzzle(grid, sequences, 3, 3,
                                       Difficulty::Hard, kStairPath)),
               "E9 does not match BD");
  grid[1][0].kind = CellKind::Wildcard;
  check.expect(validate_puzzle(
                   Puzzle(grid, sequences, 3, 3, Difficulty::Hard, kStairPath)),
               "wildcard stands in for BD");
}

} // namespace

int main() {
  return run_suite(
      "PUZZLE VALIDATOR",
      {
          {"stair path is valid", stair_path_is_valid},
          {"broken paths are rejected", broken_paths_are_rejected},
          {"consistent puzzle validates", consistent_puzzle_validates},
          {"inconsistent puzzles fail", inconsistent_puzzles_fail},
          {"blockers on path fail when checked",
           blockers_on_path_fail_when_checked},
          {"wildcards count as matches", wildcards_count_as_matches},
      });
}
