#include "code_pool.h"
#include "puzzle.h"
#include "quality_gate.h"
#include "random_source.h"
#include "test_harness.h"

using namespace breach_tests;

namespace {

const std::vector<CodeList> kTwoCodes = {{"1C", "BD"}};
const std::vector<Position> kShortPath = {{0, 0}, {1, 0}};
const CodeList kPool = {"1C", "BD", "FF"};

Grid one_route_grid() {
  return make_grid({{"1C", "FF", "FF"},
                    {"BD", "FF", "FF"},
                    {"FF", "FF", "FF"}});
}

// Two parallel routes: (0,0)(1,0) and (0,1)(1,1).
Grid two_route_grid() {
  return make_grid({{"1C", "1C", "FF"},
                    {"BD", "BD", "FF"},
                    {"FF", "FF", "FF"}});
}

Puzzle make_puzzle(Grid grid, int buffer_size, int par,
                   std::vector<Position> path) {
  return Puzzle(std::move(grid), make_target_sequences(kTwoCodes), buffer_size,
                par, Difficulty::Expert, std::move(path));
}

QualityTargets targets(int min, int max, int min_false_starts,
                       bool allow_adjustment) {
  QualityTargets t;
  t.target_solutions = {min, max};
  t.min_false_starts = min_false_starts;
  t.allow_adjustment = allow_adjustment;
  return t;
}

bool cell_codes_equal(const Grid &a, const Grid &b,
                      const std::vector<Position> &cells) {
  for (const auto &pos : cells) {
    if (a[static_cast<size_t>(pos.row)][static_cast<size_t>(pos.col)].code !=
        b[static_cast<size_t>(pos.row)][static_cast<size_t>(pos.col)].code)
      return false;
  }
  return true;
}

void in_range_puzzle_is_accepted(TestCheck &check) {
  RandomSource rng = make_random_source(1);
  const Puzzle puzzle = make_puzzle(one_route_grid(), 2, 2, kShortPath);
  const GateOutcome outcome =
      verify_solver_quality(puzzle, targets(1, 1, 2, true), kPool, rng);
  check.expect(outcome.reason == RejectReason::None, "should be accepted");
  if (check.expect(outcome.puzzle.has_value(), "puzzle returned")) {
    check.expect(cell_codes_equal(outcome.puzzle->grid(), puzzle.grid(),
                                  {{0, 1}, {1, 1}, {2, 2}}),
                 "accepted puzzle is unchanged");
  }
}

void unsolvable_puzzle_is_rejected(TestCheck &check) {
  RandomSource rng = make_random_source(2);
  const Grid grid = make_grid({{"FF", "FF", "FF"},
                               {"FF", "FF", "FF"},
                               {"FF", "FF", "FF"}});
  const GateOutcome outcome = verify_solver_quality(
      make_puzzle(grid, 3, 2, kShortPath), targets(1, 10, 0, true), kPool, rng);
  check.expect(!outcome.puzzle, "no puzzle");
  check.expect(outcome.reason == RejectReason::NotSolvable,
               std::string("reason ") + reject_reason_name(outcome.reason));
}

void missing_false_starts_are_rejected(TestCheck &check) {
  RandomSource rng = make_random_source(3);
  const Grid grid = make_grid({{"1C", "1C", "1C"},
                               {"BD", "BD", "BD"},
                               {"FF", "FF", "FF"}});
  const GateOutcome outcome = verify_solver_quality(
      make_puzzle(grid, 2, 2, kShortPath), targets(1, 10, 1, true), kPool, rng);
  check.expect(outcome.reason == RejectReason::TooFewFalseStarts,
               std::string("reason ") + reject_reason_name(outcome.reason));
}

void shorter_route_is_rejected(TestCheck &check) {
  RandomSource rng = make_random_source(4);
  // The canonical route detours through (2,0) although (1,0) is a BD.
  const Grid grid = make_grid({{"1C", "FF", "FF"},
                               {"BD", "FF", "FF"},
                               {"FF", "BD", "FF"}});
  const Puzzle puzzle =
      make_puzzle(grid, 3, 3, {{0, 0}, {2, 0}, {2, 1}});
  const GateOutcome outcome =
      verify_solver_quality(puzzle, targets(1, 10, 0, true), kPool, rng);
  check.expect(outcome.reason == RejectReason::ShortcutFound,
               std::string("reason ") + reject_reason_name(outcome.reason));
}

void out_of_range_without_adjustment(TestCheck &check) {
  RandomSource rng = make_random_source(5);
  const GateOutcome too_many =
      verify_solver_quality(make_puzzle(two_route_grid(), 2, 2, kShortPath),
                            targets(1, 1, 0, false), kPool, rng);
  check.expect(too_many.reason == RejectReason::TooManySolutions,
               std::string("reason ") + reject_reason_name(too_many.reason));

  const GateOutcome too_few =
      verify_solver_quality(make_puzzle(one_route_grid(), 2, 2, kShortPath),
                            targets(2, 5, 0, false), kPool, rng);
  check.expect(too_few.reason == RejectReason::TooFewSolutions,
               std::string("reason ") + reject_reason_name(too_few.reason));
}

void demotion_brings_count_into_range(TestCheck &check) {
  for (const auto seed : seed_corpus()) {
    RandomSource rng = make_random_source(seed);
    const Grid grid = two_route_grid();
    const auto adjusted =
        adjust_solution_count(grid, kShortPath, kTwoCodes, 2, {1, 1}, kPool,
                              rng);
    if (!check.expect(adjusted.has_value(), seed_label(seed) + " no result"))
      continue;
    check.expect(adjusted->result.solution_count() == 1,
                 seed_label(seed) + " expected one route");
    check.expect(adjusted->rounds == 1, seed_label(seed) + " one round");
    check.expect(cell_codes_equal(adjusted->grid, grid, kShortPath),
                 seed_label(seed) + " path cells changed");
    check.expect(adjusted->grid[0][1].code == "FF" &&
                     adjusted->grid[1][1].code == "FF",
                 seed_label(seed) + " second route should be demoted");
  }
}

void promotion_brings_count_into_range(TestCheck &check) {
  for (const auto seed : seed_corpus()) {
    RandomSource rng = make_random_source(seed);
    const Grid grid = one_route_grid();
    const SolutionRange target{3, 10};
    const auto adjusted = adjust_solution_count(grid, kShortPath, kTwoCodes, 3,
                                                target, kPool, rng);
    if (!check.expect(adjusted.has_value(), seed_label(seed) + " no result"))
      continue;
    check.expect(target.contains(adjusted->result.solution_count()),
                 seed_label(seed) + " count " +
                     std::to_string(adjusted->result.solution_count()));
    check.expect(adjusted->rounds >= 1, seed_label(seed) + " no rounds run");
    check.expect(cell_codes_equal(adjusted->grid, grid, kShortPath),
                 seed_label(seed) + " path cells changed");
  }
}

void supplied_solve_result_is_reused(TestCheck &check) {
  RandomSource rng = make_random_source(8);
  const SolveResult known = solve(two_route_grid(), kTwoCodes, 2, 2);
  const auto adjusted = adjust_solution_count(
      two_route_grid(), kShortPath, kTwoCodes, 2, {1, 1}, kPool, rng, &known);
  if (check.expect(adjusted.has_value(), "result expected")) {
    check.expect(adjusted->rounds == 1, "one demotion round");
    check.expect(adjusted->result.solution_count() == 1, "one route left");
  }

  // A result already in range ends the loop before any solve or rewrite.
  const SolveResult in_range = solve(one_route_grid(), kTwoCodes, 2, 2);
  const auto untouched = adjust_solution_count(
      two_route_grid(), kShortPath, kTwoCodes, 2, {1, 1}, kPool, rng,
      &in_range);
  if (check.expect(untouched.has_value(), "result expected")) {
    check.expect(untouched->rounds == 0, "no rounds");
    check.expect(untouched->result.solutions == in_range.solutions,
                 "supplied result returned");
    check.expect(untouched->grid[0][1].code == "1C", "grid untouched");
  }
}

void shortest_route_is_found(TestCheck &check) {
  // (1,0) is a BD, so the three-pick route through (2,0) is not the shortest.
  const Grid grid = make_grid({{"1C", "FF", "FF"},
                               {"BD", "FF", "FF"},
                               {"FF", "BD", "FF"}});
  const auto route = find_shorter_route(grid, kTwoCodes, 3);
  if (check.expect(route.has_value(), "two-pick route expected"))
    check.expect(*route == kShortPath, "route should be (0,0) then (1,0)");
  check.expect(!find_shorter_route(grid, kTwoCodes, 2),
               "nothing shorter than two picks");
  check.expect(!find_shorter_route(one_route_grid(), kTwoCodes, 2),
               "single route is already shortest");
}

void anchoring_moves_par_to_shortest_route(TestCheck &check) {
  const Grid grid = make_grid({{"1C", "FF", "FF"},
                               {"BD", "FF", "FF"},
                               {"FF", "BD", "FF"}});
  const Puzzle detour = make_puzzle(grid, 5, 3, {{0, 0}, {2, 0}, {2, 1}});
  const Puzzle anchored = anchor_to_shortest_route(detour, 1);
  check.expect(anchored.par() == 2, "par moves to 2");
  check.expect(anchored.solution_path() == kShortPath, "path follows route");
  check.expect(anchored.buffer_size() == 3, "buffer is par plus margin");
  check.expect(cell_codes_equal(anchored.grid(), grid,
                                {{0, 0}, {1, 0}, {2, 0}, {2, 1}}),
               "grid kept");

  const Puzzle exact = make_puzzle(one_route_grid(), 4, 2, kShortPath);
  const Puzzle kept = anchor_to_shortest_route(exact, 1);
  check.expect(kept.par() == 2 && kept.buffer_size() == 4 &&
                   kept.solution_path() == kShortPath,
               "exact puzzle unchanged");
}

void gate_accepts_adjusted_puzzle(TestCheck &check) {
  RandomSource rng = make_random_source(6);
  const Puzzle puzzle = make_puzzle(two_route_grid(), 2, 2, kShortPath);
  const GateOutcome outcome =
      verify_solver_quality(puzzle, targets(1, 1, 0, true), kPool, rng);
  check.expect(outcome.reason == RejectReason::None,
               std::string("reason ") + reject_reason_name(outcome.reason));
  if (check.expect(outcome.puzzle.has_value(), "puzzle returned")) {
    check.expect(outcome.puzzle->par() == 2, "par kept");
    check.expect(outcome.puzzle->solution_path() == kShortPath, "path kept");
    check.expect(outcome.puzzle->grid()[0][1].code == "FF",
                 "adjusted grid returned");
  }
}

void in_range_grid_needs_no_rounds(TestCheck &check) {
  RandomSource rng = make_random_source(7);
  const auto adjusted = adjust_solution_count(one_route_grid(), kShortPath,
                                              kTwoCodes, 2, {1, 3}, kPool, rng);
  if (check.expect(adjusted.has_value(), "result expected")) {
    check.expect(adjusted->rounds == 0, "no rounds needed");
    check.expect(adjusted->result.solution_count() == 1, "one route");
  }
}

void unreachable_range_fails(TestCheck &check) {
  for (const auto seed : seed_corpus()) {
    RandomSource rng = make_random_source(seed);
    const auto adjusted = adjust_solution_count(
        one_route_grid(), kShortPath, kTwoCodes, 3, {500, 1000}, kPool, rng);
    check.expect(!adjusted, seed_label(seed) + " 500 routes cannot exist");
  }
}

void adjustment_never_touches_path(TestCheck &check) {
  for (const auto seed : seed_corpus()) {
    RandomSource rng = make_random_source(seed);
    const Grid grid = make_grid({{"1C", "FF", "1C", "FF"},
                                 {"BD", "1C", "BD", "FF"},
                                 {"FF", "BD", "FF", "1C"},
                                 {"1C", "FF", "BD", "FF"}});
    const SolutionRange target{2, 3};
    const auto adjusted =
        adjust_solution_count(grid, kShortPath, kTwoCodes, 4, target, kPool,
                              rng);
    if (!adjusted)
      continue;
    check.expect(target.contains(adjusted->result.solution_count()),
                 seed_label(seed) + " count out of range");
    check.expect(cell_codes_equal(adjusted->grid, grid, kShortPath),
                 seed_label(seed) + " path cells changed");
  }
}

} // namespace

int main() {
  return run_suite(
      "QUALITY GATE",
      {
          {"in-range puzzle is accepted", in_range_puzzle_is_accepted},
          {"unsolvable puzzle is rejected", unsolvable_puzzle_is_rejected},
          {"missing false starts are rejected",
           missing_false_starts_are_rejected},
          {"shorter route is rejected", shorter_route_is_rejected},
          {"out of range without adjustment", out_of_range_without_adjustment},
          {"demotion brings count into range",
           demotion_brings_count_into_range},
          {"promotion brings count into range",
           promotion_brings_count_into_range},
          {"supplied solve result is reused", supplied_solve_result_is_reused},
          {"shortest route is found", shortest_route_is_found},
          {"anchoring moves par to shortest route",
           anchoring_moves_par_to_shortest_route},
          {"gate accepts adjusted puzzle", gate_accepts_adjusted_puzzle},
          {"in-range grid needs no rounds", in_range_grid_needs_no_rounds},
          {"unreachable range fails", unreachable_range_fails},
          {"adjustment never touches path", adjustment_never_touches_path},
      });
}
