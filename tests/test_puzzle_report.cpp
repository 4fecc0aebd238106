#include <sstream>

#include "puzzle.h"
#include "puzzle_report.h"
#include "puzzle_solver.h"
#include "test_harness.h"

using namespace breach_tests;

namespace {

Puzzle sample_puzzle() {
  Grid grid = make_grid({{"1C", "FF", "FF"},
                         {"BD", "55", "FF"},
                         {"FF", "FF", "FF"}});
  grid[2][2].kind = CellKind::Blocker;
  grid[2][2].code = "XX";
  grid[0][2].kind = CellKind::Wildcard;
  return Puzzle(std::move(grid), make_target_sequences({{"1C", "BD", "55"}}),
                4, 3, Difficulty::Hard, {{0, 0}, {1, 0}, {1, 1}});
}

bool contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}

void text_report_marks_path(TestCheck &check) {
  std::ostringstream out;
  print_puzzle(out, sample_puzzle(), true);
  const std::string text = out.str();
  check.expect(contains(text, "Difficulty: hard"), "difficulty line");
  check.expect(contains(text, "Buffer: 4  Par: 3"), "buffer and par");
  check.expect(contains(text, "[1C]"), "path cell bracketed");
  check.expect(contains(text, " ?? "), "wildcard display");
  check.expect(contains(text, " XX "), "blocker display");
  check.expect(contains(text, "1C -> BD -> 55"), "sequence line");
  check.expect(contains(text, "Solution: (0,0) (1,0) (1,1)"), "solution line");

  std::ostringstream hidden;
  print_puzzle(hidden, sample_puzzle(), false);
  check.expect(!contains(hidden.str(), "["), "no brackets without solution");
}

void json_report_has_fields(TestCheck &check) {
  const Puzzle puzzle = sample_puzzle();
  const SolveResult result =
      solve(puzzle.grid(), puzzle.sequence_codes(), puzzle.buffer_size());
  std::ostringstream out;
  write_puzzle_json(out, puzzle, &result);
  const std::string json = out.str();
  check.expect(contains(json, "\"difficulty\":\"hard\""), "difficulty");
  check.expect(contains(json, "\"gridSize\":3"), "grid size");
  check.expect(contains(json, "\"par\":3"), "par");
  check.expect(contains(json, "\"kind\":\"blocker\""), "blocker kind");
  check.expect(contains(json, "\"kind\":\"wildcard\""), "wildcard kind");
  check.expect(contains(json, "\"sequences\":[[\"1C\",\"BD\",\"55\"]]"),
               "sequences");
  check.expect(contains(json, "\"solutionPath\":[[0,0],[1,0],[1,1]]"),
               "solution path");
  check.expect(contains(json, "\"solver\":{\"solvable\":true"), "solver");

  std::ostringstream bare;
  write_puzzle_json(bare, puzzle, nullptr);
  check.expect(!contains(bare.str(), "solver"), "no solver block");
}

void stats_report_lists_rejects(TestCheck &check) {
  GenerationStats stats;
  stats.attempts = 20;
  stats.used_fallback = true;
  stats.reject_counts["unsolvable"] = 20;
  stats.sequence_count_rolls[2] = 20;
  std::ostringstream out;
  print_generation_stats(out, stats);
  const std::string text = out.str();
  check.expect(contains(text, "Attempts: 20 (fallback)"), "attempts line");
  check.expect(contains(text, "Rejects: unsolvable=20"), "rejects line");
  check.expect(contains(text, "2seq=20"), "sequence rolls");
}

} // namespace

int main() {
  return run_suite(
      "PUZZLE REPORT",
      {
          {"text report marks path", text_report_marks_path},
          {"json report has fields", json_report_has_fields},
          {"stats report lists rejects", stats_report_lists_rejects},
      });
}
