#pragma once

#include <optional>
#include <vector>

#include "puzzle.h"
#include "puzzle_solver.h"
#include "puzzle_types.h"
#include "random_source.h"

inline constexpr int kMaxAdjustRounds = 3;
inline constexpr int kAdjustCellsPerRound = 3;

enum class RejectReason {
  None,
  BuildFailed,
  ValidationFailed,
  NotSolvable,
  TooFewFalseStarts,
  ShortcutFound,
  TooManySolutions,
  TooFewSolutions,
  AdjustmentFailed,
};

const char *reject_reason_name(RejectReason reason);

struct QualityTargets {
  SolutionRange target_solutions;
  int min_false_starts = 0;
  // Stage puzzles are rejected outright instead of being nudged.
  bool allow_adjustment = true;
};

struct AdjustmentResult {
  Grid grid;
  SolveResult result;
  int rounds = 0;
};

// Shortest route strictly shorter than `par`, found by raising the buffer
// one pick at a time. std::nullopt when no route shorter than `par` exists.
std::optional<std::vector<Position>>
find_shorter_route(const Grid &grid, const std::vector<CodeList> &sequences,
                   int par);

// Copy of `puzzle` whose solution path and par follow the shortest route on
// its grid, with the buffer re-derived as par + buffer_margin. Returns the
// puzzle unchanged when its par is already the shortest.
Puzzle anchor_to_shortest_route(const Puzzle &puzzle, int buffer_margin);

// Solves `grid` (or takes `initial_result`, which must come from solving it
// with a cap of target.max + 1) and, while the solution count is outside
// `target`, promotes (too few) or demotes (too many) up to
// kAdjustCellsPerRound non-path cells to or from sequence codes, for at most
// kMaxAdjustRounds rounds. Cells on `solution_path` are never modified. Returns std::nullopt
// when the count is still out of range or no cell can be changed.
std::optional<AdjustmentResult>
adjust_solution_count(const Grid &grid,
                      const std::vector<Position> &solution_path,
                      const std::vector<CodeList> &sequences, int buffer_size,
                      const SolutionRange &target, const CodeList &code_pool,
                      RandomSource &rng,
                      const SolveResult *initial_result = nullptr);

struct GateOutcome {
  std::optional<Puzzle> puzzle;
  RejectReason reason = RejectReason::None;
};

GateOutcome verify_solver_quality(const Puzzle &puzzle,
                                  const QualityTargets &targets,
                                  const CodeList &code_pool, RandomSource &rng,
                                  bool debug = false);
