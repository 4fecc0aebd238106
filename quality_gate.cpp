#include "quality_gate.h"

#include <algorithm>
#include <iostream>
#include <unordered_set>
#include <utility>

#include "code_pool.h"
#include "puzzle_validator.h"

namespace {

using PositionSet = std::unordered_set<Position, PositionHash>;

Cell &cell_at(Grid &grid, const Position &pos) {
  return grid[static_cast<size_t>(pos.row)][static_cast<size_t>(pos.col)];
}

// Off-path, selectable cells for which `wanted` holds, in row-major order.
template <typename Predicate>
std::vector<Position> adjustable_cells(const Grid &grid,
                                       const PositionSet &on_path,
                                       Predicate wanted) {
  std::vector<Position> cells;
  for (const auto &row : grid) {
    for (const auto &cell : row) {
      if (on_path.count(cell.position()) || cell.blocked())
        continue;
      if (wanted(cell))
        cells.push_back(cell.position());
    }
  }
  return cells;
}

bool rewrite_cells(Grid &grid, std::vector<Position> cells,
                   const CodeList &replacements, RandomSource &rng) {
  if (cells.empty() || replacements.empty())
    return false;
  std::shuffle(cells.begin(), cells.end(), rng);
  const size_t limit =
      std::min(cells.size(), static_cast<size_t>(kAdjustCellsPerRound));
  for (size_t i = 0; i < limit; ++i) {
    cell_at(grid, cells[i]).code = random_element(rng, replacements);
  }
  return true;
}

// Gives filler cells sequence codes, opening alternate routes.
bool promote_cells(Grid &grid, const PositionSet &on_path,
                   const CodeList &sequence_codes, RandomSource &rng) {
  const auto cells =
      adjustable_cells(grid, on_path, [&](const Cell &cell) {
        return !cell.wildcard() && !contains_code(sequence_codes, cell.code);
      });
  return rewrite_cells(grid, cells, sequence_codes, rng);
}

// Swaps sequence codes on filler cells for codes no sequence needs.
bool demote_cells(Grid &grid, const PositionSet &on_path,
                  const CodeList &sequence_codes, const CodeList &code_pool,
                  RandomSource &rng) {
  const auto cells =
      adjustable_cells(grid, on_path, [&](const Cell &cell) {
        return !cell.wildcard() && contains_code(sequence_codes, cell.code);
      });
  return rewrite_cells(grid, cells, codes_excluding(code_pool, sequence_codes),
                       rng);
}

GateOutcome reject(RejectReason reason, bool debug) {
  if (debug) {
    std::cerr << "[gate] rejected: " << reject_reason_name(reason) << "\n";
  }
  return GateOutcome{std::nullopt, reason};
}

} // namespace

const char *reject_reason_name(RejectReason reason) {
  switch (reason) {
  case RejectReason::None:
    return "none";
  case RejectReason::BuildFailed:
    return "build";
  case RejectReason::ValidationFailed:
    return "validation";
  case RejectReason::NotSolvable:
    return "unsolvable";
  case RejectReason::TooFewFalseStarts:
    return "falseStarts";
  case RejectReason::ShortcutFound:
    return "shortcut";
  case RejectReason::TooManySolutions:
    return "tooManySolutions";
  case RejectReason::TooFewSolutions:
    return "tooFewSolutions";
  case RejectReason::AdjustmentFailed:
    return "adjustment";
  }
  return "unknown";
}

std::optional<std::vector<Position>>
find_shorter_route(const Grid &grid, const std::vector<CodeList> &sequences,
                   int par) {
  // Every pick advances a sequence by at most one code.
  size_t longest = 0;
  for (const auto &sequence : sequences)
    longest = std::max(longest, sequence.size());

  for (int length = std::max(static_cast<int>(longest), 1); length < par;
       ++length) {
    SolveResult result = solve(grid, sequences, length, 1);
    if (result.solvable())
      return std::move(result.solutions.front());
  }
  return std::nullopt;
}

Puzzle anchor_to_shortest_route(const Puzzle &puzzle, int buffer_margin) {
  auto route =
      find_shorter_route(puzzle.grid(), puzzle.sequence_codes(), puzzle.par());
  if (!route)
    return puzzle;
  const int par = static_cast<int>(route->size());
  return Puzzle(puzzle.grid(), puzzle.sequences(),
                std::min(par + buffer_margin, kMaxBufferSize), par,
                puzzle.difficulty(), std::move(*route));
}

std::optional<AdjustmentResult>
adjust_solution_count(const Grid &grid,
                      const std::vector<Position> &solution_path,
                      const std::vector<CodeList> &sequences, int buffer_size,
                      const SolutionRange &target, const CodeList &code_pool,
                      RandomSource &rng, const SolveResult *initial_result) {
  const PositionSet on_path(solution_path.begin(), solution_path.end());
  const CodeList sequence_codes = unique_codes(sequences);
  // One past the cap tells "too many" apart from "exactly at the limit".
  const int cap = target.max + 1;

  AdjustmentResult adjusted;
  adjusted.grid = grid;
  adjusted.result = initial_result
                        ? *initial_result
                        : solve(adjusted.grid, sequences, buffer_size, cap);

  for (int round = 0;; ++round) {
    const int count = adjusted.result.solution_count();
    if (target.contains(count)) {
      adjusted.rounds = round;
      return adjusted;
    }
    if (round == kMaxAdjustRounds)
      return std::nullopt;

    const bool changed =
        count < target.min
            ? promote_cells(adjusted.grid, on_path, sequence_codes, rng)
            : demote_cells(adjusted.grid, on_path, sequence_codes, code_pool,
                           rng);
    if (!changed)
      return std::nullopt;
    adjusted.result = solve(adjusted.grid, sequences, buffer_size, cap);
  }
}

GateOutcome verify_solver_quality(const Puzzle &puzzle,
                                  const QualityTargets &targets,
                                  const CodeList &code_pool, RandomSource &rng,
                                  bool debug) {
  const std::vector<CodeList> sequences = puzzle.sequence_codes();
  const SolveResult result =
      solve(puzzle.grid(), sequences, puzzle.buffer_size(),
            targets.target_solutions.max + 1);

  if (!result.solvable())
    return reject(RejectReason::NotSolvable, debug);
  if (result.false_starts < targets.min_false_starts)
    return reject(RejectReason::TooFewFalseStarts, debug);
  if (result.par() < puzzle.par())
    return reject(RejectReason::ShortcutFound, debug);

  const int count = result.solution_count();
  if (targets.target_solutions.contains(count)) {
    if (debug) {
      std::cerr << "[gate] accepted: solutions=" << count
                << " falseStarts=" << result.false_starts << "\n";
    }
    return GateOutcome{puzzle, RejectReason::None};
  }
  if (!targets.allow_adjustment) {
    return reject(count > targets.target_solutions.max
                      ? RejectReason::TooManySolutions
                      : RejectReason::TooFewSolutions,
                  debug);
  }

  auto adjusted = adjust_solution_count(
      puzzle.grid(), puzzle.solution_path(), sequences, puzzle.buffer_size(),
      targets.target_solutions, code_pool, rng, &result);
  if (!adjusted)
    return reject(RejectReason::AdjustmentFailed, debug);
  if (adjusted->result.false_starts < targets.min_false_starts)
    return reject(RejectReason::TooFewFalseStarts, debug);
  if (adjusted->result.par() < puzzle.par())
    return reject(RejectReason::ShortcutFound, debug);

  Puzzle adjusted_puzzle(std::move(adjusted->grid), puzzle.sequences(),
                         puzzle.buffer_size(), puzzle.par(),
                         puzzle.difficulty(), puzzle.solution_path());
  if (!validate_puzzle(adjusted_puzzle))
    return reject(RejectReason::ValidationFailed, debug);

  if (debug) {
    std::cerr << "[gate] accepted after " << adjusted->rounds
              << " adjustment round(s): solutions="
              << adjusted->result.solution_count()
              << " falseStarts=" << adjusted->result.false_starts << "\n";
  }
  return GateOutcome{std::move(adjusted_puzzle), RejectReason::None};
}
