#include "stage_generator.h"

#include <algorithm>
#include <iostream>
#include <string>

#include "code_pool.h"
#include "grid_fill.h"
#include "path_placer.h"
#include "puzzle_validator.h"
#include "sequence_chain.h"

namespace {

// Stage puzzles carry the medium tag; their difficulty comes from the stage.
constexpr Difficulty kStageDifficulty = Difficulty::Medium;
constexpr int kStageBufferMargin = 2;

SolutionChain build_stage_chain(const StageConfig &stage,
                                const CodeList &code_pool, RandomSource &rng) {
  const int count = stage.sequence_count;
  OverlapConfig config;
  config.code_pool = code_pool;

  if (count <= 1) {
    config.sequence_lengths = {random_int(rng, 3, 4)};
    return generate_overlapping_sequences(config, rng);
  }

  config.overlap_count = count >= 3 ? std::min(2, count - 1) : 1;
  config.overlap_depth = count >= 3 ? 2 : 1;
  const int merged_length = random_int(rng, 5, 6);
  config.sequence_lengths =
      random_lengths(merged_length, count, config.overlap_depth, rng);
  return generate_overlapping_sequences(config, rng);
}

Grid layer_special_cells(const Grid &grid, const std::vector<Position> &path,
                         const StageConfig &stage, RandomSource &rng) {
  Grid result = place_blockers(
      grid, path,
      random_int(rng, stage.blocker_count.min, stage.blocker_count.max), rng);
  result = place_wildcards(result, path, stage.wildcard_chance, rng);
  return place_decay_cells(result, path, stage.decay_cell_count, rng);
}

} // namespace

StageConfig stage_for_grid_number(int grid_number) {
  StageConfig stage;
  if (grid_number <= 2) {
    stage.grid_size = 4;
    stage.sequence_count = 2;
    stage.blocker_count = {0, 0};
    stage.code_pool_size = 6;
    stage.max_solutions = 100;
    stage.min_false_starts = 0;
  } else if (grid_number <= 4) {
    stage.grid_size = 5;
    stage.sequence_count = 2;
    stage.blocker_count = {2, 3};
    stage.code_pool_size = 5;
    stage.max_solutions = 20;
    stage.min_false_starts = 0;
  } else if (grid_number <= 6) {
    stage.grid_size = 5;
    stage.sequence_count = 3;
    stage.blocker_count = {4, 5};
    stage.wildcard_chance = 0.1;
    stage.code_pool_size = 5;
    stage.max_solutions = 8;
    stage.min_false_starts = 1;
  } else {
    stage.grid_size = 6;
    stage.sequence_count = 3;
    stage.blocker_count = {6, 8};
    stage.decay_cell_count = 2;
    stage.wildcard_chance = 0.15;
    stage.code_pool_size = 4;
    stage.max_solutions = 5;
    stage.min_false_starts = 1;
  }
  return stage;
}

int stage_buffer_size(const StageConfig &stage) {
  switch (stage.grid_size) {
  case 4:
    return 6;
  case 5:
    return 7;
  case 6:
    return 8;
  default:
    return 7;
  }
}

FillStrategy fill_strategy_for_stage(const StageConfig &stage,
                                     const std::vector<CodeList> &sequences) {
  if (stage.max_solutions >= kStageSolverSkipCap)
    return FillStrategy::forgiving(0.5);
  if (stage.max_solutions >= 8)
    return FillStrategy::moderate(0.15);
  return FillStrategy::deceptive(0.3, sequences);
}

AttemptResult try_generate_stage(const StageConfig &stage,
                                 const CodeList &alphabet, RandomSource &rng,
                                 bool debug) {
  AttemptResult result;
  result.sequence_count = stage.sequence_count;

  const CodeList code_pool =
      select_code_pool(alphabet, stage.code_pool_size, rng);
  const SolutionChain chain = build_stage_chain(stage, code_pool, rng);
  if (chain.sequences.empty()) {
    result.reason = RejectReason::BuildFailed;
    return result;
  }

  auto placed = place_solution_path(chain.merged_path, stage.grid_size, rng);
  if (!placed) {
    result.reason = RejectReason::BuildFailed;
    return result;
  }

  Grid grid = fill_grid_by_difficulty(
      placed->grid, placed->path,
      fill_strategy_for_stage(stage, chain.sequences), code_pool, rng);
  grid = layer_special_cells(grid, placed->path, stage, rng);

  const int par = static_cast<int>(chain.merged_path.size());
  Puzzle puzzle(std::move(grid), make_target_sequences(chain.sequences),
                std::min(par + kStageBufferMargin, kMaxBufferSize), par, kStageDifficulty,
                std::move(placed->path));
  if (!validate_puzzle(puzzle, true)) {
    result.reason = RejectReason::ValidationFailed;
    return result;
  }

  if (stage.max_solutions >= kStageSolverSkipCap) {
    Puzzle anchored = anchor_to_shortest_route(puzzle, kStageBufferMargin);
    if (debug && anchored.par() != puzzle.par()) {
      std::cerr << "[generate] stage par " << puzzle.par() << " -> "
                << anchored.par() << " on shorter route\n";
    }
    if (!validate_puzzle(anchored, true)) {
      result.reason = RejectReason::ValidationFailed;
      return result;
    }
    result.puzzle = std::move(anchored);
    return result;
  }

  QualityTargets targets;
  targets.target_solutions = {1, stage.max_solutions};
  targets.min_false_starts = stage.min_false_starts;
  targets.allow_adjustment = false;
  GateOutcome outcome =
      verify_solver_quality(puzzle, targets, code_pool, rng, debug);
  result.puzzle = std::move(outcome.puzzle);
  result.reason = outcome.reason;
  return result;
}

Puzzle generate_stage_puzzle(const StageConfig &stage, RandomSource &rng,
                             const GeneratorConfig &config,
                             GenerationStats *stats) {
  const std::string label = "stage" + std::to_string(stage.grid_size) + "x" +
                            std::to_string(stage.grid_size);
  return generate_with_retries(
      config, stats, label,
      [&]() {
        return try_generate_stage(stage, config.alphabet, rng, config.debug);
      },
      [&]() {
        return generate_fallback(stage.grid_size, kFallbackSequenceLength,
                                 stage_buffer_size(stage), kStageDifficulty,
                                 config.alphabet, rng);
      });
}
