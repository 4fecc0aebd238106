#pragma once

#include "difficulty.h"
#include "puzzle.h"
#include "puzzle_generator.h"
#include "random_source.h"

// Parameters of one stage of the endless run mode, keyed by grid number.
struct StageConfig {
  int grid_size = 4;
  int sequence_count = 2;
  IntRange blocker_count;
  int decay_cell_count = 0;
  double wildcard_chance = 0.0;
  int code_pool_size = 6;
  int max_solutions = 100;
  int min_false_starts = 0;
};

// Stages at or above this cap accept the first valid build without solving.
inline constexpr int kStageSolverSkipCap = 100;

StageConfig stage_for_grid_number(int grid_number);

// Buffer of the stage fallback puzzle, by grid size. Generated stage puzzles
// use min(par + 2, kMaxBufferSize).
int stage_buffer_size(const StageConfig &stage);

FillStrategy fill_strategy_for_stage(const StageConfig &stage,
                                     const std::vector<CodeList> &sequences);

AttemptResult try_generate_stage(const StageConfig &stage,
                                 const CodeList &alphabet, RandomSource &rng,
                                 bool debug = false);

Puzzle generate_stage_puzzle(const StageConfig &stage, RandomSource &rng,
                             const GeneratorConfig &config = {},
                             GenerationStats *stats = nullptr);
