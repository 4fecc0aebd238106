#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "grid_fill.h"
#include "puzzle_types.h"
#include "random_source.h"

enum class Difficulty { Easy, Medium, Hard, Expert };

inline constexpr int kMaxBufferSize = 8;

struct IntRange {
  int min = 0;
  int max = 0;
};

// Static description of a difficulty tier. Ranges are sampled afresh for
// every generation attempt.
struct DifficultyTier {
  Difficulty difficulty = Difficulty::Easy;
  int grid_size = 5;
  IntRange sequence_count;
  IntRange code_pool_size;
  IntRange buffer_margin;
  int min_sequence_length = 2;
  // Clamped to sequence_count - 1 after sampling.
  IntRange overlap_count;
  // Clamped to min_sequence_length - 1 after sampling.
  IntRange overlap_depth;
  SolutionRange target_solutions;
  int min_false_starts = 0;
  bool uses_quality_gate = false;
  FillMode fill_mode = FillMode::Forgiving;
  double fill_density = 0.0;
  int fallback_buffer_size = 7;
};

// Parameters fixed for one generation attempt.
struct DifficultyParams {
  Difficulty difficulty = Difficulty::Easy;
  int grid_size = 5;
  int sequence_count = 1;
  std::vector<int> sequence_lengths;
  int code_pool_size = 6;
  int buffer_margin = 0;
  bool uses_quality_gate = false;
  int max_solutions = 1;
  int min_false_starts = 0;
  int overlap_count = 0;
  int overlap_depth = 0;
  SolutionRange target_solutions;
  FillMode fill_mode = FillMode::Forgiving;
  double fill_density = 0.0;
};

const DifficultyTier &difficulty_tier(Difficulty difficulty);
const std::vector<Difficulty> &all_difficulties();

DifficultyParams sample_difficulty_params(const DifficultyTier &tier,
                                          RandomSource &rng);

FillStrategy fill_strategy_for(const DifficultyParams &params,
                               const std::vector<CodeList> &sequences);

const char *difficulty_name(Difficulty difficulty);
std::optional<Difficulty> parse_difficulty(std::string_view name);
