#include "difficulty.h"

#include <algorithm>
#include <array>
#include <cctype>

#include "sequence_chain.h"

namespace {

std::array<DifficultyTier, 4> build_tiers() {
  std::array<DifficultyTier, 4> tiers{};

  DifficultyTier &easy = tiers[static_cast<size_t>(Difficulty::Easy)];
  easy.difficulty = Difficulty::Easy;
  easy.grid_size = 5;
  easy.sequence_count = {1, 2};
  easy.code_pool_size = {6, 6};
  easy.buffer_margin = {3, 3};
  easy.min_sequence_length = 2;
  easy.overlap_count = {1, 1};
  easy.overlap_depth = {1, 1};
  easy.target_solutions = {2, 100};
  easy.min_false_starts = 0;
  easy.uses_quality_gate = false;
  easy.fill_mode = FillMode::Forgiving;
  easy.fill_density = 0.5;
  easy.fallback_buffer_size = 7;

  DifficultyTier &medium = tiers[static_cast<size_t>(Difficulty::Medium)];
  medium.difficulty = Difficulty::Medium;
  medium.grid_size = 5;
  medium.sequence_count = {1, 2};
  medium.code_pool_size = {5, 5};
  medium.buffer_margin = {2, 2};
  medium.min_sequence_length = 2;
  medium.overlap_count = {0, 1};
  medium.overlap_depth = {1, 1};
  medium.target_solutions = {1, 50};
  medium.min_false_starts = 0;
  medium.uses_quality_gate = false;
  medium.fill_mode = FillMode::Moderate;
  medium.fill_density = 0.15;
  medium.fallback_buffer_size = 7;

  DifficultyTier &hard = tiers[static_cast<size_t>(Difficulty::Hard)];
  hard.difficulty = Difficulty::Hard;
  hard.grid_size = 5;
  hard.sequence_count = {2, 3};
  hard.code_pool_size = {4, 5};
  hard.buffer_margin = {1, 1};
  hard.min_sequence_length = 3;
  hard.overlap_count = {1, 2};
  hard.overlap_depth = {1, 2};
  hard.target_solutions = {1, 25};
  hard.min_false_starts = 0;
  hard.uses_quality_gate = false;
  hard.fill_mode = FillMode::Deceptive;
  hard.fill_density = 0.3;
  hard.fallback_buffer_size = 8;

  DifficultyTier &expert = tiers[static_cast<size_t>(Difficulty::Expert)];
  expert.difficulty = Difficulty::Expert;
  expert.grid_size = 6;
  expert.sequence_count = {2, 4};
  expert.code_pool_size = {4, 4};
  expert.buffer_margin = {0, 1};
  expert.min_sequence_length = 3;
  expert.overlap_count = {2, 3};
  expert.overlap_depth = {1, 2};
  expert.target_solutions = {1, 10};
  expert.min_false_starts = 1;
  expert.uses_quality_gate = true;
  expert.fill_mode = FillMode::Deceptive;
  expert.fill_density = 0.4;
  expert.fallback_buffer_size = 8;

  return tiers;
}

int sample(const IntRange &range, RandomSource &rng) {
  return random_int(rng, range.min, range.max);
}

} // namespace

const DifficultyTier &difficulty_tier(Difficulty difficulty) {
  static const std::array<DifficultyTier, 4> tiers = build_tiers();
  return tiers[static_cast<size_t>(difficulty)];
}

const std::vector<Difficulty> &all_difficulties() {
  static const std::vector<Difficulty> difficulties = {
      Difficulty::Easy, Difficulty::Medium, Difficulty::Hard,
      Difficulty::Expert};
  return difficulties;
}

DifficultyParams sample_difficulty_params(const DifficultyTier &tier,
                                          RandomSource &rng) {
  DifficultyParams params;
  params.difficulty = tier.difficulty;
  params.grid_size = tier.grid_size;
  params.sequence_count = std::max(1, sample(tier.sequence_count, rng));
  params.code_pool_size = sample(tier.code_pool_size, rng);
  params.buffer_margin = sample(tier.buffer_margin, rng);
  params.uses_quality_gate = tier.uses_quality_gate;
  params.target_solutions = tier.target_solutions;
  params.max_solutions = tier.target_solutions.max;
  params.min_false_starts = tier.min_false_starts;
  params.fill_mode = tier.fill_mode;
  params.fill_density = tier.fill_density;

  // Overlap is picked first because it widens the length budget.
  const int junctions = params.sequence_count - 1;
  params.overlap_count =
      std::clamp(sample(tier.overlap_count, rng), 0, junctions);
  params.overlap_depth = std::clamp(sample(tier.overlap_depth, rng), 0,
                                    std::max(0, tier.min_sequence_length - 1));

  const int max_total =
      kMaxBufferSize + params.overlap_count * params.overlap_depth;
  params.sequence_lengths =
      random_sequence_lengths(params.sequence_count, tier.min_sequence_length,
                              max_total, rng);
  return params;
}

FillStrategy fill_strategy_for(const DifficultyParams &params,
                               const std::vector<CodeList> &sequences) {
  switch (params.fill_mode) {
  case FillMode::Forgiving:
    return FillStrategy::forgiving(params.fill_density);
  case FillMode::Moderate:
    return FillStrategy::moderate(params.fill_density);
  case FillMode::Deceptive:
    return FillStrategy::deceptive(params.fill_density, sequences);
  }
  return FillStrategy::forgiving(params.fill_density);
}

const char *difficulty_name(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Easy:
    return "easy";
  case Difficulty::Medium:
    return "medium";
  case Difficulty::Hard:
    return "hard";
  case Difficulty::Expert:
    return "expert";
  }
  return "unknown";
}

std::optional<Difficulty> parse_difficulty(std::string_view name) {
  std::string normalized(name);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  for (const auto difficulty : all_difficulties()) {
    if (normalized == difficulty_name(difficulty))
      return difficulty;
  }
  return std::nullopt;
}
