#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "code_pool.h"
#include "difficulty.h"
#include "puzzle.h"
#include "quality_gate.h"
#include "random_source.h"

inline constexpr int kMaxGenerationAttempts = 20;
inline constexpr int kFallbackSequenceLength = 3;

struct GeneratorConfig {
  CodeList alphabet = available_codes();
  int max_attempts = kMaxGenerationAttempts;
  // Tagged diagnostics on std::cerr.
  bool debug = false;
};

// Diagnostics only; generation never depends on them.
struct GenerationStats {
  int attempts = 0;
  bool used_fallback = false;
  std::map<std::string, int> reject_counts;
  std::map<int, int> sequence_count_rolls;
};

struct AttemptResult {
  std::optional<Puzzle> puzzle;
  RejectReason reason = RejectReason::None;
  int sequence_count = 0;
};

// One pass of the pipeline for fixed parameters: code pool, sequence chain,
// path placement, fill, validation and, for gated tiers, the solver gate.
AttemptResult try_generate(const DifficultyParams &params,
                           const CodeList &alphabet, RandomSource &rng,
                           bool debug = false);

// Single sequence of distinct codes on the staircase (0,0) (1,0) (1,1) ...;
// every other cell holds a code outside the sequence when the alphabet has
// one. Cannot fail.
Puzzle generate_fallback(int grid_size, int sequence_length, int buffer_size,
                         Difficulty difficulty, const CodeList &alphabet,
                         RandomSource &rng);

// Runs `attempt` up to `config.max_attempts` times and returns the first
// puzzle it produces, otherwise `fallback()`.
Puzzle generate_with_retries(const GeneratorConfig &config,
                             GenerationStats *stats, const std::string &label,
                             const std::function<AttemptResult()> &attempt,
                             const std::function<Puzzle()> &fallback);

Puzzle generate_puzzle(const DifficultyTier &tier, RandomSource &rng,
                       const GeneratorConfig &config = {},
                       GenerationStats *stats = nullptr);
Puzzle generate_puzzle(Difficulty difficulty, RandomSource &rng,
                       const GeneratorConfig &config = {},
                       GenerationStats *stats = nullptr);

// "key=count" pairs, most frequent first.
std::string summarize_rejects(const GenerationStats &stats);
