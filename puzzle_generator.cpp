#include "puzzle_generator.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include "grid_fill.h"
#include "path_placer.h"
#include "puzzle_validator.h"
#include "sequence_chain.h"

namespace {

std::string join_lengths(const std::vector<int> &lengths) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < lengths.size(); ++i) {
    if (i > 0)
      out << ",";
    out << lengths[i];
  }
  out << "]";
  return out.str();
}

AttemptResult rejected(RejectReason reason, int sequence_count) {
  AttemptResult result;
  result.reason = reason;
  result.sequence_count = sequence_count;
  return result;
}

} // namespace

AttemptResult try_generate(const DifficultyParams &params,
                           const CodeList &alphabet, RandomSource &rng,
                           bool debug) {
  const CodeList code_pool =
      select_code_pool(alphabet, params.code_pool_size, rng);

  OverlapConfig overlap;
  overlap.overlap_count = params.overlap_count;
  overlap.overlap_depth = params.overlap_depth;
  overlap.code_pool = code_pool;
  overlap.sequence_lengths = params.sequence_lengths;
  const SolutionChain chain = generate_overlapping_sequences(overlap, rng);
  if (chain.sequences.empty())
    return rejected(RejectReason::BuildFailed, params.sequence_count);

  auto placed =
      place_solution_path(chain.merged_path, params.grid_size, rng);
  if (!placed)
    return rejected(RejectReason::BuildFailed, params.sequence_count);

  const FillStrategy strategy = fill_strategy_for(params, chain.sequences);
  Grid grid = fill_grid_by_difficulty(placed->grid, placed->path, strategy,
                                      code_pool, rng);

  const int par = static_cast<int>(chain.merged_path.size());
  Puzzle puzzle(std::move(grid), make_target_sequences(chain.sequences),
                std::min(par + params.buffer_margin, kMaxBufferSize), par,
                params.difficulty, std::move(placed->path));
  if (!validate_puzzle(puzzle))
    return rejected(RejectReason::ValidationFailed, params.sequence_count);

  AttemptResult result;
  result.sequence_count = params.sequence_count;
  if (!params.uses_quality_gate) {
    // Ungated fills can leave a route shorter than the canonical path.
    Puzzle anchored = anchor_to_shortest_route(puzzle, params.buffer_margin);
    if (debug && anchored.par() != puzzle.par()) {
      std::cerr << "[generate] par " << puzzle.par() << " -> "
                << anchored.par() << " on shorter route\n";
    }
    if (!validate_puzzle(anchored))
      return rejected(RejectReason::ValidationFailed, params.sequence_count);
    result.puzzle = std::move(anchored);
    return result;
  }

  QualityTargets targets;
  targets.target_solutions = params.target_solutions;
  targets.min_false_starts = params.min_false_starts;
  GateOutcome outcome =
      verify_solver_quality(puzzle, targets, code_pool, rng, debug);
  result.puzzle = std::move(outcome.puzzle);
  result.reason = outcome.reason;
  return result;
}

Puzzle generate_fallback(int grid_size, int sequence_length, int buffer_size,
                         Difficulty difficulty, const CodeList &alphabet,
                         RandomSource &rng) {
  grid_size = std::max(grid_size, 1);
  // The staircase fits 2 * grid_size - 1 picks.
  sequence_length = std::clamp(sequence_length, 1, 2 * grid_size - 1);
  const CodeList &codes = alphabet.empty() ? available_codes() : alphabet;

  CodeList sequence;
  if (static_cast<int>(codes.size()) >= sequence_length) {
    sequence = codes;
    std::shuffle(sequence.begin(), sequence.end(), rng);
    sequence.resize(static_cast<size_t>(sequence_length));
  } else {
    sequence = random_codes(codes, sequence_length, rng);
  }

  const std::vector<CodeList> sequences{sequence};
  CodeList filler = codes_excluding(codes, unique_codes(sequences));
  if (filler.empty())
    filler = codes;
  Grid grid = fill_grid(grid_size, filler, rng);

  std::vector<Position> path;
  Position current{0, 0};
  for (int i = 0; i < sequence_length; ++i) {
    if (i > 0) {
      if (i % 2 == 1)
        ++current.row;
      else
        ++current.col;
    }
    grid[static_cast<size_t>(current.row)][static_cast<size_t>(current.col)]
        .code = sequence[static_cast<size_t>(i)];
    path.push_back(current);
  }

  return Puzzle(std::move(grid), make_target_sequences(sequences),
                std::max(buffer_size, sequence_length), sequence_length,
                difficulty, std::move(path));
}

Puzzle generate_with_retries(const GeneratorConfig &config,
                             GenerationStats *stats, const std::string &label,
                             const std::function<AttemptResult()> &attempt,
                             const std::function<Puzzle()> &fallback) {
  GenerationStats local_stats;
  GenerationStats &tracked = stats ? *stats : local_stats;

  const auto generate_start = std::chrono::steady_clock::now();
  auto log_duration = [&](const char *tag) {
    if (!config.debug)
      return;
    const auto end = std::chrono::steady_clock::now();
    const auto ms =
        std::chrono::duration<double, std::milli>(end - generate_start)
            .count();
    std::cerr << "[timer] " << label << " " << tag << " " << ms << " ms\n";
  };

  for (int i = 0; i < config.max_attempts; ++i) {
    AttemptResult result = attempt();
    ++tracked.attempts;
    ++tracked.sequence_count_rolls[result.sequence_count];

    if (result.puzzle) {
      if (config.debug) {
        const Puzzle &puzzle = *result.puzzle;
        std::cerr << "[generate] " << label << " accepted attempts="
                  << tracked.attempts
                  << " seqCount=" << puzzle.sequences().size()
                  << " par=" << puzzle.par()
                  << " buffer=" << puzzle.buffer_size() << "\n";
      }
      log_duration("accepted");
      return std::move(*result.puzzle);
    }
    ++tracked.reject_counts[reject_reason_name(result.reason)];
  }

  tracked.used_fallback = true;
  if (config.debug) {
    std::cerr << "[generate] " << label << " fallback attempts="
              << tracked.attempts << " rejects=" << summarize_rejects(tracked)
              << "\n";
  }
  log_duration("fallback");
  return fallback();
}

Puzzle generate_puzzle(const DifficultyTier &tier, RandomSource &rng,
                       const GeneratorConfig &config, GenerationStats *stats) {
  const std::string label = difficulty_name(tier.difficulty);
  return generate_with_retries(
      config, stats, label,
      [&]() {
        const DifficultyParams params = sample_difficulty_params(tier, rng);
        if (config.debug) {
          std::cerr << "[generate] " << label
                    << " seqCount=" << params.sequence_count
                    << " seqLens=" << join_lengths(params.sequence_lengths)
                    << " overlap=" << params.overlap_count << "x"
                    << params.overlap_depth
                    << " pool=" << params.code_pool_size
                    << " fill=" << fill_mode_name(params.fill_mode) << "\n";
        }
        return try_generate(params, config.alphabet, rng, config.debug);
      },
      [&]() {
        return generate_fallback(tier.grid_size, kFallbackSequenceLength,
                                 tier.fallback_buffer_size, tier.difficulty,
                                 config.alphabet, rng);
      });
}

Puzzle generate_puzzle(Difficulty difficulty, RandomSource &rng,
                       const GeneratorConfig &config, GenerationStats *stats) {
  return generate_puzzle(difficulty_tier(difficulty), rng, config, stats);
}

std::string summarize_rejects(const GenerationStats &stats) {
  std::vector<std::pair<std::string, int>> entries(stats.reject_counts.begin(),
                                                   stats.reject_counts.end());
  std::stable_sort(entries.begin(), entries.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  std::ostringstream out;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (i > 0)
      out << " ";
    out << entries[i].first << "=" << entries[i].second;
  }
  return out.str();
}
