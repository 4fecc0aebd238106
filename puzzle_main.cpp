#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "difficulty.h"
#include "puzzle_generator.h"
#include "puzzle_report.h"
#include "puzzle_solver.h"
#include "puzzle_validator.h"
#include "random_source.h"
#include "stage_generator.h"

namespace {

void print_usage(const char *prog_name) {
  std::cout
      << "Usage:\n"
      << "  " << prog_name
      << " generate <easy|medium|hard|expert> [--seed N] [--count N]\n"
      << "  " << prog_name << " stage <grid-number> [--seed N] [--count N]\n"
      << "  " << prog_name << " bench <difficulty> [--seed N] [--count N]\n"
      << "  " << prog_name << " help\n\n"
      << "Flags:\n"
      << "  --seed N      Seed for the random source (default: clock).\n"
      << "  --count N     Number of puzzles to generate (default: 1, bench "
         "100).\n"
      << "  --debug       Tagged generation diagnostics on stderr.\n"
      << "  --dump-json   Emit one JSON object per puzzle instead of text.\n"
      << "  --help        Show this summary.\n";
}

template <typename T> std::optional<T> parse_number(std::string_view text) {
  T value{};
  const char *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end)
    return std::nullopt;
  return value;
}

void emit_puzzle(const Puzzle &puzzle, bool dump_json,
                 const GenerationStats &stats, bool debug) {
  if (dump_json) {
    const SolveResult result =
        solve(puzzle.grid(), puzzle.sequence_codes(), puzzle.buffer_size());
    write_puzzle_json(std::cout, puzzle, &result);
    return;
  }
  print_puzzle(std::cout, puzzle, true);
  if (debug)
    print_generation_stats(std::cout, stats);
  std::cout << "\n";
}

// Generates `count` puzzles and reports attempts, fallbacks, rejects and
// timing. Every puzzle is re-validated.
int run_bench(const DifficultyTier &tier, int count, RandomSource &rng,
              const GeneratorConfig &config) {
  GenerationStats totals;
  int fallbacks = 0;
  int invalid = 0;
  double slowest_ms = 0.0;

  const auto bench_start = std::chrono::steady_clock::now();
  for (int i = 0; i < count; ++i) {
    GenerationStats stats;
    const auto start = std::chrono::steady_clock::now();
    const Puzzle puzzle = generate_puzzle(tier, rng, config, &stats);
    const auto end = std::chrono::steady_clock::now();
    slowest_ms = std::max(
        slowest_ms,
        std::chrono::duration<double, std::milli>(end - start).count());

    if (!validate_puzzle(puzzle))
      ++invalid;
    if (stats.used_fallback)
      ++fallbacks;
    totals.attempts += stats.attempts;
    for (const auto &entry : stats.reject_counts)
      totals.reject_counts[entry.first] += entry.second;
    for (const auto &entry : stats.sequence_count_rolls)
      totals.sequence_count_rolls[entry.first] += entry.second;
  }
  const std::chrono::duration<double, std::milli> elapsed =
      std::chrono::steady_clock::now() - bench_start;

  std::cout << "Difficulty: " << difficulty_name(tier.difficulty)
            << "\nPuzzles: " << count << "\nFallbacks: " << fallbacks
            << "\nInvalid: " << invalid << "\nAverage attempts: "
            << (count > 0 ? static_cast<double>(totals.attempts) / count : 0.0)
            << "\nAverage time: " << (count > 0 ? elapsed.count() / count : 0.0)
            << " ms\nSlowest: " << slowest_ms << " ms\n";
  print_generation_stats(std::cout, totals);
  return invalid == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  bool debug_flag = false;
  bool dump_json = false;
  std::optional<uint64_t> seed;
  std::optional<int> count;

  std::string mode;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "--debug") {
      debug_flag = true;
      continue;
    }
    if (arg == "--dump-json") {
      dump_json = true;
      continue;
    }
    if (arg == "--seed") {
      if (i + 1 >= argc) {
        std::cerr << "--seed requires a value.\n";
        return 1;
      }
      seed = parse_number<uint64_t>(argv[++i]);
      if (!seed) {
        std::cerr << "--seed requires a non-negative integer.\n";
        return 1;
      }
      continue;
    }
    if (arg == "--count") {
      if (i + 1 >= argc) {
        std::cerr << "--count requires a value.\n";
        return 1;
      }
      count = parse_number<int>(argv[++i]);
      if (!count || *count <= 0) {
        std::cerr << "--count requires a positive integer.\n";
        return 1;
      }
      continue;
    }
    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown flag: " << arg << "\n";
      return 1;
    }
    if (mode.empty()) {
      mode = arg;
    } else {
      positional.push_back(arg);
    }
  }

  if (mode.empty()) {
    std::cerr << "No mode specified.\n";
    print_usage(argv[0]);
    return 1;
  }

  std::string normalized_mode = mode;
  std::transform(normalized_mode.begin(), normalized_mode.end(),
                 normalized_mode.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (normalized_mode == "help") {
    print_usage(argv[0]);
    return 0;
  }

  const bool generate_mode = normalized_mode == "generate";
  const bool stage_mode = normalized_mode == "stage";
  const bool bench_mode = normalized_mode == "bench";

  if (!generate_mode && !stage_mode && !bench_mode) {
    std::cerr << "Unknown mode '" << mode << "'.\n";
    print_usage(argv[0]);
    return 1;
  }
  if (positional.size() != 1) {
    std::cerr << mode << " mode requires exactly one argument.\n";
    return 1;
  }
  if (dump_json && bench_mode) {
    std::cerr << "--dump-json is not valid in bench mode.\n";
    return 1;
  }

  const uint64_t run_seed =
      seed ? *seed
           : static_cast<uint64_t>(
                 std::chrono::steady_clock::now().time_since_epoch().count());
  RandomSource rng = make_random_source(run_seed);
  if (debug_flag)
    std::cerr << "[main] seed=" << run_seed << "\n";

  GeneratorConfig config;
  config.debug = debug_flag;

  if (stage_mode) {
    const auto grid_number = parse_number<int>(positional.front());
    if (!grid_number || *grid_number <= 0) {
      std::cerr << "stage mode requires a positive grid number.\n";
      return 1;
    }
    const StageConfig stage = stage_for_grid_number(*grid_number);
    for (int i = 0; i < count.value_or(1); ++i) {
      GenerationStats stats;
      const Puzzle puzzle = generate_stage_puzzle(stage, rng, config, &stats);
      emit_puzzle(puzzle, dump_json, stats, debug_flag);
    }
    return 0;
  }

  const auto difficulty = parse_difficulty(positional.front());
  if (!difficulty) {
    std::cerr << "Unknown difficulty '" << positional.front()
              << "'. Expected easy, medium, hard or expert.\n";
    return 1;
  }
  const DifficultyTier &tier = difficulty_tier(*difficulty);

  if (bench_mode)
    return run_bench(tier, count.value_or(100), rng, config);

  for (int i = 0; i < count.value_or(1); ++i) {
    GenerationStats stats;
    const Puzzle puzzle = generate_puzzle(tier, rng, config, &stats);
    emit_puzzle(puzzle, dump_json, stats, debug_flag);
  }
  return 0;
}
