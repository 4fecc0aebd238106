#pragma once

#include <string>
#include <vector>

#include "puzzle_types.h"
#include "random_source.h"

inline constexpr int kMaxSequenceLength = 5;

// Builds the target sequences described by `config` and the merged path that
// completes all of them. Returns an empty chain when the config cannot
// produce one (no lengths, a non-positive length or an empty pool).
SolutionChain generate_overlapping_sequences(const OverlapConfig &config,
                                             RandomSource &rng);

// Every length starts at `min_length`; single steps are handed to random
// sequences still below kMaxSequenceLength until `max_total` is spent.
std::vector<int> random_sequence_lengths(int count, int min_length,
                                         int max_total, RandomSource &rng);

// Lengths for `count` sequences whose chain, overlapped by `overlap_size` at
// every junction, yields a merged path of `merged_length` codes. Capped at
// `count * max_length`; every length is at least 3 (or `max_length` if that
// is smaller).
std::vector<int> random_lengths(int merged_length, int count,
                                int overlap_size, RandomSource &rng,
                                int max_length = 4);

// Longest-prefix matching step: every incomplete sequence whose next needed
// code is `code` (or any sequence, for a wildcard) advances by one.
void advance_progress(const std::vector<CodeList> &sequences,
                      std::vector<int> &progress, const std::string &code,
                      bool wildcard);

bool all_complete(const std::vector<CodeList> &sequences,
                  const std::vector<int> &progress);

// True when `sequence` is matched in order (not necessarily contiguously).
bool buffer_contains_sequence(const CodeList &buffer,
                              const CodeList &sequence);

// Replays `path` against all sequences in parallel.
bool verify_path_completes(const CodeList &path,
                           const std::vector<CodeList> &sequences);
