#include "sequence_chain.h"

#include <algorithm>
#include <numeric>

#include "code_pool.h"

namespace {

// Hands out `remaining` single steps to random lengths below `max_length`.
void grow_lengths(std::vector<int> &lengths, int remaining, int max_length,
                  RandomSource &rng) {
  std::vector<size_t> growable;
  growable.reserve(lengths.size());
  while (remaining > 0) {
    growable.clear();
    for (size_t i = 0; i < lengths.size(); ++i) {
      if (lengths[i] < max_length)
        growable.push_back(i);
    }
    if (growable.empty())
      break;
    ++lengths[random_element(rng, growable)];
    --remaining;
  }
}

} // namespace

SolutionChain generate_overlapping_sequences(const OverlapConfig &config,
                                             RandomSource &rng) {
  SolutionChain chain;
  const auto &lengths = config.sequence_lengths;
  if (lengths.empty() || config.code_pool.empty())
    return chain;
  if (std::any_of(lengths.begin(), lengths.end(),
                  [](int length) { return length <= 0; }))
    return chain;

  const size_t junction_count = lengths.size() - 1;
  std::vector<bool> overlapping(junction_count, false);
  if (junction_count > 0 && config.overlap_count > 0 &&
      config.overlap_depth > 0) {
    std::vector<size_t> junctions(junction_count);
    std::iota(junctions.begin(), junctions.end(), 0);
    std::shuffle(junctions.begin(), junctions.end(), rng);
    const size_t wanted = std::min(
        junction_count, static_cast<size_t>(config.overlap_count));
    for (size_t i = 0; i < wanted; ++i) {
      overlapping[junctions[i]] = true;
    }
  }

  CodeList first = random_codes(config.code_pool, lengths[0], rng);
  chain.merged_path = first;
  chain.sequences.push_back(std::move(first));

  for (size_t i = 1; i < lengths.size(); ++i) {
    const CodeList &previous = chain.sequences.back();
    const int length = lengths[i];

    int depth = 0;
    if (overlapping[i - 1]) {
      depth = std::min({config.overlap_depth, length - 1,
                        static_cast<int>(previous.size())});
      depth = std::max(depth, 0);
    }

    CodeList sequence(previous.end() - depth, previous.end());
    const CodeList fresh = random_codes(config.code_pool, length - depth, rng);
    sequence.insert(sequence.end(), fresh.begin(), fresh.end());

    chain.merged_path.insert(chain.merged_path.end(), sequence.begin() + depth,
                             sequence.end());
    chain.sequences.push_back(std::move(sequence));
  }
  return chain;
}

std::vector<int> random_sequence_lengths(int count, int min_length,
                                         int max_total, RandomSource &rng) {
  if (count <= 0)
    return {};
  std::vector<int> lengths(static_cast<size_t>(count), min_length);
  grow_lengths(lengths, max_total - count * min_length, kMaxSequenceLength,
               rng);
  std::shuffle(lengths.begin(), lengths.end(), rng);
  return lengths;
}

std::vector<int> random_lengths(int merged_length, int count,
                                int overlap_size, RandomSource &rng,
                                int max_length) {
  if (count <= 0)
    return {};
  const int capacity = count * max_length;
  const int total =
      std::min(merged_length + overlap_size * (count - 1), capacity);
  const int floor_length = std::min(3, max_length);

  std::vector<int> lengths(static_cast<size_t>(count), floor_length);
  grow_lengths(lengths, total - count * floor_length, max_length, rng);
  return lengths;
}

void advance_progress(const std::vector<CodeList> &sequences,
                      std::vector<int> &progress, const std::string &code,
                      bool wildcard) {
  for (size_t i = 0; i < sequences.size(); ++i) {
    const auto &sequence = sequences[i];
    if (progress[i] >= static_cast<int>(sequence.size()))
      continue;
    if (wildcard || sequence[static_cast<size_t>(progress[i])] == code) {
      ++progress[i];
    }
  }
}

bool all_complete(const std::vector<CodeList> &sequences,
                  const std::vector<int> &progress) {
  for (size_t i = 0; i < sequences.size(); ++i) {
    if (progress[i] < static_cast<int>(sequences[i].size()))
      return false;
  }
  return true;
}

bool buffer_contains_sequence(const CodeList &buffer,
                              const CodeList &sequence) {
  if (sequence.empty())
    return true;
  size_t matched = 0;
  for (const auto &code : buffer) {
    if (code == sequence[matched] && ++matched == sequence.size())
      return true;
  }
  return false;
}

bool verify_path_completes(const CodeList &path,
                           const std::vector<CodeList> &sequences) {
  std::vector<int> progress(sequences.size(), 0);
  for (const auto &code : path) {
    advance_progress(sequences, progress, code, false);
  }
  return all_complete(sequences, progress);
}
