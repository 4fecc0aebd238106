#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

// Every randomized step draws from one caller-owned engine so that a seed
// reproduces a whole generation run.
using RandomSource = std::mt19937_64;

inline RandomSource make_random_source(uint64_t seed) {
  return RandomSource(seed);
}

// Uniform integer in [lo, hi].
inline int random_int(RandomSource &rng, int lo, int hi) {
  if (hi <= lo)
    return lo;
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(rng);
}

inline size_t random_index(RandomSource &rng, size_t count) {
  std::uniform_int_distribution<size_t> dist(0, count - 1);
  return dist(rng);
}

// True with probability `chance`; 0 never fires and 1 always does.
inline bool random_chance(RandomSource &rng, double chance) {
  if (chance <= 0.0)
    return false;
  if (chance >= 1.0)
    return true;
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng) < chance;
}

template <typename T>
const T &random_element(RandomSource &rng, const std::vector<T> &items) {
  return items[random_index(rng, items.size())];
}
