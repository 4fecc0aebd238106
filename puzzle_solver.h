#pragma once

#include <vector>

#include "puzzle_types.h"

inline constexpr int kDefaultMaxSolutions = 10;

struct SolveResult {
  // Sorted by length, shortest first.
  std::vector<std::vector<Position>> solutions;
  int false_starts = 0;

  bool solvable() const { return !solutions.empty(); }
  int par() const {
    return solutions.empty() ? 0 : static_cast<int>(solutions.front().size());
  }
  int solution_count() const { return static_cast<int>(solutions.size()); }
};

// Enumerates selection paths that complete every sequence within
// `buffer_size` picks, trying every selectable row-0 cell as the opening
// pick. Stops once `max_solutions` paths are found. A row-0 start explored
// without yielding any solution counts as a false start; blocked row-0 cells
// are skipped and never counted.
SolveResult solve(const Grid &grid, const std::vector<CodeList> &sequences,
                  int buffer_size, int max_solutions = kDefaultMaxSolutions);
