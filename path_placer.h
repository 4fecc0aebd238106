#pragma once

#include <optional>
#include <vector>

#include "puzzle_types.h"
#include "random_source.h"

struct PlacedPath {
  Grid grid;
  std::vector<Position> path;
};

// Square grid of normal cells with empty codes.
Grid make_empty_grid(int grid_size);

// Lays `merged_path` on an empty grid: the first code goes to a random column
// of row 0, then picks alternate between the current column and the current
// row, never reusing a cell. Returns std::nullopt when a step has no free
// cell left; callers retry with fresh randomness.
std::optional<PlacedPath> place_solution_path(const CodeList &merged_path,
                                              int grid_size,
                                              RandomSource &rng);
