#pragma once

#include <vector>

#include "puzzle.h"
#include "puzzle_types.h"

// Start in row 0, alternate column/row moves, stay inside a grid of
// `grid_size`, never repeat a cell.
bool validate_path_shape(const std::vector<Position> &path, int grid_size);

// Checks the canonical solution of `puzzle`: path shape, par equals the
// path length, buffer covers par, and the path's codes complete every
// sequence. With `check_blockers` a blocker on the path also fails.
bool validate_puzzle(const Puzzle &puzzle, bool check_blockers = false);
