#pragma once

#include <vector>

#include "puzzle_types.h"
#include "random_source.h"

enum class FillMode { Forgiving, Moderate, Deceptive };

// How non-path cells are populated. `density` is the solution-code density
// (forgiving), the red-herring density (moderate) or the decoy density next
// to the path (deceptive). `sequence_codes` is sorted and only used by the
// deceptive mode.
struct FillStrategy {
  FillMode mode = FillMode::Forgiving;
  double density = 0.0;
  CodeList sequence_codes;

  static FillStrategy forgiving(double solution_code_density);
  static FillStrategy moderate(double red_herring_density);
  static FillStrategy deceptive(double decoy_density,
                                const std::vector<CodeList> &sequences);
};

const char *fill_mode_name(FillMode mode);

// Every cell gets a uniformly random pool code.
Grid fill_grid(int grid_size, const CodeList &code_pool, RandomSource &rng);

// Fills every cell not on `solution_path`; path cells are copied unchanged.
Grid fill_grid_by_difficulty(const Grid &grid,
                             const std::vector<Position> &solution_path,
                             const FillStrategy &strategy,
                             const CodeList &code_pool, RandomSource &rng);

// Special cell layering. None of these touch a solution-path cell.
Grid place_blockers(const Grid &grid,
                    const std::vector<Position> &solution_path, int count,
                    RandomSource &rng);
Grid place_wildcards(const Grid &grid,
                     const std::vector<Position> &solution_path, double chance,
                     RandomSource &rng);
Grid place_decay_cells(const Grid &grid,
                       const std::vector<Position> &solution_path, int count,
                       RandomSource &rng);
