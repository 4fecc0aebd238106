#include "grid_fill.h"

#include <algorithm>
#include <string>
#include <unordered_set>

#include "code_pool.h"
#include "path_placer.h"

namespace {

using PositionSet = std::unordered_set<Position, PositionHash>;

PositionSet to_set(const std::vector<Position> &path) {
  return PositionSet(path.begin(), path.end());
}

// Distinct codes on the path, in path order.
CodeList path_codes(const Grid &grid, const std::vector<Position> &path) {
  CodeList codes;
  for (const auto &pos : path) {
    const std::string &code =
        grid[static_cast<size_t>(pos.row)][static_cast<size_t>(pos.col)].code;
    if (std::find(codes.begin(), codes.end(), code) == codes.end())
      codes.push_back(code);
  }
  return codes;
}

PositionSet path_neighbours(const std::vector<Position> &path,
                            const PositionSet &on_path, int grid_size) {
  static constexpr int kOffsets[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
  PositionSet neighbours;
  for (const auto &pos : path) {
    for (const auto &offset : kOffsets) {
      const Position next{pos.row + offset[0], pos.col + offset[1]};
      if (next.row < 0 || next.col < 0 || next.row >= grid_size ||
          next.col >= grid_size)
        continue;
      if (!on_path.count(next))
        neighbours.insert(next);
    }
  }
  return neighbours;
}

// Off-path cells in row-major order.
std::vector<Position> free_positions(const Grid &grid,
                                     const PositionSet &on_path) {
  std::vector<Position> positions;
  for (const auto &row : grid) {
    for (const auto &cell : row) {
      if (!on_path.count(cell.position()))
        positions.push_back(cell.position());
    }
  }
  return positions;
}

Cell &cell_at(Grid &grid, const Position &pos) {
  return grid[static_cast<size_t>(pos.row)][static_cast<size_t>(pos.col)];
}

} // namespace

FillStrategy FillStrategy::forgiving(double solution_code_density) {
  return FillStrategy{FillMode::Forgiving, solution_code_density, {}};
}

FillStrategy FillStrategy::moderate(double red_herring_density) {
  return FillStrategy{FillMode::Moderate, red_herring_density, {}};
}

FillStrategy FillStrategy::deceptive(double decoy_density,
                                     const std::vector<CodeList> &sequences) {
  return FillStrategy{FillMode::Deceptive, decoy_density,
                      unique_codes(sequences)};
}

const char *fill_mode_name(FillMode mode) {
  switch (mode) {
  case FillMode::Forgiving:
    return "forgiving";
  case FillMode::Moderate:
    return "moderate";
  case FillMode::Deceptive:
    return "deceptive";
  }
  return "unknown";
}

Grid fill_grid(int grid_size, const CodeList &code_pool, RandomSource &rng) {
  Grid grid = make_empty_grid(grid_size);
  if (code_pool.empty())
    return grid;
  for (auto &row : grid) {
    for (auto &cell : row) {
      cell.code = random_element(rng, code_pool);
    }
  }
  return grid;
}

Grid fill_grid_by_difficulty(const Grid &grid,
                             const std::vector<Position> &solution_path,
                             const FillStrategy &strategy,
                             const CodeList &code_pool, RandomSource &rng) {
  Grid filled = grid;
  if (code_pool.empty())
    return filled;

  const PositionSet on_path = to_set(solution_path);
  const int grid_size = static_cast<int>(grid.size());

  CodeList favoured;
  PositionSet decoy_zone;
  CodeList safe_filler = code_pool;
  if (strategy.mode == FillMode::Deceptive) {
    favoured = strategy.sequence_codes.empty() ? code_pool
                                               : strategy.sequence_codes;
    decoy_zone = path_neighbours(solution_path, on_path, grid_size);
    CodeList safe = codes_excluding(code_pool, strategy.sequence_codes);
    if (!safe.empty())
      safe_filler = std::move(safe);
  } else {
    favoured = path_codes(grid, solution_path);
    if (favoured.empty())
      favoured = code_pool;
  }

  for (const auto &pos : free_positions(filled, on_path)) {
    Cell &cell = cell_at(filled, pos);
    cell.kind = CellKind::Normal;
    cell.decay_moves = 0;

    if (strategy.mode == FillMode::Deceptive) {
      const bool decoy =
          decoy_zone.count(pos) && random_chance(rng, strategy.density);
      cell.code = decoy ? random_element(rng, favoured)
                        : random_element(rng, safe_filler);
      continue;
    }
    cell.code = random_chance(rng, strategy.density)
                    ? random_element(rng, favoured)
                    : random_element(rng, code_pool);
  }
  return filled;
}

Grid place_blockers(const Grid &grid,
                    const std::vector<Position> &solution_path, int count,
                    RandomSource &rng) {
  if (count <= 0)
    return grid;
  Grid result = grid;
  std::vector<Position> available =
      free_positions(grid, to_set(solution_path));
  std::shuffle(available.begin(), available.end(), rng);
  const size_t limit = std::min(available.size(), static_cast<size_t>(count));
  for (size_t i = 0; i < limit; ++i) {
    Cell &cell = cell_at(result, available[i]);
    cell.code = std::string(kBlockerCode);
    cell.kind = CellKind::Blocker;
    cell.decay_moves = 0;
  }
  return result;
}

Grid place_wildcards(const Grid &grid,
                     const std::vector<Position> &solution_path, double chance,
                     RandomSource &rng) {
  if (chance <= 0.0)
    return grid;
  Grid result = grid;
  for (const auto &pos : free_positions(grid, to_set(solution_path))) {
    Cell &cell = cell_at(result, pos);
    if (cell.blocked())
      continue;
    if (random_chance(rng, chance))
      cell.kind = CellKind::Wildcard;
  }
  return result;
}

Grid place_decay_cells(const Grid &grid,
                       const std::vector<Position> &solution_path, int count,
                       RandomSource &rng) {
  if (count <= 0)
    return grid;
  Grid result = grid;
  std::vector<Position> available;
  for (const auto &pos : free_positions(grid, to_set(solution_path))) {
    const Cell &cell = cell_at(result, pos);
    if (cell.kind == CellKind::Normal)
      available.push_back(pos);
  }
  std::shuffle(available.begin(), available.end(), rng);
  const size_t limit = std::min(available.size(), static_cast<size_t>(count));
  for (size_t i = 0; i < limit; ++i) {
    Cell &cell = cell_at(result, available[i]);
    cell.kind = CellKind::Decay;
    cell.decay_moves = random_int(rng, 3, 5);
  }
  return result;
}
