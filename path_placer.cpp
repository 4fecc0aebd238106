#include "path_placer.h"

Grid make_empty_grid(int grid_size) {
  Grid grid(static_cast<size_t>(grid_size));
  for (int row = 0; row < grid_size; ++row) {
    auto &cells = grid[static_cast<size_t>(row)];
    cells.resize(static_cast<size_t>(grid_size));
    for (int col = 0; col < grid_size; ++col) {
      cells[static_cast<size_t>(col)].row = row;
      cells[static_cast<size_t>(col)].col = col;
    }
  }
  return grid;
}

std::optional<PlacedPath> place_solution_path(const CodeList &merged_path,
                                              int grid_size,
                                              RandomSource &rng) {
  if (grid_size <= 0 || merged_path.empty())
    return std::nullopt;

  PlacedPath placed;
  placed.grid = make_empty_grid(grid_size);
  placed.path.reserve(merged_path.size());

  std::vector<bool> used(static_cast<size_t>(grid_size * grid_size), false);
  auto is_used = [&](int row, int col) {
    return used[static_cast<size_t>(row * grid_size + col)];
  };

  // The opening pick is forced into row 0; after it the mode is vertical.
  bool horizontal = true;
  Position current{0, random_int(rng, 0, grid_size - 1)};
  std::vector<Position> candidates;
  candidates.reserve(static_cast<size_t>(grid_size));

  for (size_t step = 0; step < merged_path.size(); ++step) {
    if (step > 0) {
      candidates.clear();
      for (int i = 0; i < grid_size; ++i) {
        const Position pos = horizontal ? Position{current.row, i}
                                        : Position{i, current.col};
        if (!is_used(pos.row, pos.col))
          candidates.push_back(pos);
      }
      if (candidates.empty())
        return std::nullopt;
      current = random_element(rng, candidates);
    }

    Cell &cell = placed.grid[static_cast<size_t>(current.row)]
                            [static_cast<size_t>(current.col)];
    cell.code = merged_path[step];
    used[static_cast<size_t>(current.row * grid_size + current.col)] = true;
    placed.path.push_back(current);
    horizontal = !horizontal;
  }
  return placed;
}
