#include "puzzle_validator.h"

#include <unordered_set>

#include "sequence_chain.h"

bool validate_path_shape(const std::vector<Position> &path, int grid_size) {
  if (path.empty() || path.front().row != 0)
    return false;

  std::unordered_set<Position, PositionHash> seen;
  bool horizontal = true;
  for (size_t i = 0; i < path.size(); ++i) {
    const Position &pos = path[i];
    if (pos.row < 0 || pos.col < 0 || pos.row >= grid_size ||
        pos.col >= grid_size)
      return false;
    if (!seen.insert(pos).second)
      return false;
    if (i > 0) {
      const Position &last = path[i - 1];
      if (horizontal ? pos.row != last.row : pos.col != last.col)
        return false;
    }
    horizontal = !horizontal;
  }
  return true;
}

bool validate_puzzle(const Puzzle &puzzle, bool check_blockers) {
  const auto &path = puzzle.solution_path();
  const int grid_size = puzzle.grid_size();
  for (const auto &row : puzzle.grid()) {
    if (static_cast<int>(row.size()) != grid_size)
      return false;
  }
  if (static_cast<int>(path.size()) != puzzle.par())
    return false;
  if (puzzle.buffer_size() < puzzle.par())
    return false;
  if (puzzle.sequences().empty())
    return false;
  if (!validate_path_shape(path, grid_size))
    return false;

  const std::vector<CodeList> sequences = puzzle.sequence_codes();
  std::vector<int> progress(sequences.size(), 0);
  for (const auto &pos : path) {
    const Cell &cell = puzzle.cell(pos);
    if (cell.blocked()) {
      if (check_blockers)
        return false;
    }
    advance_progress(sequences, progress, cell.code, cell.wildcard());
  }
  return all_complete(sequences, progress);
}
