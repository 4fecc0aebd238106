#include "puzzle_report.h"

#include <algorithm>
#include <string>

#include "code_pool.h"

namespace {

const char *cell_kind_name(CellKind kind) {
  switch (kind) {
  case CellKind::Normal:
    return "normal";
  case CellKind::Blocker:
    return "blocker";
  case CellKind::Wildcard:
    return "wildcard";
  case CellKind::Decay:
    return "decay";
  }
  return "normal";
}

void write_position_list(std::ostream &out,
                         const std::vector<Position> &positions) {
  out << "[";
  for (size_t i = 0; i < positions.size(); ++i) {
    out << "[" << positions[i].row << "," << positions[i].col << "]";
    if (i + 1 < positions.size())
      out << ",";
  }
  out << "]";
}

void write_code_list(std::ostream &out, const CodeList &codes) {
  out << "[";
  for (size_t i = 0; i < codes.size(); ++i) {
    out << "\"" << codes[i] << "\"";
    if (i + 1 < codes.size())
      out << ",";
  }
  out << "]";
}

} // namespace

void print_puzzle(std::ostream &out, const Puzzle &puzzle,
                  bool show_solution) {
  const auto &path = puzzle.solution_path();
  out << "Difficulty: " << difficulty_name(puzzle.difficulty())
      << "  Grid: " << puzzle.grid_size() << "x" << puzzle.grid_size()
      << "  Buffer: " << puzzle.buffer_size() << "  Par: " << puzzle.par()
      << "\n\n";

  for (const auto &row : puzzle.grid()) {
    for (const auto &cell : row) {
      const bool on_path =
          show_solution &&
          std::find(path.begin(), path.end(), cell.position()) != path.end();
      out << (on_path ? "[" : " ") << display_code(cell)
          << (on_path ? "]" : " ");
    }
    out << "\n";
  }

  out << "\nSequences:\n";
  for (const auto &sequence : puzzle.sequences()) {
    out << "  ";
    for (size_t i = 0; i < sequence.codes.size(); ++i) {
      if (i > 0)
        out << " -> ";
      out << sequence.codes[i];
    }
    out << "\n";
  }

  if (show_solution) {
    out << "\nSolution:";
    for (const auto &pos : path) {
      out << " (" << pos.row << "," << pos.col << ")";
    }
    out << "\n";
  }
}

void write_puzzle_json(std::ostream &out, const Puzzle &puzzle,
                       const SolveResult *result) {
  out << "{\"difficulty\":\"" << difficulty_name(puzzle.difficulty())
      << "\",\"gridSize\":" << puzzle.grid_size()
      << ",\"bufferSize\":" << puzzle.buffer_size()
      << ",\"par\":" << puzzle.par() << ",\"grid\":[";
  const auto &grid = puzzle.grid();
  for (size_t r = 0; r < grid.size(); ++r) {
    out << "[";
    for (size_t c = 0; c < grid[r].size(); ++c) {
      const Cell &cell = grid[r][c];
      out << "{\"code\":\"" << cell.code << "\",\"kind\":\""
          << cell_kind_name(cell.kind) << "\"";
      if (cell.decaying())
        out << ",\"decayMoves\":" << cell.decay_moves;
      out << "}";
      if (c + 1 < grid[r].size())
        out << ",";
    }
    out << "]";
    if (r + 1 < grid.size())
      out << ",";
  }
  out << "],\"sequences\":[";
  const auto &sequences = puzzle.sequences();
  for (size_t i = 0; i < sequences.size(); ++i) {
    write_code_list(out, sequences[i].codes);
    if (i + 1 < sequences.size())
      out << ",";
  }
  out << "],\"solutionPath\":";
  write_position_list(out, puzzle.solution_path());

  if (result) {
    out << ",\"solver\":{\"solvable\":"
        << (result->solvable() ? "true" : "false")
        << ",\"par\":" << result->par()
        << ",\"solutions\":" << result->solution_count()
        << ",\"falseStarts\":" << result->false_starts << "}";
  }
  out << "}\n";
}

void print_generation_stats(std::ostream &out, const GenerationStats &stats) {
  out << "Attempts: " << stats.attempts
      << (stats.used_fallback ? " (fallback)" : "") << "\n";
  if (!stats.reject_counts.empty()) {
    out << "Rejects: " << summarize_rejects(stats) << "\n";
  }
  if (!stats.sequence_count_rolls.empty()) {
    out << "Sequence counts rolled:";
    for (const auto &entry : stats.sequence_count_rolls) {
      out << " " << entry.first << "seq=" << entry.second;
    }
    out << "\n";
  }
}
