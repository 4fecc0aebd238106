#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

using CodeList = std::vector<std::string>;

struct Position {
  int row = 0;
  int col = 0;

  bool operator==(const Position &other) const noexcept {
    return row == other.row && col == other.col;
  }
  bool operator!=(const Position &other) const noexcept {
    return !(*this == other);
  }
  bool operator<(const Position &other) const noexcept {
    return row != other.row ? row < other.row : col < other.col;
  }
};

struct PositionHash {
  size_t operator()(const Position &pos) const noexcept {
    size_t h = std::hash<int>{}(pos.row);
    h ^= std::hash<int>{}(pos.col) + 0x9e3779b97f4a7c15ULL + (h << 6) +
         (h >> 2);
    return h;
  }
};

enum class CellKind { Normal, Blocker, Wildcard, Decay };

struct Cell {
  std::string code;
  int row = 0;
  int col = 0;
  CellKind kind = CellKind::Normal;
  int decay_moves = 0;
  bool selected = false;

  Position position() const { return {row, col}; }
  bool blocked() const { return kind == CellKind::Blocker; }
  bool wildcard() const { return kind == CellKind::Wildcard; }
  bool decaying() const { return kind == CellKind::Decay; }
};

using Grid = std::vector<std::vector<Cell>>;

struct TargetSequence {
  CodeList codes;
  int matched_count = 0;
  bool impossible = false;

  bool complete() const {
    return matched_count >= static_cast<int>(codes.size());
  }
};

struct SolutionChain {
  std::vector<CodeList> sequences;
  CodeList merged_path;
};

struct OverlapConfig {
  int overlap_count = 0;
  int overlap_depth = 0;
  CodeList code_pool;
  std::vector<int> sequence_lengths;
};

// Inclusive range of accepted solution counts.
struct SolutionRange {
  int min = 1;
  int max = 1;

  bool contains(int value) const { return value >= min && value <= max; }
};
