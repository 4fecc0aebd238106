#pragma once

#include <utility>
#include <vector>

#include "difficulty.h"
#include "puzzle_types.h"

// A generated puzzle. Built once and only read afterwards.
class Puzzle {
public:
  Puzzle(Grid grid, std::vector<TargetSequence> sequences, int buffer_size,
         int par, Difficulty difficulty, std::vector<Position> solution_path)
      : grid_(std::move(grid)), sequences_(std::move(sequences)),
        buffer_size_(buffer_size), par_(par), difficulty_(difficulty),
        solution_path_(std::move(solution_path)) {}

  const Grid &grid() const { return grid_; }
  const std::vector<TargetSequence> &sequences() const { return sequences_; }
  int buffer_size() const { return buffer_size_; }
  int par() const { return par_; }
  Difficulty difficulty() const { return difficulty_; }
  const std::vector<Position> &solution_path() const { return solution_path_; }
  int grid_size() const { return static_cast<int>(grid_.size()); }

  const Cell &cell(const Position &pos) const {
    return grid_[static_cast<size_t>(pos.row)][static_cast<size_t>(pos.col)];
  }

  std::vector<CodeList> sequence_codes() const {
    std::vector<CodeList> codes;
    codes.reserve(sequences_.size());
    for (const auto &sequence : sequences_) {
      codes.push_back(sequence.codes);
    }
    return codes;
  }

private:
  Grid grid_;
  std::vector<TargetSequence> sequences_;
  int buffer_size_;
  int par_;
  Difficulty difficulty_;
  std::vector<Position> solution_path_;
};

inline std::vector<TargetSequence>
make_target_sequences(const std::vector<CodeList> &sequences) {
  std::vector<TargetSequence> targets;
  targets.reserve(sequences.size());
  for (const auto &codes : sequences) {
    TargetSequence target;
    target.codes = codes;
    targets.push_back(std::move(target));
  }
  return targets;
}
