#include "puzzle_solver.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace {

constexpr uint16_t kUnmatchedCode = 0xFFFF;

// Codes are interned to small integers so the inner loop compares integers
// instead of strings.
struct CodeTable {
  std::unordered_map<std::string, uint16_t> index;

  uint16_t intern(const std::string &code) {
    const auto it = index.find(code);
    if (it != index.end())
      return it->second;
    const auto id = static_cast<uint16_t>(index.size());
    index.emplace(code, id);
    return id;
  }

  uint16_t lookup(const std::string &code) const {
    const auto it = index.find(code);
    return it == index.end() ? kUnmatchedCode : it->second;
  }
};

class SolverSearch {
public:
  SolverSearch(const Grid &grid, const std::vector<CodeList> &sequences,
               int buffer_size, int max_solutions)
      : size_(static_cast<int>(grid.size())), buffer_size_(buffer_size),
        max_solutions_(static_cast<size_t>(max_solutions)) {
    CodeTable table;
    sequences_.reserve(sequences.size());
    for (const auto &sequence : sequences) {
      std::vector<uint16_t> ids;
      ids.reserve(sequence.size());
      for (const auto &code : sequence) {
        ids.push_back(table.intern(code));
      }
      sequences_.push_back(std::move(ids));
    }

    const size_t cell_count = static_cast<size_t>(size_ * size_);
    cell_codes_.resize(cell_count, kUnmatchedCode);
    blocked_.resize(cell_count, false);
    wildcard_.resize(cell_count, false);
    used_.resize(cell_count, false);
    for (int row = 0; row < size_; ++row) {
      for (int col = 0; col < size_; ++col) {
        const Cell &cell =
            grid[static_cast<size_t>(row)][static_cast<size_t>(col)];
        const size_t idx = index_of(row, col);
        cell_codes_[idx] = table.lookup(cell.code);
        blocked_[idx] = cell.blocked();
        wildcard_[idx] = cell.wildcard();
      }
    }

    const size_t seq_count = sequences_.size();
    const size_t depth_count = static_cast<size_t>(buffer_size_) + 1;
    progress_.assign(seq_count, 0);
    progress_stack_.assign(depth_count * seq_count, 0);
    candidates_.resize(depth_count);
    needed_.assign(table.index.size(), false);
    path_.reserve(depth_count);
  }

  SolveResult run() {
    SolveResult result;
    for (int col = 0; col < size_; ++col) {
      if (blocked_[index_of(0, col)])
        continue;
      const size_t before = solutions_.size();
      explore_start(col);
      if (solutions_.size() == before)
        ++result.false_starts;
      if (solutions_.size() >= max_solutions_)
        break;
    }
    std::stable_sort(solutions_.begin(), solutions_.end(),
                     [](const std::vector<Position> &a,
                        const std::vector<Position> &b) {
                       return a.size() < b.size();
                     });
    result.solutions = std::move(solutions_);
    return result;
  }

private:
  size_t index_of(int row, int col) const {
    return static_cast<size_t>(row * size_ + col);
  }

  void explore_start(int col) {
    const Position start{0, col};
    std::fill(progress_.begin(), progress_.end(), 0);
    std::fill(used_.begin(), used_.end(), false);
    path_.clear();

    advance(index_of(0, col));
    used_[index_of(0, col)] = true;
    path_.push_back(start);

    if (complete()) {
      solutions_.push_back(path_);
      return;
    }
    // The opening pick is horizontal (row 0), so the next one is vertical.
    search(0, start, false, buffer_size_ - 1);
  }

  void search(size_t depth, Position current, bool horizontal,
              int moves_remaining) {
    if (moves_remaining <= 0)
      return;
    if (solutions_.size() >= max_solutions_)
      return;
    if (!can_still_complete(moves_remaining))
      return;

    std::vector<int> &candidates = candidates_[depth];
    collect_candidates(current, horizontal, candidates);
    if (candidates.empty())
      return;

    const size_t seq_count = progress_.size();
    int *saved = progress_stack_.data() + depth * seq_count;
    std::copy(progress_.begin(), progress_.end(), saved);

    for (const int idx : candidates) {
      const Position next{idx / size_, idx % size_};
      advance(static_cast<size_t>(idx));
      used_[static_cast<size_t>(idx)] = true;
      path_.push_back(next);

      if (complete()) {
        solutions_.push_back(path_);
      } else {
        search(depth + 1, next, !horizontal, moves_remaining - 1);
      }

      path_.pop_back();
      used_[static_cast<size_t>(idx)] = false;
      std::copy(saved, saved + seq_count, progress_.begin());

      if (solutions_.size() >= max_solutions_)
        return;
    }
  }

  // One pick can advance several sequences at once, so the bound is the
  // longest remainder rather than the sum.
  bool can_still_complete(int moves_remaining) const {
    int max_remaining = 0;
    for (size_t i = 0; i < sequences_.size(); ++i) {
      max_remaining = std::max(
          max_remaining, static_cast<int>(sequences_[i].size()) - progress_[i]);
    }
    return moves_remaining >= max_remaining;
  }

  // Free, selectable cells of the current row or column, with cells that
  // advance at least one sequence ordered first.
  void collect_candidates(Position current, bool horizontal,
                          std::vector<int> &candidates) {
    candidates.clear();
    for (int i = 0; i < size_; ++i) {
      const int row = horizontal ? current.row : i;
      const int col = horizontal ? i : current.col;
      const size_t idx = index_of(row, col);
      if (used_[idx] || blocked_[idx])
        continue;
      candidates.push_back(static_cast<int>(idx));
    }

    std::fill(needed_.begin(), needed_.end(), false);
    for (size_t i = 0; i < sequences_.size(); ++i) {
      const auto &sequence = sequences_[i];
      if (progress_[i] < static_cast<int>(sequence.size()))
        needed_[sequence[static_cast<size_t>(progress_[i])]] = true;
    }
    std::stable_partition(candidates.begin(), candidates.end(), [&](int idx) {
      const size_t cell = static_cast<size_t>(idx);
      if (wildcard_[cell])
        return true;
      const uint16_t code = cell_codes_[cell];
      return code != kUnmatchedCode && needed_[code];
    });
  }

  void advance(size_t cell) {
    const uint16_t code = cell_codes_[cell];
    const bool wildcard = wildcard_[cell];
    for (size_t i = 0; i < sequences_.size(); ++i) {
      const auto &sequence = sequences_[i];
      int &matched = progress_[i];
      if (matched >= static_cast<int>(sequence.size()))
        continue;
      if (wildcard || sequence[static_cast<size_t>(matched)] == code)
        ++matched;
    }
  }

  bool complete() const {
    for (size_t i = 0; i < sequences_.size(); ++i) {
      if (progress_[i] < static_cast<int>(sequences_[i].size()))
        return false;
    }
    return true;
  }

  int size_;
  int buffer_size_;
  size_t max_solutions_;
  std::vector<std::vector<uint16_t>> sequences_;
  std::vector<uint16_t> cell_codes_;
  std::vector<bool> blocked_;
  std::vector<bool> wildcard_;
  std::vector<bool> used_;
  std::vector<bool> needed_;
  std::vector<int> progress_;
  std::vector<int> progress_stack_;
  std::vector<std::vector<int>> candidates_;
  std::vector<Position> path_;
  std::vector<std::vector<Position>> solutions_;
};

bool is_square(const Grid &grid) {
  for (const auto &row : grid) {
    if (row.size() != grid.size())
      return false;
  }
  return true;
}

} // namespace

SolveResult solve(const Grid &grid, const std::vector<CodeList> &sequences,
                  int buffer_size, int max_solutions) {
  if (grid.empty() || !is_square(grid) || sequences.empty() ||
      buffer_size <= 0 || max_solutions <= 0) {
    return SolveResult{};
  }
  SolverSearch search(grid, sequences, buffer_size, max_solutions);
  return search.run();
}
