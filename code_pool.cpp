#include "code_pool.h"

#include <algorithm>

const CodeList &available_codes() {
  static const CodeList codes = {"1C", "BD", "55", "E9", "7A", "FF"};
  return codes;
}

CodeList select_code_pool(const CodeList &alphabet, int size,
                          RandomSource &rng) {
  CodeList pool = alphabet;
  std::shuffle(pool.begin(), pool.end(), rng);
  if (size > 0 && static_cast<size_t>(size) < pool.size()) {
    pool.resize(static_cast<size_t>(size));
  }
  return pool;
}

CodeList random_codes(const CodeList &pool, int count, RandomSource &rng) {
  CodeList codes;
  if (pool.empty() || count <= 0)
    return codes;
  codes.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    codes.push_back(random_element(rng, pool));
  }
  return codes;
}

CodeList unique_codes(const std::vector<CodeList> &sequences) {
  CodeList codes;
  for (const auto &sequence : sequences) {
    codes.insert(codes.end(), sequence.begin(), sequence.end());
  }
  std::sort(codes.begin(), codes.end());
  codes.erase(std::unique(codes.begin(), codes.end()), codes.end());
  return codes;
}

CodeList codes_excluding(const CodeList &pool, const CodeList &excluded) {
  CodeList result;
  result.reserve(pool.size());
  for (const auto &code : pool) {
    if (!contains_code(excluded, code)) {
      result.push_back(code);
    }
  }
  return result;
}

bool contains_code(const CodeList &sorted_codes, const std::string &code) {
  return std::binary_search(sorted_codes.begin(), sorted_codes.end(), code);
}

std::string display_code(const Cell &cell) {
  switch (cell.kind) {
  case CellKind::Blocker:
    return std::string(kBlockerCode);
  case CellKind::Wildcard:
    return std::string(kWildcardDisplay);
  default:
    return cell.code;
  }
}
