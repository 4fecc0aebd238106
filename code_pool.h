#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "puzzle_types.h"
#include "random_source.h"

inline constexpr std::string_view kBlockerCode = "XX";
inline constexpr std::string_view kWildcardDisplay = "??";

// The full symbol alphabet a puzzle can draw from.
const CodeList &available_codes();

// Shuffles `alphabet` and keeps the first `size` codes (all of them when
// `size` is out of range).
CodeList select_code_pool(const CodeList &alphabet, int size,
                          RandomSource &rng);

CodeList random_codes(const CodeList &pool, int count, RandomSource &rng);

// Sorted, de-duplicated union of every code in `sequences`.
CodeList unique_codes(const std::vector<CodeList> &sequences);

// Codes of `pool` that do not appear in the sorted list `excluded`.
CodeList codes_excluding(const CodeList &pool, const CodeList &excluded);

bool contains_code(const CodeList &sorted_codes, const std::string &code);

std::string display_code(const Cell &cell);
