#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace marklex::scan {

struct DelimiterRun {
    char marker = 0;
    uint32_t length = 0;
    bool can_open = false;
    bool can_close = false;
};

// Measures the run of `source[start]` that begins at `start` and evaluates the
// flanking rules against its neighbours. A neighbour before `lower_bound` or
// at or past `limit` counts as whitespace.
//
// '*' and '~' open when left-flanking and close when right-flanking; '~' only
// with a run of exactly two. '_' additionally refuses intraword positions.
// Backtick runs report their length only.
DelimiterRun compute_delimiter_run(std::string_view source, size_t start, size_t limit,
                                   size_t lower_bound);

// Same rules, for a run whose extent is already known.
DelimiterRun evaluate_delimiter_run(std::string_view source, size_t start, size_t length,
                                    size_t lower_bound, size_t limit);

bool is_left_flanking(char before, char after);
bool is_right_flanking(char before, char after);

// CanOpen/CanClose plus the saturated run length, ready to OR into token flags.
uint32_t delimiter_flags(const DelimiterRun& run);

} // namespace marklex::scan
