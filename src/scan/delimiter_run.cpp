#include <marklex/scan/delimiter_run.h>
#include <marklex/scan/char_codes.h>
#include <marklex/scan/token.h>

namespace marklex::scan {

// Neighbour used when a run touches the edge of the region.
static constexpr char kEdge = '\n';

bool is_left_flanking(char before, char after) {
    if (is_whitespace(after)) return false;
    if (!is_ascii_punctuation(after)) return true;
    return is_whitespace(before) || is_ascii_punctuation(before);
}

bool is_right_flanking(char before, char after) {
    if (is_whitespace(before)) return false;
    if (!is_ascii_punctuation(before)) return true;
    return is_whitespace(after) || is_ascii_punctuation(after);
}

DelimiterRun evaluate_delimiter_run(std::string_view source, size_t start, size_t length,
                                    size_t lower_bound, size_t limit) {
    DelimiterRun run;
    if (start >= limit || start >= source.size()) return run;

    run.marker = source[start];
    run.length = static_cast<uint32_t>(length);

    char before = start > lower_bound ? source[start - 1] : kEdge;
    size_t after_pos = start + length;
    char after = after_pos < limit && after_pos < source.size() ? source[after_pos] : kEdge;
    if (before == '\0') before = kEdge;
    if (after == '\0') after = kEdge;

    bool left = is_left_flanking(before, after);
    bool right = is_right_flanking(before, after);

    switch (run.marker) {
        case '*':
            run.can_open = left;
            run.can_close = right;
            break;
        case '_':
            // snake_case_words never open or close
            run.can_open = left && (!right || is_ascii_punctuation(before));
            run.can_close = right && (!left || is_ascii_punctuation(after));
            break;
        case '~':
            if (run.length == 2) {
                run.can_open = left;
                run.can_close = right;
            }
            break;
        default:
            break;
    }
    return run;
}

DelimiterRun compute_delimiter_run(std::string_view source, size_t start, size_t limit,
                                   size_t lower_bound) {
    if (limit > source.size()) limit = source.size();
    if (start >= limit) return DelimiterRun{};

    char marker = source[start];
    size_t pos = start;
    while (pos < limit && source[pos] == marker) ++pos;
    return evaluate_delimiter_run(source, start, pos - start, lower_bound, limit);
}

uint32_t delimiter_flags(const DelimiterRun& run) {
    uint32_t flags = with_run_length(token_flags::None, run.length);
    if (run.can_open) flags |= token_flags::CanOpen;
    if (run.can_close) flags |= token_flags::CanClose;
    return flags;
}

} // namespace marklex::scan
