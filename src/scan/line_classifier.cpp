#include <marklex/scan/line_classifier.h>
#include <marklex/core/config.h>
#include <marklex/scan/char_codes.h>

namespace marklex::scan {

namespace config = core::config;

size_t find_next_line(std::string_view source, size_t pos, size_t end, size_t* line_end) {
    while (pos < end && !is_line_break(source[pos])) ++pos;
    if (line_end) *line_end = pos;
    if (pos < end) {
        if (source[pos] == '\r' && pos + 1 < end && source[pos + 1] == '\n') ++pos;
        ++pos;
    }
    return pos;
}

bool is_blank_range(std::string_view source, size_t from, size_t to) {
    for (size_t i = from; i < to; ++i) {
        if (!is_space_or_tab(source[i])) return false;
    }
    return true;
}

static size_t skip_spaces(std::string_view source, size_t pos, size_t end) {
    while (pos < end && is_space_or_tab(source[pos])) ++pos;
    return pos;
}

static size_t run_end(std::string_view source, size_t pos, size_t end, char c) {
    while (pos < end && source[pos] == c) ++pos;
    return pos;
}

// Measures leading indentation in columns. Returns the first non-blank offset.
static size_t measure_indent(std::string_view source, size_t pos, size_t end,
                             uint32_t tab_width, uint32_t& columns) {
    columns = 0;
    while (pos < end && is_space_or_tab(source[pos])) {
        if (source[pos] == '\t') {
            columns = (columns / tab_width + 1) * tab_width;
        } else {
            ++columns;
        }
        ++pos;
    }
    return pos;
}

// On success `last` is one past the final marker character.
static bool is_thematic_break(std::string_view source, size_t pos, size_t line_end,
                              char marker, size_t& count, size_t& last) {
    count = 0;
    for (size_t i = pos; i < line_end; ++i) {
        char c = source[i];
        if (c == marker) {
            ++count;
            last = i + 1;
        } else if (!is_space_or_tab(c)) {
            return false;
        }
    }
    return count >= 3;
}

bool is_fence_close(std::string_view source, size_t line_start, size_t end, char marker,
                    size_t length, uint32_t tab_width) {
    uint32_t indent = 0;
    size_t pos = measure_indent(source, line_start, end, tab_width, indent);
    if (indent > config::kMaxMarkerIndent) return false;
    size_t run = run_end(source, pos, end, marker);
    if (run - pos != length) return false;
    size_t line_end = 0;
    find_next_line(source, run, end, &line_end);
    return is_blank_range(source, run, line_end);
}

LineInfo classify_line(std::string_view source, size_t line_start, size_t end,
                       const LineClassifierOptions& options) {
    LineInfo info;
    info.next_line = find_next_line(source, line_start, end, &info.line_end);

    size_t pos = measure_indent(source, line_start, info.line_end, options.tab_width,
                                info.indent);
    info.marker_offset = pos;
    info.marker_end = pos;
    info.content_offset = pos;

    if (pos == info.line_end) {
        info.line_class = LineClass::Blank;
        return info;
    }
    if (info.indent > config::kMaxMarkerIndent) {
        return info;
    }

    const size_t line_end = info.line_end;
    char c = source[pos];
    size_t run = run_end(source, pos, line_end, c);
    size_t run_length = run - pos;
    bool rest_blank = is_blank_range(source, run, line_end);

    auto finish = [&](LineClass cls, size_t marker_end) {
        info.line_class = cls;
        info.marker = c;
        info.marker_end = marker_end;
        info.content_offset = skip_spaces(source, marker_end, line_end);
        return info;
    };

    // ========================================================================
    // Runs that own the whole line
    // ========================================================================

    if (c == '-' && line_start == options.document_start && run_length == 3 &&
        info.indent == 0 && rest_blank) {
        info.run_length = 3;
        return finish(LineClass::Frontmatter, run);
    }

    if (c == '*' || c == '-' || c == '_') {
        size_t count = 0;
        size_t last = run;
        if (is_thematic_break(source, pos, line_end, c, count, last)) {
            info.run_length = count;
            return finish(LineClass::ThematicBreak, last);
        }
    }

    if (c == '#' && run_length <= config::kMaxAtxLevel &&
        (run == line_end || is_space_or_tab(source[run]))) {
        info.run_length = run_length;
        return finish(LineClass::AtxHeading, run);
    }

    if ((c == '`' || c == '~') && run_length >= config::kMinFenceLength) {
        // A backtick fence's info string cannot contain backticks.
        bool valid = true;
        if (c == '`') {
            for (size_t i = run; i < line_end; ++i) {
                if (source[i] == '`') { valid = false; break; }
            }
        }
        if (valid) {
            info.run_length = run_length;
            return finish(LineClass::FenceOpen, run);
        }
    }

    if (c == '$' && run_length == 2 && rest_blank) {
        info.run_length = 2;
        return finish(LineClass::MathFence, run);
    }

    // ========================================================================
    // Container and list markers
    // ========================================================================

    if (c == '>') {
        info.run_length = 1;
        return finish(LineClass::Blockquote, pos + 1);
    }

    if (rest_blank && (c == '=' || (c == '-' && run_length < 3))) {
        info.run_length = run_length;
        return finish(LineClass::SetextUnderline, run);
    }

    if ((c == '-' || c == '*' || c == '+') && pos + 1 < line_end &&
        is_space_or_tab(source[pos + 1])) {
        info.run_length = 1;
        return finish(LineClass::BulletListItem, pos + 1);
    }

    if (is_ascii_digit(c)) {
        size_t digits_end = pos;
        uint32_t value = 0;
        while (digits_end < line_end && is_ascii_digit(source[digits_end]) &&
               digits_end - pos < config::kMaxOrderedListDigits) {
            value = value * 10 + static_cast<uint32_t>(source[digits_end] - '0');
            ++digits_end;
        }
        if (digits_end + 1 < line_end &&
            (source[digits_end] == '.' || source[digits_end] == ')') &&
            is_space_or_tab(source[digits_end + 1])) {
            info.run_length = digits_end - pos;
            info.ordered_start = value;
            LineInfo result = finish(LineClass::OrderedListItem, digits_end + 1);
            result.marker = source[digits_end];
            return result;
        }
    }

    return info;
}

bool starts_block(LineClass line_class) {
    switch (line_class) {
        case LineClass::AtxHeading:
        case LineClass::Blockquote:
        case LineClass::BulletListItem:
        case LineClass::OrderedListItem:
        case LineClass::ThematicBreak:
        case LineClass::FenceOpen:
        case LineClass::MathFence:
        case LineClass::SetextUnderline:
        case LineClass::Frontmatter:
            return true;
        case LineClass::Blank:
        case LineClass::Paragraph:
            break;
    }
    return false;
}

bool is_single_line_construct(LineClass line_class) {
    return line_class == LineClass::AtxHeading || line_class == LineClass::ThematicBreak ||
           line_class == LineClass::SetextUnderline || line_class == LineClass::Blank;
}

const char* line_class_name(LineClass line_class) {
    switch (line_class) {
        case LineClass::Blank:           return "Blank";
        case LineClass::Paragraph:       return "Paragraph";
        case LineClass::AtxHeading:      return "AtxHeading";
        case LineClass::Blockquote:      return "Blockquote";
        case LineClass::BulletListItem:  return "BulletListItem";
        case LineClass::OrderedListItem: return "OrderedListItem";
        case LineClass::ThematicBreak:   return "ThematicBreak";
        case LineClass::FenceOpen:       return "FenceOpen";
        case LineClass::MathFence:       return "MathFence";
        case LineClass::Frontmatter:     return "Frontmatter";
        case LineClass::SetextUnderline: return "SetextUnderline";
    }
    return "Paragraph";
}

} // namespace marklex::scan
