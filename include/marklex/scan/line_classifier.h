#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace marklex::scan {

enum class LineClass : uint8_t {
    Blank,
    Paragraph,
    AtxHeading,
    Blockquote,
    BulletListItem,
    OrderedListItem,
    ThematicBreak,
    FenceOpen,
    MathFence,
    Frontmatter,
    SetextUnderline,
};

struct LineInfo {
    LineClass line_class = LineClass::Paragraph;
    char marker = 0;
    size_t run_length = 0;        // marker characters, or digits of an ordered marker
    uint32_t indent = 0;          // columns before the marker
    size_t marker_offset = 0;     // first non-blank byte
    size_t marker_end = 0;        // one past the marker (delimiter included)
    size_t content_offset = 0;    // first non-blank byte after the marker
    size_t line_end = 0;          // offset of the line break, or end
    size_t next_line = 0;         // offset after the line break
    uint32_t ordered_start = 0;
};

struct LineClassifierOptions {
    uint32_t tab_width = 4;
    size_t document_start = 0;    // frontmatter is only recognized here
};

// Classifies the line starting at `line_start`. Markers indented by more than
// three columns are ordinary paragraph text.
LineInfo classify_line(std::string_view source, size_t line_start, size_t end,
                       const LineClassifierOptions& options);

// Lines whose class ends the segment in front of them.
bool starts_block(LineClass line_class);

// Lines that are a segment of their own.
bool is_single_line_construct(LineClass line_class);

// Offset after the line break that ends the line containing `pos`.
size_t find_next_line(std::string_view source, size_t pos, size_t end, size_t* line_end = nullptr);

bool is_blank_range(std::string_view source, size_t from, size_t to);

// A line that closes a fence opened with `length` copies of `marker`: the same
// character exactly `length` times, then only spaces or tabs.
bool is_fence_close(std::string_view source, size_t line_start, size_t end, char marker,
                    size_t length, uint32_t tab_width);

const char* line_class_name(LineClass line_class);

} // namespace marklex::scan
