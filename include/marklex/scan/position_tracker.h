#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace marklex::scan {

// Position of the scan cursor. Value type; copied into checkpoints.
struct Cursor {
    size_t offset = 0;
    uint32_t line = 1;      // 1-based
    uint32_t column = 1;    // 1-based, tabs expanded
    size_t line_start = 0;
    bool at_line_start = true;        // only spaces/tabs since line_start
    bool preceding_line_break = false; // a line break precedes this line

    bool operator==(const Cursor& other) const {
        return offset == other.offset && line == other.line &&
               column == other.column && line_start == other.line_start &&
               at_line_start == other.at_line_start &&
               preceding_line_break == other.preceding_line_break;
    }
    bool operator!=(const Cursor& other) const { return !(*this == other); }
};

// Tracks line and column over a borrowed buffer. Treats "\r\n" as a single
// break. Line starts are indexed as they are discovered so that any earlier
// position can be located without walking from the beginning.
class PositionTracker {
public:
    void reset(std::string_view source, size_t begin, size_t end, uint32_t tab_width);

    Cursor start() const;

    // Moves `cursor` forward to `to` (clamped to the end of the region).
    void advance(Cursor& cursor, size_t to);

    // Cursor for an arbitrary position inside [begin, end].
    Cursor locate(size_t position);

    size_t begin() const { return begin_; }
    size_t end() const { return end_; }
    uint32_t tab_width() const { return tab_width_; }
    size_t indexed_lines() const { return line_starts_.size(); }

    // Column reached after `c` when currently at `column`.
    uint32_t next_column(uint32_t column, char c) const;

private:
    void index_until(size_t position);
    void note_line_start(size_t offset);

    std::string_view source_;
    size_t begin_ = 0;
    size_t end_ = 0;
    uint32_t tab_width_ = 4;
    std::vector<size_t> line_starts_;
    size_t indexed_to_ = 0;
};

} // namespace marklex::scan
