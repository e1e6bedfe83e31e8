#include <marklex/scan/position_tracker.h>
#include <marklex/scan/char_codes.h>

#include <algorithm>

namespace marklex::scan {

void PositionTracker::reset(std::string_view source, size_t begin, size_t end,
                            uint32_t tab_width) {
    source_ = source;
    begin_ = begin;
    end_ = end;
    tab_width_ = tab_width;
    line_starts_.clear();
    line_starts_.push_back(begin);
    indexed_to_ = begin;
}

Cursor PositionTracker::start() const {
    Cursor c;
    c.offset = begin_;
    c.line_start = begin_;
    return c;
}

uint32_t PositionTracker::next_column(uint32_t column, char c) const {
    if (c == '\t') {
        uint32_t zero_based = column - 1;
        return (zero_based / tab_width_ + 1) * tab_width_ + 1;
    }
    // UTF-8 continuation bytes do not occupy a column of their own.
    if ((static_cast<unsigned char>(c) & 0xC0) == 0x80) return column;
    return column + 1;
}

void PositionTracker::note_line_start(size_t offset) {
    if (offset > line_starts_.back()) {
        line_starts_.push_back(offset);
    }
}

void PositionTracker::advance(Cursor& cursor, size_t to) {
    if (to > end_) to = end_;
    size_t pos = cursor.offset;
    while (pos < to) {
        char c = source_[pos];
        if (is_line_break(c)) {
            if (c == '\r' && pos + 1 < end_ && source_[pos + 1] == '\n') {
                ++pos;
            }
            ++pos;
            ++cursor.line;
            cursor.column = 1;
            cursor.line_start = pos;
            cursor.at_line_start = true;
            cursor.preceding_line_break = true;
            if (pos > indexed_to_) {
                note_line_start(pos);
                indexed_to_ = pos;
            }
            continue;
        }
        cursor.column = next_column(cursor.column, c);
        if (!is_space_or_tab(c)) {
            cursor.at_line_start = false;
            cursor.preceding_line_break = false;
        }
        ++pos;
    }
    cursor.offset = pos;
    if (pos > indexed_to_) indexed_to_ = pos;
}

void PositionTracker::index_until(size_t position) {
    size_t pos = indexed_to_;
    while (pos < position && pos < end_) {
        char c = source_[pos];
        if (is_line_break(c)) {
            if (c == '\r' && pos + 1 < end_ && source_[pos + 1] == '\n') {
                ++pos;
            }
            ++pos;
            note_line_start(pos);
            continue;
        }
        ++pos;
    }
    if (pos > indexed_to_) indexed_to_ = pos;
}

Cursor PositionTracker::locate(size_t position) {
    if (position < begin_) position = begin_;
    if (position > end_) position = end_;
    index_until(position);

    // Last indexed line start at or before `position`.
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), position);
    size_t line_index = static_cast<size_t>(it - line_starts_.begin()) - 1;

    Cursor cursor;
    cursor.line = static_cast<uint32_t>(line_index + 1);
    cursor.line_start = line_starts_[line_index];
    cursor.offset = cursor.line_start;
    cursor.at_line_start = true;
    cursor.preceding_line_break = line_index > 0;

    // A position between '\r' and '\n' belongs to the line the pair ends.
    for (size_t pos = cursor.line_start; pos < position; ++pos) {
        char c = source_[pos];
        cursor.column = next_column(cursor.column, c);
        if (!is_space_or_tab(c)) {
            cursor.at_line_start = false;
            cursor.preceding_line_break = false;
        }
    }
    cursor.offset = position;
    return cursor;
}

} // namespace marklex::scan
