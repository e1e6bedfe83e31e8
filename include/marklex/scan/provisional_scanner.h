#pragma once
#include <marklex/scan/line_classifier.h>
#include <marklex/scan/mode_stack.h>
#include <marklex/scan/position_tracker.h>
#include <marklex/scan/provisional_record.h>
#include <marklex/scan/scan_issue.h>
#include <marklex/scan/token.h>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace marklex::scan {

enum class FenceKind : uint8_t {
    None,
    Code,         // ``` or ~~~
    Math,         // $$
    Frontmatter,  // --- at the document start
};

struct FenceContext {
    FenceKind kind = FenceKind::None;
    char marker = 0;
    uint32_t length = 0;

    bool active() const { return kind != FenceKind::None; }
    bool operator==(const FenceContext& other) const {
        return kind == other.kind && marker == other.marker && length == other.length;
    }
    bool operator!=(const FenceContext& other) const { return !(*this == other); }
};

// Scanner context at a resolution point. Segments are a pure function of the
// buffer, the options and this value.
struct SegmentEntry {
    Cursor cursor;
    uint32_t blank_lines = 0;
    ModeStack modes;
    FenceContext fence;
    RollbackKind kind = RollbackKind::DocumentStart;

    bool operator==(const SegmentEntry& other) const {
        return cursor == other.cursor && blank_lines == other.blank_lines &&
               modes == other.modes && fence == other.fence && kind == other.kind;
    }
    bool operator!=(const SegmentEntry& other) const { return !(*this == other); }
};

enum class StopReason : uint8_t {
    EndOfInput,
    BeforeBlankLine,
    AfterBlankLine,
    BlockStart,
    SingleLineConstruct,
    FenceClosed,
    RawTextClosed,
    ModeSwitch,
};

// A classified line inside the segment. Its marker, when it has one, is a
// record of its own starting at info.marker_offset.
struct SegmentLine {
    LineInfo info;
    bool fence_close = false;
};

// Verbatim region seen while scanning; used to resume inside it on rollback.
struct RegionSpan {
    size_t start = 0;
    size_t end = 0;       // end of the content, or of the buffer when unterminated
    bool valid = false;
};

struct ProvisionalResult {
    size_t record_count = 0;
    size_t stop_offset = 0;
    StopReason reason = StopReason::EndOfInput;
    SegmentEntry next;             // cursor is filled in by the caller

    FenceContext fence;            // fence the segment opened or resumed in
    bool fence_unterminated = false;
    RegionSpan fence_content;
    ModeFrame raw_frame;           // raw text the segment resumed in
    RegionSpan raw_content;
};

const char* stop_reason_name(StopReason reason);

// Phase 1. Walks the buffer once from a segment entry to the next resolution
// point, appending packed records. Allocates only when the caller's buffers
// grow.
class ProvisionalScanner {
public:
    ProvisionalScanner() = default;
    ProvisionalScanner(uint32_t tab_width, size_t document_start);

    void configure(uint32_t tab_width, size_t document_start);

    ProvisionalResult scan(std::string_view source, size_t end, const SegmentEntry& entry,
                           std::vector<uint32_t>& records, std::vector<SegmentLine>& lines,
                           std::vector<ScanIssue>& issues);

private:
    // Record emission
    void push(RecordShape shape, size_t length, bool open_ended = false);
    void push_text(size_t length);
    void push_whitespace(size_t length);
    void seal() { barrier_ = records_->size(); }

    // Scanning
    void scan_inline_char();
    void scan_newline();
    void mark_open_ended();
    bool scan_raw_content(ModeStack& modes, ProvisionalResult& result);
    bool scan_fence_lines(const FenceContext& fence, bool mid_line, ProvisionalResult& result);
    void scan_line_marker(const LineInfo& info);
    void scan_fence_open_line(const LineInfo& info);
    void scan_markup();
    void report(ScannerErrorCode code, size_t start, size_t end);

    uint32_t tab_width_ = 4;
    size_t document_start_ = 0;

    // Per-scan state
    std::string_view source_;
    size_t end_ = 0;
    size_t pos_ = 0;
    size_t barrier_ = 0;            // records below this index never merge
    size_t first_record_ = 0;
    std::vector<uint32_t>* records_ = nullptr;
    std::vector<SegmentLine>* lines_ = nullptr;
    std::vector<ScanIssue>* issues_ = nullptr;
    bool pending_mode_switch_ = false;
    ModeFrame pending_frame_;
    size_t pending_tag_start_ = 0;
};

} // namespace marklex::scan
