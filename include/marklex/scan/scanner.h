#pragma once
#include <marklex/core/config.h>
#include <marklex/core/diagnostics.h>
#include <marklex/scan/mode_stack.h>
#include <marklex/scan/position_tracker.h>
#include <marklex/scan/provisional_scanner.h>
#include <marklex/scan/scan_issue.h>
#include <marklex/scan/semantic_assembler.h>
#include <marklex/scan/token.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace marklex::scan {

struct ScannerOptions {
    uint32_t tab_width = core::config::kDefaultTabWidth;  // 4 or 8
};

// Thrown by rollback(position, kind) for a position outside the bound region.
class InvalidRollback : public std::out_of_range {
public:
    InvalidRollback(std::ptrdiff_t position, size_t begin, size_t end);

    std::ptrdiff_t position() const { return position_; }

private:
    std::ptrdiff_t position_;
};

// Complete scanner position. Plain value; holds no heap memory.
struct ScannerState {
    SegmentEntry segment;     // entry of the segment the token belongs to
    size_t next_token = 0;    // index of the next token inside that segment
    Token token;
    Cursor token_position;    // start of `token`
    Cursor cursor;            // end of `token`
};

struct RollbackCheckpoint {
    ScannerState state;
    RollbackKind kind = RollbackKind::ContentModeBoundary;
};

struct ScannerDebugState {
    size_t offset = 0;
    uint32_t line = 1;
    uint32_t column = 1;
    std::string mode;
    bool at_line_start = true;
    bool preceding_line_break = false;
    TokenKind token = TokenKind::Unknown;
    std::string token_text;
    uint32_t token_flags = 0;
    size_t next_offset = 0;
    std::string segment_end;  // why the current segment stopped; empty before the first scan
};

class Scanner {
public:
    explicit Scanner(ScannerOptions options = {});

    // Binds [start, start + length) of `source` and resets all state. The
    // buffer is borrowed and must outlive the scanner.
    void set_text(std::string_view source, size_t start = 0,
                  std::optional<size_t> length = std::nullopt);

    TokenKind scan();

    TokenKind token() const { return state_.token.kind; }
    const std::string& token_text() const;
    std::string token_value() const;
    uint32_t token_flags() const { return state_.token.flags; }
    size_t token_start() const { return state_.token.start; }
    size_t token_end() const { return state_.token.end; }
    const Token& token_descriptor() const { return state_.token; }

    // Start value of an ordered list marker, -1 for any other token.
    int64_t ordered_list_start() const { return state_.token.ordered_start; }

    uint32_t line() const { return state_.token_position.line; }
    uint32_t column() const { return state_.token_position.column; }
    LexicalMode mode() const;

    size_t start_offset() const { return begin_; }
    size_t end_offset() const { return end_; }
    const ScannerOptions& options() const { return options_; }

    RollbackCheckpoint checkpoint(RollbackKind kind = RollbackKind::ContentModeBoundary) const;
    void rollback(const RollbackCheckpoint& checkpoint);
    void rollback(std::ptrdiff_t position, RollbackKind kind);

    // Runs `fn` and restores the scanner afterwards, whatever it returns.
    // Diagnostics raised inside are dropped.
    template <typename Fn>
    auto look_ahead(Fn&& fn) -> decltype(fn());

    // Runs `fn` and keeps its effects only when the result is truthy.
    template <typename Fn>
    auto try_scan(Fn&& fn) -> decltype(fn());

    void fill_debug_state(ScannerDebugState& out) const;

    // Not owned. Pass nullptr to stop reporting.
    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }

private:
    struct SpeculationMark {
        size_t reported = 0;
        size_t pending = 0;
    };

    struct RawRegion {
        ModeFrame frame;
        RegionSpan span;
    };

    struct FenceRegion {
        FenceContext fence;
        RegionSpan span;
    };

    void load_segment(SegmentEntry entry);
    void note_regions(const ProvisionalResult& result);
    SegmentEntry entry_at(size_t position, RollbackKind kind);

    void queue_issue(const ScanIssue& issue);
    void flush_diagnostics();
    SpeculationMark begin_speculation();
    void end_speculation(const SpeculationMark& mark, bool keep);

    ScannerOptions options_;
    std::string_view source_;
    size_t begin_ = 0;
    size_t end_ = 0;

    PositionTracker tracker_;
    ProvisionalScanner phase1_;
    SemanticAssembler phase2_;

    // Reused across segments.
    std::vector<uint32_t> records_;
    std::vector<SegmentLine> lines_;
    std::vector<Token> tokens_;
    std::vector<ScanIssue> segment_issues_;
    ProvisionalResult segment_result_;
    bool segment_loaded_ = false;

    ScannerState state_;

    std::vector<RawRegion> raw_regions_;
    std::vector<FenceRegion> fence_regions_;

    core::DiagnosticEmitter* diagnostics_ = nullptr;
    std::vector<ScanIssue> reported_;
    std::vector<ScanIssue> pending_;
    int speculation_depth_ = 0;

    mutable std::string text_cache_;
    mutable bool text_cached_ = false;
};

template <typename Fn>
auto Scanner::look_ahead(Fn&& fn) -> decltype(fn()) {
    using Result = decltype(fn());
    const RollbackCheckpoint saved = checkpoint(state_.segment.kind);
    const SpeculationMark mark = begin_speculation();
    try {
        if constexpr (std::is_void_v<Result>) {
            fn();
            rollback(saved);
            end_speculation(mark, false);
        } else {
            Result result = fn();
            rollback(saved);
            end_speculation(mark, false);
            return result;
        }
    } catch (...) {
        rollback(saved);
        end_speculation(mark, false);
        throw;
    }
}

template <typename Fn>
auto Scanner::try_scan(Fn&& fn) -> decltype(fn()) {
    const RollbackCheckpoint saved = checkpoint(state_.segment.kind);
    const SpeculationMark mark = begin_speculation();
    try {
        auto result = fn();
        if (!result) {
            rollback(saved);
            end_speculation(mark, false);
        } else {
            end_speculation(mark, true);
        }
        return result;
    } catch (...) {
        rollback(saved);
        end_speculation(mark, false);
        throw;
    }
}

} // namespace marklex::scan
