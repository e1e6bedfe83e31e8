#include <marklex/scan/scanner.h>

#include <algorithm>
#include <string>

namespace marklex::scan {

namespace {

std::string describe_range(size_t begin, size_t end) {
    return "[" + std::to_string(begin) + ", " + std::to_string(end) + "]";
}

core::Severity severity_for(ScannerErrorCode code) {
    return code == ScannerErrorCode::UnknownEntity ? core::Severity::Info
                                                   : core::Severity::Warning;
}

bool span_contains(const RegionSpan& span, size_t position) {
    return span.valid && span.start <= position && position < span.end;
}

} // namespace

InvalidRollback::InvalidRollback(std::ptrdiff_t position, size_t begin, size_t end)
    : std::out_of_range("rollback position " + std::to_string(position) +
                        " is outside " + describe_range(begin, end)),
      position_(position) {}

// ============================================================================
// Setup
// ============================================================================

Scanner::Scanner(ScannerOptions options) : options_(options) {
    if (options_.tab_width != core::config::kDefaultTabWidth &&
        options_.tab_width != core::config::kAlternateTabWidth) {
        throw std::invalid_argument("tab width must be 4 or 8, got " +
                                    std::to_string(options_.tab_width));
    }
    phase1_.configure(options_.tab_width, 0);
}

void Scanner::set_text(std::string_view source, size_t start, std::optional<size_t> length) {
    if (start > source.size()) {
        throw std::out_of_range("scan start " + std::to_string(start) +
                                " is past the end of a " + std::to_string(source.size()) +
                                " byte buffer");
    }
    size_t end = source.size();
    if (length) {
        if (*length > source.size() - start) {
            throw std::out_of_range("scan length " + std::to_string(*length) + " from " +
                                    std::to_string(start) + " overruns a " +
                                    std::to_string(source.size()) + " byte buffer");
        }
        end = start + *length;
    }

    source_ = source;
    begin_ = start;
    end_ = end;
    tracker_.reset(source_, begin_, end_, options_.tab_width);
    phase1_.configure(options_.tab_width, begin_);

    raw_regions_.clear();
    fence_regions_.clear();
    reported_.clear();
    pending_.clear();
    speculation_depth_ = 0;
    segment_loaded_ = false;
    text_cached_ = false;

    SegmentEntry entry;
    entry.cursor = tracker_.start();
    entry.kind = RollbackKind::DocumentStart;
    load_segment(entry);

    state_.next_token = 0;
    state_.token = Token{};
    state_.token.start = begin_;
    state_.token.end = begin_;
    state_.token_position = entry.cursor;
    state_.cursor = entry.cursor;
}

// ============================================================================
// Scanning
// ============================================================================

TokenKind Scanner::scan() {
    text_cached_ = false;

    while (state_.next_token >= tokens_.size()) {
        const SegmentEntry& next = segment_result_.next;
        if (segment_result_.stop_offset >= end_) {
            state_.token_position = state_.cursor;
            state_.token = Token{};
            state_.token.kind = TokenKind::EndOfFileToken;
            state_.token.start = end_;
            state_.token.end = end_;
            if (state_.cursor.at_line_start && state_.cursor.preceding_line_break) {
                state_.token.flags |= token_flags::PrecedingLineBreak;
            }
            return state_.token.kind;
        }
        if (next.cursor.offset <= state_.segment.cursor.offset) {
            throw std::logic_error("scanner made no progress at offset " +
                                   std::to_string(state_.segment.cursor.offset));
        }
        load_segment(next);
        state_.next_token = 0;
    }

    state_.token = tokens_[state_.next_token++];
    state_.token_position = state_.cursor;
    tracker_.advance(state_.cursor, state_.token.end);
    return state_.token.kind;
}

const std::string& Scanner::token_text() const {
    if (!text_cached_) {
        text_cache_ = materialize_text(source_, state_.token);
        text_cached_ = true;
    }
    return text_cache_;
}

std::string Scanner::token_value() const {
    return materialize_value(source_, state_.token);
}

LexicalMode Scanner::mode() const {
    if (state_.token.flags & token_flags::IsInRawText) return LexicalMode::RawText;
    if (state_.token.flags & token_flags::IsInRcdata) return LexicalMode::Rcdata;
    if (state_.token.kind == TokenKind::Unknown) return state_.segment.modes.mode();
    return LexicalMode::Normal;
}

void Scanner::load_segment(SegmentEntry entry) {
    records_.clear();
    lines_.clear();
    segment_issues_.clear();

    segment_result_ = phase1_.scan(source_, end_, entry, records_, lines_, segment_issues_);
    Cursor next_cursor = entry.cursor;
    tracker_.advance(next_cursor, segment_result_.stop_offset);
    segment_result_.next.cursor = next_cursor;

    SegmentInput input;
    input.source = source_;
    input.region_begin = begin_;
    input.region_end = end_;
    input.entry = &entry;
    input.result = &segment_result_;
    input.records = &records_;
    input.lines = &lines_;
    phase2_.assemble(input, tokens_, segment_issues_);

    state_.segment = entry;
    segment_loaded_ = true;
    note_regions(segment_result_);
    for (const auto& issue : segment_issues_) {
        queue_issue(issue);
    }
}

void Scanner::note_regions(const ProvisionalResult& result) {
    if (result.raw_content.valid) {
        auto known = std::find_if(raw_regions_.begin(), raw_regions_.end(),
                                  [&](const RawRegion& r) {
                                      return r.span.start == result.raw_content.start;
                                  });
        if (known == raw_regions_.end()) {
            raw_regions_.push_back({result.raw_frame, result.raw_content});
        }
    }
    if (result.fence_content.valid) {
        auto known = std::find_if(fence_regions_.begin(), fence_regions_.end(),
                                  [&](const FenceRegion& r) {
                                      return r.span.start == result.fence_content.start;
                                  });
        if (known == fence_regions_.end()) {
            fence_regions_.push_back({result.fence, result.fence_content});
        }
    }
}

// ============================================================================
// Rollback
// ============================================================================

RollbackCheckpoint Scanner::checkpoint(RollbackKind kind) const {
    RollbackCheckpoint saved;
    saved.state = state_;
    saved.kind = kind;
    return saved;
}

void Scanner::rollback(const RollbackCheckpoint& checkpoint) {
    const ScannerState& target = checkpoint.state;
    if (!segment_loaded_ || target.segment != state_.segment) {
        load_segment(target.segment);
    }
    state_ = target;
    text_cached_ = false;
}

SegmentEntry Scanner::entry_at(size_t position, RollbackKind kind) {
    SegmentEntry entry;
    entry.cursor = tracker_.locate(position);
    entry.kind = kind;

    if (kind == RollbackKind::RawTextContent) {
        for (const auto& region : raw_regions_) {
            if (span_contains(region.span, position)) {
                entry.modes.push(region.frame);
                break;
            }
        }
    } else if (kind == RollbackKind::CodeBlockContent) {
        for (const auto& region : fence_regions_) {
            if (span_contains(region.span, position)) {
                entry.fence = region.fence;
                break;
            }
        }
    }
    return entry;
}

void Scanner::rollback(std::ptrdiff_t position, RollbackKind kind) {
    if (position < 0 || static_cast<size_t>(position) < begin_ ||
        static_cast<size_t>(position) > end_) {
        InvalidRollback error(position, begin_, end_);
        if (diagnostics_) {
            const size_t at = position < 0 ? begin_ : std::min(static_cast<size_t>(position), end_);
            diagnostics_->emit_at(core::Severity::Error, core::config::kScannerModule,
                                  "rollback", 0, core::SourceRange{at, at}, error.what());
        }
        throw error;
    }

    const size_t at = static_cast<size_t>(position);
    SegmentEntry entry = entry_at(at, kind);
    load_segment(entry);

    state_.next_token = 0;
    state_.token = Token{};
    state_.token.start = at;
    state_.token.end = at;
    state_.token_position = entry.cursor;
    state_.cursor = entry.cursor;
    text_cached_ = false;
}

// ============================================================================
// Diagnostics
// ============================================================================

void Scanner::queue_issue(const ScanIssue& issue) {
    for (const auto& seen : reported_) {
        if (seen.same_report(issue)) return;
    }
    reported_.push_back(issue);
    pending_.push_back(issue);
    if (speculation_depth_ == 0) {
        flush_diagnostics();
    }
}

void Scanner::flush_diagnostics() {
    if (diagnostics_) {
        for (const auto& issue : pending_) {
            diagnostics_->emit_at(severity_for(issue.code), core::config::kScannerModule,
                                  scan_stage_name(issue.stage),
                                  static_cast<uint32_t>(issue.code),
                                  core::SourceRange{issue.start, issue.end},
                                  scanner_error_message(issue.code));
        }
    }
    pending_.clear();
}

Scanner::SpeculationMark Scanner::begin_speculation() {
    ++speculation_depth_;
    SpeculationMark mark;
    mark.reported = reported_.size();
    mark.pending = pending_.size();
    return mark;
}

void Scanner::end_speculation(const SpeculationMark& mark, bool keep) {
    --speculation_depth_;
    if (!keep) {
        reported_.resize(std::min(reported_.size(), mark.reported));
        pending_.resize(std::min(pending_.size(), mark.pending));
    }
    if (speculation_depth_ == 0) {
        flush_diagnostics();
    }
}

// ============================================================================
// Debugging
// ============================================================================

void Scanner::fill_debug_state(ScannerDebugState& out) const {
    out.offset = state_.token_position.offset;
    out.line = state_.token_position.line;
    out.column = state_.token_position.column;
    out.mode = lexical_mode_name(mode());
    out.at_line_start = state_.token_position.at_line_start;
    out.preceding_line_break = state_.token_position.preceding_line_break;
    out.token = state_.token.kind;
    out.token_text = token_text();
    out.token_flags = state_.token.flags;
    out.next_offset = state_.cursor.offset;
    out.segment_end = segment_loaded_ ? stop_reason_name(segment_result_.reason) : "";
}

} // namespace marklex::scan
