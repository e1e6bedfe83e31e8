#include <marklex/scan/provisional_scanner.h>
#include <marklex/core/config.h>
#include <marklex/scan/char_codes.h>
#include <marklex/scan/entity_resolver.h>
#include <marklex/scan/markup_matcher.h>

#include <algorithm>

namespace marklex::scan {

const char* record_shape_name(RecordShape shape) {
    switch (shape) {
        case RecordShape::None:                      return "None";
        case RecordShape::Text:                      return "Text";
        case RecordShape::Whitespace:                return "Whitespace";
        case RecordShape::Newline:                   return "Newline";
        case RecordShape::Punctuation:               return "Punctuation";
        case RecordShape::Entity:                    return "Entity";
        case RecordShape::Escape:                    return "Escape";
        case RecordShape::HtmlTag:                   return "HtmlTag";
        case RecordShape::HtmlComment:               return "HtmlComment";
        case RecordShape::HtmlCData:                 return "HtmlCData";
        case RecordShape::HtmlDoctype:               return "HtmlDoctype";
        case RecordShape::HtmlProcessingInstruction: return "HtmlProcessingInstruction";
        case RecordShape::Autolink:                  return "Autolink";
        case RecordShape::RawText:                   return "RawText";
        case RecordShape::CodeLine:                  return "CodeLine";
    }
    return "None";
}

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
        case StopReason::EndOfInput:          return "EndOfInput";
        case StopReason::BeforeBlankLine:     return "BeforeBlankLine";
        case StopReason::AfterBlankLine:      return "AfterBlankLine";
        case StopReason::BlockStart:          return "BlockStart";
        case StopReason::SingleLineConstruct: return "SingleLineConstruct";
        case StopReason::FenceClosed:         return "FenceClosed";
        case StopReason::RawTextClosed:       return "RawTextClosed";
        case StopReason::ModeSwitch:          return "ModeSwitch";
    }
    return "EndOfInput";
}

static RollbackKind kind_after(StopReason reason) {
    switch (reason) {
        case StopReason::AfterBlankLine: return RollbackKind::BlankLineBoundary;
        case StopReason::ModeSwitch:     return RollbackKind::RawTextContent;
        case StopReason::RawTextClosed:  return RollbackKind::HtmlTagBoundary;
        default:                         return RollbackKind::ContentModeBoundary;
    }
}

static ScannerErrorCode unterminated_code(MarkupKind kind) {
    switch (kind) {
        case MarkupKind::CData:                 return ScannerErrorCode::UnterminatedCDATA;
        case MarkupKind::Doctype:               return ScannerErrorCode::UnterminatedDoctype;
        case MarkupKind::ProcessingInstruction: return ScannerErrorCode::UnterminatedProcessingInstruction;
        default:                                return ScannerErrorCode::UnterminatedComment;
    }
}

static FenceKind fence_kind_for(LineClass line_class) {
    switch (line_class) {
        case LineClass::FenceOpen:   return FenceKind::Code;
        case LineClass::MathFence:   return FenceKind::Math;
        case LineClass::Frontmatter: return FenceKind::Frontmatter;
        default:                     return FenceKind::None;
    }
}

static LineClass line_class_for(FenceKind kind) {
    switch (kind) {
        case FenceKind::Math:        return LineClass::MathFence;
        case FenceKind::Frontmatter: return LineClass::Frontmatter;
        default:                     return LineClass::FenceOpen;
    }
}

ProvisionalScanner::ProvisionalScanner(uint32_t tab_width, size_t document_start) {
    configure(tab_width, document_start);
}

void ProvisionalScanner::configure(uint32_t tab_width, size_t document_start) {
    tab_width_ = tab_width;
    document_start_ = document_start;
}

// ============================================================================
// Record emission
// ============================================================================

void ProvisionalScanner::push(RecordShape shape, size_t length, bool open_ended) {
    const size_t cap = core::config::kMaxRecordLength;
    while (length > cap) {
        records_->push_back(pack_record(shape, static_cast<uint32_t>(cap)));
        length -= cap;
    }
    if (length > 0) {
        records_->push_back(pack_record(shape, static_cast<uint32_t>(length), open_ended));
    }
}

void ProvisionalScanner::push_text(size_t length) {
    auto& records = *records_;
    size_t n = records.size();
    uint32_t extra = static_cast<uint32_t>(length);

    if (n > barrier_ && record_shape(records[n - 1]) == RecordShape::Text &&
        record_can_grow(records[n - 1], extra)) {
        records[n - 1] = grow_record(records[n - 1], extra);
        return;
    }

    // word<space>word folds into a single record
    if (n >= barrier_ + 2 && record_shape(records[n - 1]) == RecordShape::Whitespace &&
        record_length(records[n - 1]) == 1 && source_[pos_ - 1] == ' ' &&
        record_shape(records[n - 2]) == RecordShape::Text &&
        record_can_grow(records[n - 2], extra + 1)) {
        records.pop_back();
        records[n - 2] = grow_record(records[n - 2], extra + 1);
        return;
    }

    push(RecordShape::Text, length);
}

void ProvisionalScanner::push_whitespace(size_t length) {
    auto& records = *records_;
    size_t n = records.size();
    uint32_t extra = static_cast<uint32_t>(length);
    if (n > barrier_ && record_shape(records[n - 1]) == RecordShape::Whitespace &&
        record_can_grow(records[n - 1], extra)) {
        records[n - 1] = grow_record(records[n - 1], extra);
        return;
    }
    push(RecordShape::Whitespace, length);
}

void ProvisionalScanner::mark_open_ended() {
    if (records_->size() > first_record_) {
        records_->back() |= record_layout::kOpenEndedBit;
    }
}

void ProvisionalScanner::report(ScannerErrorCode code, size_t start, size_t end) {
    ScanIssue issue;
    issue.code = code;
    issue.stage = ScanStage::Phase1;
    issue.start = start;
    issue.end = end;
    issues_->push_back(issue);
}

// ============================================================================
// Main loop
// ============================================================================

ProvisionalResult ProvisionalScanner::scan(std::string_view source, size_t end,
                                           const SegmentEntry& entry,
                                           std::vector<uint32_t>& records,
                                           std::vector<SegmentLine>& lines,
                                           std::vector<ScanIssue>& issues) {
    source_ = source;
    end_ = std::min(end, source.size());
    pos_ = std::min(entry.cursor.offset, end_);
    records_ = &records;
    lines_ = &lines;
    issues_ = &issues;
    first_record_ = records.size();
    barrier_ = records.size();
    pending_mode_switch_ = false;

    ProvisionalResult result;
    result.next = entry;
    result.next.blank_lines = 0;
    ModeStack& modes = result.next.modes;
    FenceContext& fence = result.next.fence;

    LineClassifierOptions line_options;
    line_options.tab_width = tab_width_;
    line_options.document_start = document_start_;

    bool line_begin = entry.cursor.offset == entry.cursor.line_start;
    bool first_line = line_begin;
    bool single_line_pending = false;
    StopReason reason = StopReason::EndOfInput;

    while (pos_ < end_) {
        if (modes.mode() != LexicalMode::Normal) {
            if (scan_raw_content(modes, result)) {
                reason = StopReason::RawTextClosed;
                break;
            }
            continue;
        }

        if (fence.active()) {
            if (!result.fence.active()) result.fence = fence;
            if (scan_fence_lines(fence, !line_begin, result)) {
                fence = FenceContext{};
                reason = StopReason::FenceClosed;
            } else {
                result.fence_unterminated = true;
            }
            break;
        }

        if (line_begin) {
            line_begin = false;
            LineInfo info = classify_line(source_, pos_, end_, line_options);

            if (info.line_class == LineClass::Blank) {
                if (!first_line) {
                    reason = StopReason::BeforeBlankLine;
                    break;
                }
                if (info.line_end > pos_) push_whitespace(info.line_end - pos_);
                pos_ = info.line_end;
                if (pos_ < end_) scan_newline();
                result.next.blank_lines = entry.blank_lines + 1;
                if (pos_ < end_) reason = StopReason::AfterBlankLine;
                break;
            }

            if (!first_line && starts_block(info.line_class)) {
                reason = StopReason::BlockStart;
                break;
            }
            first_line = false;

            if (info.line_class == LineClass::Paragraph) continue;

            lines.push_back(SegmentLine{info, false});
            FenceKind fence_kind = fence_kind_for(info.line_class);
            if (fence_kind != FenceKind::None) {
                scan_fence_open_line(info);
                fence.kind = fence_kind;
                fence.marker = info.marker;
                fence.length = static_cast<uint32_t>(info.run_length);
                result.fence = fence;
                line_begin = true;
                continue;
            }

            scan_line_marker(info);
            single_line_pending = is_single_line_construct(info.line_class);
            continue;
        }

        if (is_line_break(source_[pos_])) {
            scan_newline();
            line_begin = true;
            if (single_line_pending) {
                reason = StopReason::SingleLineConstruct;
                break;
            }
            continue;
        }

        scan_inline_char();

        if (pending_mode_switch_) {
            pending_mode_switch_ = false;
            // A full stack leaves the tag inline.
            if (modes.push(pending_frame_)) {
                if (pos_ >= end_) {
                    report(ScannerErrorCode::UnterminatedRawText, pending_tag_start_, end_);
                } else {
                    reason = StopReason::ModeSwitch;
                    break;
                }
            }
        }
    }

    // An opening line that ends the buffer leaves the fence open too.
    if (fence.active() && reason != StopReason::FenceClosed) {
        result.fence_unterminated = true;
    }

    if (pos_ >= end_ && reason != StopReason::FenceClosed &&
        reason != StopReason::RawTextClosed && reason != StopReason::SingleLineConstruct) {
        reason = StopReason::EndOfInput;
    }

    result.record_count = records.size() - first_record_;
    result.stop_offset = pos_;
    result.reason = reason;
    result.next.kind = kind_after(reason);
    return result;
}

// ============================================================================
// Lines
// ============================================================================

void ProvisionalScanner::scan_newline() {
    size_t length = 1;
    if (source_[pos_] == '\r' && pos_ + 1 < end_ && source_[pos_ + 1] == '\n') length = 2;
    push(RecordShape::Newline, length);
    seal();
    pos_ += length;
}

void ProvisionalScanner::scan_line_marker(const LineInfo& info) {
    if (info.marker_offset > pos_) {
        push_whitespace(info.marker_offset - pos_);
        seal();
    }
    push(RecordShape::Punctuation, info.marker_end - info.marker_offset);
    seal();
    pos_ = info.marker_end;
}

void ProvisionalScanner::scan_fence_open_line(const LineInfo& info) {
    scan_line_marker(info);

    size_t content_end = info.line_end;
    while (content_end > info.content_offset && is_space_or_tab(source_[content_end - 1])) {
        --content_end;
    }

    if (info.content_offset > pos_) {
        push_whitespace(info.content_offset - pos_);
        seal();
        pos_ = info.content_offset;
    }

    // Info string: first word, then the remainder as written.
    if (content_end > pos_) {
        size_t word_end = pos_;
        while (word_end < content_end && !is_space_or_tab(source_[word_end])) ++word_end;
        push(RecordShape::Text, word_end - pos_);
        seal();
        pos_ = word_end;

        if (content_end > pos_) {
            size_t rest = pos_;
            while (rest < content_end && is_space_or_tab(source_[rest])) ++rest;
            push_whitespace(rest - pos_);
            seal();
            pos_ = rest;
            push(RecordShape::Text, content_end - pos_);
            seal();
            pos_ = content_end;
        }
    }

    if (info.line_end > pos_) {
        push_whitespace(info.line_end - pos_);
        seal();
        pos_ = info.line_end;
    }
    if (pos_ < end_) scan_newline();
}

bool ProvisionalScanner::scan_fence_lines(const FenceContext& fence, bool mid_line,
                                          ProvisionalResult& result) {
    result.fence_content.start = pos_;
    result.fence_content.valid = true;

    if (mid_line) {
        size_t line_end = 0;
        find_next_line(source_, pos_, end_, &line_end);
        push(RecordShape::CodeLine, line_end - pos_);
        seal();
        pos_ = line_end;
        if (pos_ < end_) scan_newline();
    }

    while (pos_ < end_) {
        size_t line_end = 0;
        size_t next_line = find_next_line(source_, pos_, end_, &line_end);

        if (is_fence_close(source_, pos_, end_, fence.marker, fence.length, tab_width_)) {
            result.fence_content.end = pos_;

            SegmentLine close;
            close.fence_close = true;
            close.info.line_class = line_class_for(fence.kind);
            close.info.marker = fence.marker;
            close.info.marker_offset = pos_;
            while (is_space_or_tab(source_[close.info.marker_offset])) ++close.info.marker_offset;
            close.info.marker_end = close.info.marker_offset;
            while (close.info.marker_end < line_end && source_[close.info.marker_end] == fence.marker) {
                ++close.info.marker_end;
            }
            close.info.run_length = close.info.marker_end - close.info.marker_offset;
            close.info.content_offset = line_end;
            close.info.line_end = line_end;
            close.info.next_line = next_line;
            lines_->push_back(close);

            scan_line_marker(close.info);
            if (line_end > pos_) {
                push_whitespace(line_end - pos_);
                seal();
                pos_ = line_end;
            }
            if (pos_ < end_) scan_newline();
            return true;
        }

        push(RecordShape::CodeLine, line_end - pos_);
        seal();
        pos_ = line_end;
        if (pos_ < end_) scan_newline();
    }

    result.fence_content.end = end_;
    return false;
}

// ============================================================================
// Raw text and RCDATA
// ============================================================================

bool ProvisionalScanner::scan_raw_content(ModeStack& modes, ProvisionalResult& result) {
    const ModeFrame frame = *modes.top();
    const size_t content_start = pos_;
    result.raw_frame = frame;
    result.raw_content.start = content_start;
    result.raw_content.valid = true;

    size_t close = std::string_view::npos;
    for (size_t i = source_.find('<', pos_); i < end_; i = source_.find('<', i + 1)) {
        if (matches_end_tag(source_, i, end_, frame.tag)) {
            close = i;
            break;
        }
    }
    size_t content_end = close == std::string_view::npos ? end_ : close;

    if (frame.mode == LexicalMode::RawText) {
        push(RecordShape::RawText, content_end - pos_);
    } else {
        size_t run_start = pos_;
        size_t i = pos_;
        while (i < content_end) {
            if (source_[i] == '&') {
                if (auto match = match_entity(source_, i, content_end)) {
                    push(RecordShape::RawText, i - run_start);
                    push(RecordShape::Entity, match->length);
                    i += match->length;
                    run_start = i;
                    continue;
                }
            }
            ++i;
        }
        push(RecordShape::RawText, content_end - run_start);
    }
    seal();
    pos_ = content_end;
    result.raw_content.end = content_end;

    if (close == std::string_view::npos) {
        mark_open_ended();
        report(ScannerErrorCode::UnterminatedRawText, content_start, end_);
        return false;
    }

    size_t gt = source_.find('>', close);
    if (gt == std::string_view::npos || gt >= end_) {
        push(RecordShape::HtmlTag, end_ - close, true);
        pos_ = end_;
    } else {
        push(RecordShape::HtmlTag, gt + 1 - close);
        pos_ = gt + 1;
    }
    seal();
    modes.pop();
    return true;
}

// ============================================================================
// Inline characters
// ============================================================================

void ProvisionalScanner::scan_inline_char() {
    char c = source_[pos_];

    if (is_space_or_tab(c)) {
        size_t run = pos_;
        while (run < end_ && is_space_or_tab(source_[run])) ++run;
        push_whitespace(run - pos_);
        pos_ = run;
        return;
    }

    switch (c) {
        case '&':
            if (auto match = match_entity(source_, pos_, end_)) {
                push(RecordShape::Entity, match->length);
                pos_ += match->length;
            } else {
                push(RecordShape::Punctuation, 1);
                ++pos_;
            }
            return;

        case '\\':
            if (pos_ + 1 < end_ && is_ascii_punctuation(source_[pos_ + 1])) {
                push(RecordShape::Escape, 2);
                pos_ += 2;
            } else {
                push(RecordShape::Punctuation, 1);
                ++pos_;
            }
            return;

        case '<':
            scan_markup();
            return;

        default:
            break;
    }

    if (is_run_char(c)) {
        size_t run = pos_;
        while (run < end_ && source_[run] == c) ++run;
        push(RecordShape::Punctuation, run - pos_);
        pos_ = run;
        return;
    }

    if (is_special_char(c)) {
        push(RecordShape::Punctuation, 1);
        ++pos_;
        return;
    }

    size_t run = pos_ + 1;
    while (run < end_) {
        char next = source_[run];
        if (is_special_char(next) || is_space_or_tab(next) || is_line_break(next)) break;
        ++run;
    }
    push_text(run - pos_);
    pos_ = run;
}

void ProvisionalScanner::scan_markup() {
    auto match = match_markup(source_, pos_, end_);
    if (!match) {
        push(RecordShape::Punctuation, 1);
        ++pos_;
        return;
    }

    push(record_shape_for(match->kind), match->length, match->open_ended);
    if (match->open_ended) {
        report(unterminated_code(match->kind), pos_, pos_ + match->length);
    }

    if (match->kind == MarkupKind::StartTag && !match->self_closing &&
        !match->unterminated_value) {
        if (auto frame = mode_for_start_tag(match->tag_name, pos_ + match->length)) {
            pending_mode_switch_ = true;
            pending_frame_ = *frame;
            pending_tag_start_ = pos_;
        }
    }
    pos_ += match->length;
}

} // namespace marklex::scan
