#include <marklex/scan/semantic_assembler.h>
#include <marklex/core/config.h>
#include <marklex/scan/char_codes.h>
#include <marklex/scan/delimiter_run.h>
#include <marklex/scan/entity_resolver.h>
#include <marklex/scan/markup_matcher.h>

#include <algorithm>

namespace marklex::scan {

namespace flags = token_flags;

static constexpr size_t kNoPiece = static_cast<size_t>(-1);

static TokenKind emphasis_kind(char marker, size_t size) {
    switch (marker) {
        case '*': return size == 2 ? TokenKind::AsteriskAsterisk : TokenKind::AsteriskToken;
        case '_': return size == 2 ? TokenKind::UnderscoreUnderscore : TokenKind::UnderscoreToken;
        default:  return TokenKind::TildeTilde;
    }
}

static size_t count_spaces(std::string_view source, size_t start, size_t end) {
    return static_cast<size_t>(std::count(source.begin() + static_cast<std::ptrdiff_t>(start),
                                          source.begin() + static_cast<std::ptrdiff_t>(end), ' '));
}

void SemanticAssembler::assemble(const SegmentInput& input, std::vector<Token>& tokens,
                                 std::vector<ScanIssue>& issues) {
    input_ = input;
    tokens.clear();

    build_pieces(issues);
    resolve_line_markers(issues);
    resolve_code_spans();
    resolve_emphasis();
    resolve_links();
    resolve_leftovers();
    emit_tokens(tokens);
}

// ============================================================================
// Records to pieces
// ============================================================================

void SemanticAssembler::build_pieces(std::vector<ScanIssue>& issues) {
    pieces_.clear();

    const std::string_view source = input_.source;
    const auto& records = *input_.records;
    const ProvisionalResult& result = *input_.result;

    const bool math = result.fence.kind == FenceKind::Math;
    const bool in_raw = result.raw_content.valid;
    const LexicalMode raw_mode = in_raw ? result.raw_frame.mode : LexicalMode::Normal;

    spans_.clear();
    size_t offset = input_.entry->cursor.offset;
    uint32_t previous_length = 0;
    for (size_t r = records.size() - result.record_count; r < records.size(); ++r) {
        ProvisionalRecord record = unpack_record(records[r]);
        const size_t start = offset;
        offset += record.length;

        // Phase 1 splits long runs at the record length cap.
        if (!spans_.empty() && spans_.back().shape == record.shape &&
            (record.shape == RecordShape::Text || record.shape == RecordShape::Whitespace ||
             previous_length == core::config::kMaxRecordLength)) {
            spans_.back().end = offset;
            spans_.back().open_ended = record.open_ended;
        } else {
            spans_.push_back(Span{start, offset, record.shape, record.open_ended});
        }
        previous_length = record.length;
    }

    for (const Span& span : spans_) {
        Piece p;
        p.start = span.start;
        p.end = span.end;

        const uint32_t unterminated = span.open_ended ? flags::Unterminated : 0;
        const bool raw_span = in_raw && p.start >= result.raw_content.start &&
                              p.end <= result.raw_content.end;

        switch (span.shape) {
            case RecordShape::None:
            case RecordShape::Text:
                p.role = Role::Text;
                break;
            case RecordShape::Whitespace:
                p.role = Role::Whitespace;
                break;
            case RecordShape::Newline:
                p.role = Role::Newline;
                break;
            case RecordShape::Punctuation:
                p.role = Role::Punct;
                p.marker = source[p.start];
                break;
            case RecordShape::Escape:
                p.role = Role::Text;
                p.flags = flags::IsEscaped;
                break;
            case RecordShape::Entity: {
                p.role = Role::Final;
                p.kind = TokenKind::HtmlEntity;
                if (raw_span && raw_mode == LexicalMode::Rcdata) p.flags |= flags::IsInRcdata;
                auto match = match_entity(source, p.start, p.end);
                if (match && match->form == EntityForm::Named && !match->known) {
                    ScanIssue issue;
                    issue.code = ScannerErrorCode::UnknownEntity;
                    issue.stage = ScanStage::Phase2;
                    issue.start = p.start;
                    issue.end = p.end;
                    issues.push_back(issue);
                }
                break;
            }
            case RecordShape::HtmlTag:
                add_tag_pieces(span, issues);
                continue;
            case RecordShape::HtmlComment:
            case RecordShape::HtmlCData:
            case RecordShape::HtmlDoctype:
            case RecordShape::HtmlProcessingInstruction:
                p.role = Role::Final;
                p.kind = span.shape == RecordShape::HtmlComment ? TokenKind::HtmlComment
                       : span.shape == RecordShape::HtmlCData   ? TokenKind::HtmlCDATA
                       : span.shape == RecordShape::HtmlDoctype ? TokenKind::HtmlDoctype
                                                                  : TokenKind::HtmlProcessingInstruction;
                p.flags = flags::ContainsHtml | unterminated;
                p.html_block = true;
                break;
            case RecordShape::Autolink: {
                p.role = Role::Final;
                p.kind = TokenKind::HtmlText;
                std::string_view address = source.substr(p.start, p.end - p.start);
                p.flags = flags::ContainsHtml |
                          (address.find(':') != std::string_view::npos ? flags::IsAutolinkUrl
                                                                       : flags::IsAutolinkEmail);
                break;
            }
            case RecordShape::RawText:
                p.role = Role::Final;
                p.kind = TokenKind::HtmlText;
                p.flags = flags::ContainsHtml | unterminated |
                          (raw_mode == LexicalMode::Rcdata ? flags::IsInRcdata : flags::IsInRawText);
                break;
            case RecordShape::CodeLine:
                p.role = Role::Final;
                p.kind = TokenKind::StringLiteral;
                if (math) p.flags = flags::ContainsMath;
                break;
        }
        pieces_.push_back(p);
    }
}

// A tag becomes its parts: opener, name, attributes, closer. Whitespace and
// line breaks inside it are trivia.
void SemanticAssembler::add_tag_pieces(const Span& span, std::vector<ScanIssue>& issues) {
    const std::string_view source = input_.source;
    tag_parts_.clear();
    split_tag(source, span.start, span.end, tag_parts_);

    size_t name_at = span.start + 1;
    if (name_at < span.end && source[name_at] == '/') ++name_at;
    const bool block = is_block_tag_name(read_tag_name(source, name_at, span.end));

    auto add_issue = [&](ScannerErrorCode code, size_t start, size_t end) {
        ScanIssue issue;
        issue.code = code;
        issue.stage = ScanStage::Phase2;
        issue.start = start;
        issue.end = end;
        issues.push_back(issue);
    };

    for (size_t i = 0; i < tag_parts_.size(); ++i) {
        const TagPart& part = tag_parts_[i];
        Piece p;
        p.start = part.start;
        p.end = part.end;
        p.role = Role::Final;
        p.flags = flags::ContainsHtml;

        switch (part.kind) {
            case TagPartKind::Open:
            case TagPartKind::CloseOpen:
                p.kind = part.kind == TagPartKind::Open ? TokenKind::LessThanToken
                                                        : TokenKind::LessThanSlashToken;
                p.html_block = block;
                if (span.open_ended) p.flags |= flags::Unterminated;
                break;
            case TagPartKind::Name:
                p.kind = TokenKind::Identifier;
                break;
            case TagPartKind::Whitespace:
                p.role = Role::Whitespace;
                p.flags = 0;
                p.trivia = true;
                break;
            case TagPartKind::LineBreak:
                p.role = Role::Newline;
                p.flags = 0;
                p.trivia = true;
                break;
            case TagPartKind::AttributeName:
                p.kind = TokenKind::HtmlAttributeName;
                break;
            case TagPartKind::Equals: {
                p.kind = TokenKind::EqualsToken;
                size_t next = i + 1;
                while (next < tag_parts_.size() &&
                       (tag_parts_[next].kind == TagPartKind::Whitespace ||
                        tag_parts_[next].kind == TagPartKind::LineBreak)) {
                    ++next;
                }
                if (next >= tag_parts_.size() ||
                    tag_parts_[next].kind != TagPartKind::AttributeValue) {
                    add_issue(ScannerErrorCode::InvalidHtmlAttribute, p.start, p.end);
                }
                break;
            }
            case TagPartKind::AttributeValue:
                p.kind = TokenKind::HtmlAttributeValue;
                if (part.unterminated) {
                    p.flags |= flags::Unterminated;
                    add_issue(ScannerErrorCode::UnterminatedHtmlAttributeValue, p.start, p.end);
                }
                break;
            case TagPartKind::End:
                p.kind = TokenKind::GreaterThanToken;
                break;
            case TagPartKind::SelfClosingEnd:
                p.kind = TokenKind::SlashGreaterThanToken;
                break;
            case TagPartKind::Other:
                p.kind = TokenKind::HtmlText;
                break;
        }
        pieces_.push_back(p);
    }
}

size_t SemanticAssembler::find_piece(size_t offset) const {
    auto it = std::lower_bound(pieces_.begin(), pieces_.end(), offset,
                               [](const Piece& p, size_t value) { return p.start < value; });
    if (it == pieces_.end() || it->start != offset) return kNoPiece;
    return static_cast<size_t>(it - pieces_.begin());
}

bool SemanticAssembler::adjacent_punct(size_t index, char c) const {
    if (index + 1 >= pieces_.size()) return false;
    const Piece& next = pieces_[index + 1];
    return next.role == Role::Punct && next.marker == c && next.start == pieces_[index].end;
}

// ============================================================================
// Pass 1: line-start markers and fences
// ============================================================================

void SemanticAssembler::resolve_line_markers(std::vector<ScanIssue>& issues) {
    const std::string_view source = input_.source;
    const ProvisionalResult& result = *input_.result;
    size_t opener = kNoPiece;

    for (const SegmentLine& line : *input_.lines) {
        const LineInfo& info = line.info;
        size_t index = find_piece(info.marker_offset);
        if (index == kNoPiece) continue;

        Piece& p = pieces_[index];
        p.role = Role::Final;
        p.form = TextForm::Verbatim;
        char first = source[info.marker_offset];

        switch (info.line_class) {
            case LineClass::AtxHeading:
                p.kind = TokenKind::HashToken;
                p.flags = with_run_length(p.flags, info.run_length);
                break;
            case LineClass::Blockquote:
                p.kind = info.marker_end < info.line_end &&
                                 is_space_or_tab(source[info.marker_end])
                             ? TokenKind::BlockquoteToken
                             : TokenKind::GreaterThanToken;
                break;
            case LineClass::BulletListItem:
                p.kind = first == '*' ? TokenKind::AsteriskToken
                       : first == '+' ? TokenKind::PlusToken
                                      : TokenKind::DashToken;
                break;
            case LineClass::OrderedListItem:
                p.kind = TokenKind::NumericLiteral;
                p.flags |= flags::IsOrderedListMarker;
                if (info.marker == ')') p.flags |= flags::OrderedListDelimiterParen;
                p.ordered_start = info.ordered_start;
                break;
            case LineClass::ThematicBreak:
                p.kind = first == '*' ? TokenKind::AsteriskToken
                       : first == '_' ? TokenKind::UnderscoreToken
                                      : TokenKind::DashToken;
                p.flags = with_run_length(p.flags, info.run_length);
                break;
            case LineClass::SetextUnderline:
                p.kind = first == '=' ? TokenKind::EqualsToken : TokenKind::DashToken;
                p.flags = with_run_length(p.flags, info.run_length);
                break;
            case LineClass::Frontmatter:
                p.kind = TokenKind::DashDashDash;
                p.flags = with_run_length(p.flags, info.run_length);
                break;
            case LineClass::FenceOpen:
                p.kind = first == '`' ? TokenKind::BacktickToken : TokenKind::TildeToken;
                p.flags = with_run_length(p.flags, info.run_length);
                break;
            case LineClass::MathFence:
                p.kind = TokenKind::DollarDollar;
                p.flags = with_run_length(p.flags | flags::ContainsMath, info.run_length);
                break;
            case LineClass::Blank:
            case LineClass::Paragraph:
                p.role = Role::Text;
                continue;
        }

        if (index + 1 < pieces_.size() && pieces_[index + 1].role == Role::Whitespace) {
            pieces_[index + 1].trivia = true;
        }

        if (line.fence_close) continue;
        if (info.line_class == LineClass::FenceOpen || info.line_class == LineClass::MathFence ||
            info.line_class == LineClass::Frontmatter) {
            opener = index;
        }

        // Info string: language word, then the rest as written.
        if (info.line_class == LineClass::FenceOpen) {
            bool seen_word = false;
            for (size_t i = index + 1; i < pieces_.size() && pieces_[i].role != Role::Newline; ++i) {
                Piece& q = pieces_[i];
                if (q.role == Role::Whitespace) {
                    q.trivia = true;
                } else if (q.role == Role::Text) {
                    q.role = Role::Final;
                    q.kind = seen_word ? TokenKind::StringLiteral : TokenKind::Identifier;
                    q.form = TextForm::Verbatim;
                    seen_word = true;
                }
            }
        }
    }

    if (result.fence_unterminated && !pieces_.empty()) {
        size_t flagged = opener != kNoPiece ? opener : 0;
        pieces_[flagged].flags |= flags::Unterminated;

        ScanIssue issue;
        issue.code = ScannerErrorCode::UnterminatedFence;
        issue.stage = ScanStage::Phase2;
        issue.start = pieces_[flagged].start;
        issue.end = input_.region_end;
        issues.push_back(issue);
    }
}

// ============================================================================
// Pass 2: code spans and inline math
// ============================================================================

size_t SemanticAssembler::find_code_closer(size_t opener) const {
    const std::string_view source = input_.source;
    const Piece& open = pieces_[opener];
    const size_t length = open.end - open.start;

    for (size_t j = opener + 1; j < pieces_.size(); ++j) {
        const Piece& q = pieces_[j];
        if (q.role != Role::Punct || q.marker != open.marker || q.end - q.start != length) continue;
        // $ closes only against content
        if (open.marker == '$' && is_whitespace(source[q.start - 1])) continue;
        return j;
    }
    return kNoPiece;
}

void SemanticAssembler::resolve_code_spans() {
    const std::string_view source = input_.source;
    scratch_.clear();

    for (size_t i = 0; i < pieces_.size(); ++i) {
        const Piece& p = pieces_[i];
        const size_t length = p.end - p.start;
        bool backtick = p.role == Role::Punct && p.marker == '`';
        bool dollar = p.role == Role::Punct && p.marker == '$' && length == 1 &&
                      p.end < input_.region_end && !is_whitespace(source[p.end]);

        if (backtick || dollar) {
            size_t closer = find_code_closer(i);
            if (closer != kNoPiece) {
                Piece open = p;
                open.role = Role::Final;
                open.kind = backtick ? TokenKind::BacktickToken : TokenKind::DollarToken;
                open.flags = backtick ? with_run_length(open.flags, length) : flags::ContainsMath;

                Piece close = pieces_[closer];
                close.role = Role::Final;
                close.kind = open.kind;
                close.flags = open.flags;

                scratch_.push_back(open);
                if (close.start > open.end) {
                    Piece content;
                    content.start = open.end;
                    content.end = close.start;
                    content.role = Role::Final;
                    content.kind = TokenKind::StringLiteral;
                    content.form = TextForm::CodeSpan;
                    content.flags = dollar ? flags::ContainsMath : 0;
                    scratch_.push_back(content);
                }
                scratch_.push_back(close);
                i = closer;
                continue;
            }
        }
        scratch_.push_back(p);
    }
    pieces_.swap(scratch_);
}

// ============================================================================
// Pass 3: emphasis and strikethrough
// ============================================================================

void SemanticAssembler::resolve_emphasis() {
    scratch_.clear();
    stack_.clear();

    for (const Piece& p : pieces_) {
        bool candidate = p.role == Role::Punct &&
                         (p.marker == '*' || p.marker == '_' || p.marker == '~');
        if (!candidate) {
            scratch_.push_back(p);
            continue;
        }

        const size_t length = p.end - p.start;
        DelimiterRun run = evaluate_delimiter_run(input_.source, p.start, length,
                                                  input_.region_begin, input_.region_end);
        if (!run.can_open && !run.can_close) {
            Piece text = p;
            text.role = Role::Text;
            scratch_.push_back(text);
            continue;
        }

        size_t pos = p.start;
        auto place = [&](size_t size) {
            Piece d = p;
            d.start = pos;
            d.end = pos + size;
            pos += size;

            if (run.can_close) {
                for (size_t s = stack_.size(); s-- > 0;) {
                    Piece& o = scratch_[stack_[s]];
                    if (o.marker != d.marker || o.end - o.start != size || o.start >= p.start) {
                        continue;
                    }
                    o.role = Role::Final;
                    o.kind = emphasis_kind(o.marker, size);
                    o.flags = with_run_length(o.flags | flags::CanOpen, size);
                    for (size_t above = s + 1; above < stack_.size(); ++above) {
                        scratch_[stack_[above]].role = Role::Text;
                    }
                    stack_.resize(s);

                    d.role = Role::Final;
                    d.kind = emphasis_kind(d.marker, size);
                    d.flags = with_run_length(d.flags | flags::CanClose, size);
                    scratch_.push_back(d);
                    return;
                }
            }

            if (run.can_open) {
                d.role = Role::Delimiter;
                stack_.push_back(scratch_.size());
            } else {
                d.role = Role::Text;
            }
            scratch_.push_back(d);
        };

        if (p.marker == '~') {
            place(length);
        } else if (run.can_open) {
            for (size_t k = 0; k < length / 2; ++k) place(2);
            if (length % 2) place(1);
        } else {
            if (length % 2) place(1);
            for (size_t k = 0; k < length / 2; ++k) place(2);
        }
    }

    for (size_t index : stack_) scratch_[index].role = Role::Text;
    stack_.clear();
    pieces_.swap(scratch_);
}

// ============================================================================
// Pass 4: links, images, definitions, tables
// ============================================================================

void SemanticAssembler::resolve_links() {
    const Cursor& entry = input_.entry->cursor;
    bool line_content = !entry.at_line_start;
    size_t depth = 0;

    auto finalize = [](Piece& p, TokenKind kind) {
        p.role = Role::Final;
        p.kind = kind;
    };

    for (size_t i = 0; i < pieces_.size(); ++i) {
        Piece& p = pieces_[i];
        if (p.role == Role::Newline) {
            depth = 0;
            line_content = false;
            continue;
        }
        bool at_line_start = !line_content;
        if (p.role != Role::Whitespace) line_content = true;
        if (p.role != Role::Punct) continue;

        switch (p.marker) {
            case '[': {
                finalize(p, TokenKind::OpenBracketToken);
                if (!at_line_start) break;
                // [label]: at the start of a line
                for (size_t j = i + 1; j < pieces_.size(); ++j) {
                    const Piece& q = pieces_[j];
                    if (q.role == Role::Newline) break;
                    if (q.role == Role::Punct && q.marker == ']') {
                        if (adjacent_punct(j, ':')) p.flags |= flags::MaybeDefinition;
                        break;
                    }
                }
                break;
            }
            case ']':
                finalize(p, TokenKind::CloseBracketToken);
                if (adjacent_punct(i, '(')) {
                    finalize(pieces_[++i], TokenKind::OpenParenToken);
                    depth = 1;
                } else if (adjacent_punct(i, ':')) {
                    finalize(pieces_[++i], TokenKind::ColonToken);
                }
                break;
            case '!':
                if (adjacent_punct(i, '[')) finalize(p, TokenKind::ExclamationToken);
                break;
            case '(':
                if (depth > 0) ++depth;
                break;
            case ')':
                if (depth > 0 && --depth == 0) finalize(p, TokenKind::CloseParenToken);
                break;
            case '|':
                finalize(p, TokenKind::PipeToken);
                break;
            default:
                break;
        }
    }
}

// ============================================================================
// Pass 5: leftover punctuation
// ============================================================================

void SemanticAssembler::resolve_leftovers() {
    const std::string_view source = input_.source;
    const size_t region_end = input_.region_end;
    scratch_.clear();

    for (size_t i = 0; i < pieces_.size(); ++i) {
        Piece p = pieces_[i];
        if (p.role == Role::Delimiter) p.role = Role::Text;
        if (p.role != Role::Punct) {
            scratch_.push_back(p);
            continue;
        }

        p.role = Role::Text;
        switch (p.marker) {
            case '\\':
                if (i + 1 < pieces_.size() && pieces_[i + 1].role == Role::Newline) {
                    p.role = Role::Final;
                    p.kind = TokenKind::BackslashToken;
                }
                break;
            case '&':
                p.role = Role::Final;
                p.kind = TokenKind::AmpersandToken;
                break;
            case '<': {
                char next = p.end < region_end ? source[p.end] : '\0';
                if (next == '/' && adjacent_punct(i, '/') && p.end + 1 < region_end &&
                    is_ascii_letter(source[p.end + 1])) {
                    p.end = pieces_[++i].end;
                    p.role = Role::Final;
                    p.kind = TokenKind::LessThanSlashToken;
                    break;
                }
                // Content before a '>' on the same line is a malformed tag: text.
                size_t k = p.end;
                while (k < region_end && is_space_or_tab(source[k])) ++k;
                size_t gt = k;
                while (gt < region_end && !is_line_break(source[gt]) && source[gt] != '>') ++gt;
                if (gt == k || gt >= region_end || source[gt] != '>') {
                    p.role = Role::Final;
                    p.kind = TokenKind::LessThanToken;
                }
                break;
            }
            case '>':
                p.role = Role::Final;
                p.kind = TokenKind::GreaterThanToken;
                break;
            case '/':
                if (adjacent_punct(i, '>')) {
                    p.end = pieces_[++i].end;
                    p.role = Role::Final;
                    p.kind = TokenKind::SlashGreaterThanToken;
                }
                break;
            default:
                break;
        }
        scratch_.push_back(p);
    }
    pieces_.swap(scratch_);
}

// ============================================================================
// Pass 6: coalescing, normalization, line joining
// ============================================================================

size_t SemanticAssembler::text_group_end(size_t index) const {
    size_t j = index;
    while (j < pieces_.size()) {
        const Piece& q = pieces_[j];
        bool text_like = q.role == Role::Text || q.role == Role::Punct ||
                         q.role == Role::Delimiter;
        if (text_like || (q.role == Role::Whitespace && !q.trivia)) {
            ++j;
            continue;
        }
        break;
    }
    return j;
}

// Trailing whitespace at the end of a line is split off the text, except a
// single space, which stays.
size_t SemanticAssembler::trimmed_end(size_t group_end) const {
    const Piece& last = pieces_[group_end - 1];
    if (last.role != Role::Whitespace) return group_end;
    if (group_end < pieces_.size() && pieces_[group_end].role != Role::Newline) return group_end;
    if (last.end - last.start == 1 && input_.source[last.start] == ' ') return group_end;
    return group_end - 1;
}

bool SemanticAssembler::joins_next_line(size_t group_end, size_t& next_text) const {
    const size_t n = pieces_.size();
    if (group_end >= n || pieces_[group_end].role != Role::Newline) return false;

    const Piece& before = pieces_[group_end - 1];
    if (before.role == Role::Whitespace &&
        count_spaces(input_.source, before.start, before.end) >= 2) {
        return false;
    }

    size_t m = group_end + 1;
    if (m < n && pieces_[m].role == Role::Whitespace) ++m;
    if (m >= n || pieces_[m].role != Role::Text) return false;
    next_text = m;
    return true;
}

void SemanticAssembler::emit_tokens(std::vector<Token>& tokens) {
    const std::string_view source = input_.source;
    const Cursor& entry = input_.entry->cursor;
    const size_t n = pieces_.size();

    bool line_start = entry.at_line_start;
    bool preceding_break = entry.preceding_line_break;
    bool line_content = !entry.at_line_start;

    auto emit = [&](Token token, bool content) {
        if (line_start) {
            token.flags |= flags::IsAtLineStart;
            if (preceding_break) token.flags |= flags::PrecedingLineBreak;
        }
        if (content) {
            line_start = false;
            line_content = true;
        }
        tokens.push_back(token);
    };

    auto trivia = [&](size_t start, size_t end) {
        Token token;
        token.kind = TokenKind::WhitespaceTrivia;
        token.start = start;
        token.end = end;
        token.form = TextForm::Space;
        emit(token, false);
    };

    size_t i = 0;
    while (i < n) {
        const Piece& p = pieces_[i];

        if (p.role == Role::Newline) {
            Token token;
            token.kind = TokenKind::NewLineTrivia;
            token.start = p.start;
            token.end = p.end;
            if (!line_content) token.flags |= flags::IsBlankLine;
            if (line_content && !p.trivia && !tokens.empty()) {
                const Token& last = tokens.back();
                if (last.kind == TokenKind::BackslashToken ||
                    (last.kind == TokenKind::WhitespaceTrivia &&
                     count_spaces(source, last.start, last.end) >= 2)) {
                    token.flags |= flags::HardBreakHint;
                }
            }
            emit(token, false);
            line_start = true;
            preceding_break = true;
            line_content = false;
            ++i;
            continue;
        }

        if (p.role == Role::Final) {
            Token token;
            token.kind = p.kind;
            token.flags = p.flags;
            token.start = p.start;
            token.end = p.end;
            token.form = p.form;
            token.ordered_start = p.ordered_start;
            if (p.html_block && !line_content) token.flags |= flags::IsHtmlBlock;
            emit(token, true);
            ++i;
            continue;
        }

        if (p.role == Role::Whitespace && !p.trivia && !line_content &&
            (i + 1 == n || pieces_[i + 1].role == Role::Newline)) {
            // Whitespace-only line: a single space, the line stays blank.
            Token token;
            token.kind = TokenKind::StringLiteral;
            token.start = p.start;
            token.end = p.end;
            token.form = TextForm::Space;
            emit(token, false);
            ++i;
            continue;
        }

        if (p.role == Role::Whitespace && (p.trivia || !line_content)) {
            trivia(p.start, p.end);
            ++i;
            continue;
        }

        // Run of text and the whitespace between it, on one line.
        size_t group_end = text_group_end(i);
        size_t text_end = trimmed_end(group_end);
        const bool line_ends = group_end == n || pieces_[group_end].role == Role::Newline;

        bool has_text = false;
        uint32_t text_flags = 0;
        for (size_t k = i; k < text_end; ++k) {
            if (pieces_[k].role != Role::Whitespace) has_text = true;
            text_flags |= pieces_[k].flags & flags::IsEscaped;
        }

        if (text_end > i && !has_text && line_ends) {
            trivia(pieces_[i].start, pieces_[text_end - 1].end);
        } else if (text_end > i && !has_text) {
            // Whitespace between two tokens reads as one space.
            Token token;
            token.kind = TokenKind::StringLiteral;
            token.start = pieces_[i].start;
            token.end = pieces_[text_end - 1].end;
            token.form = TextForm::Normalized;
            emit(token, true);
        } else if (text_end > i) {
            Token token;
            token.kind = TokenKind::StringLiteral;
            token.flags = text_flags;
            token.start = pieces_[i].start;
            token.end = pieces_[text_end - 1].end;
            token.form = TextForm::Normalized;

            size_t next_text = 0;
            while (joins_next_line(group_end, next_text)) {
                group_end = text_group_end(next_text);
                text_end = trimmed_end(group_end);
                for (size_t k = next_text; k < text_end; ++k) {
                    token.flags |= pieces_[k].flags & flags::IsEscaped;
                }
                token.end = pieces_[text_end - 1].end;
            }
            emit(token, true);
        }

        if (text_end < group_end) {
            trivia(pieces_[text_end].start, pieces_[group_end - 1].end);
        }
        i = group_end;
    }

    if (!tokens.empty()) {
        Token& first = tokens.front();
        first.flags = with_rollback_kind(first.flags | flags::CanRollbackHere, input_.entry->kind);
    }
}

// ============================================================================
// Materialization
// ============================================================================

static void append_normalized(std::string& out, std::string_view span, bool resolve_escapes) {
    size_t i = 0;
    while (i < span.size()) {
        char c = span[i];
        if (is_whitespace(c) || c == '\0') {
            while (i < span.size() && (is_whitespace(span[i]) || span[i] == '\0')) ++i;
            out += ' ';
            continue;
        }
        if (resolve_escapes && c == '\\' && i + 1 < span.size() &&
                   is_ascii_punctuation(span[i + 1])) {
            out += span[i + 1];
            ++i;
        } else {
            out += c;
        }
        ++i;
    }
}

static void append_verbatim(std::string& out, std::string_view span, bool breaks_as_spaces) {
    for (size_t i = 0; i < span.size(); ++i) {
        char c = span[i];
        if (breaks_as_spaces && is_line_break(c)) {
            if (c == '\r' && i + 1 < span.size() && span[i + 1] == '\n') ++i;
            out += ' ';
        } else if (c == '\0') {
            append_utf8(out, kReplacementCharacter);
        } else {
            out += c;
        }
    }
}

static std::string_view strip_delimiters(std::string_view span, std::string_view open,
                                         std::string_view close) {
    if (span.substr(0, open.size()) == open) span.remove_prefix(open.size());
    if (span.size() >= close.size() && span.substr(span.size() - close.size()) == close) {
        span.remove_suffix(close.size());
    }
    return span;
}

std::string materialize_text(std::string_view source, const Token& token) {
    std::string out;
    if (token.end <= token.start || token.start >= source.size()) {
        return token.form == TextForm::Space ? std::string(" ") : out;
    }
    std::string_view span = source.substr(token.start, token.end - token.start);
    switch (token.form) {
        case TextForm::Space:
            out = " ";
            break;
        case TextForm::Normalized:
            append_normalized(out, span, false);
            break;
        case TextForm::CodeSpan:
            append_verbatim(out, span, true);
            break;
        case TextForm::Verbatim:
            append_verbatim(out, span, false);
            break;
    }
    return out;
}

std::string materialize_value(std::string_view source, const Token& token) {
    if (token.end <= token.start || token.start >= source.size()) {
        return materialize_text(source, token);
    }
    std::string_view span = source.substr(token.start, token.end - token.start);

    switch (token.kind) {
        case TokenKind::StringLiteral:
            if (token.form == TextForm::Normalized && (token.flags & flags::IsEscaped)) {
                std::string out;
                append_normalized(out, span, true);
                return out;
            }
            break;
        case TokenKind::HtmlEntity:
            if (auto match = match_entity(source, token.start, token.end)) {
                std::string out;
                append_decoded(out, *match, span);
                return out;
            }
            break;
        case TokenKind::HtmlComment:
            return std::string(strip_delimiters(span, "<!--", "-->"));
        case TokenKind::HtmlCDATA:
            return std::string(strip_delimiters(span, "<![CDATA[", "]]>"));
        case TokenKind::HtmlDoctype:
            return std::string(strip_delimiters(span, "<!", ">"));
        case TokenKind::HtmlProcessingInstruction:
            return std::string(strip_delimiters(span, "<?", "?>"));
        case TokenKind::HtmlText:
            if (token.flags & (flags::IsAutolinkUrl | flags::IsAutolinkEmail)) {
                return std::string(strip_delimiters(span, "<", ">"));
            }
            break;
        case TokenKind::HtmlAttributeValue:
            return decode_attribute_value(span);
        case TokenKind::NumericLiteral:
            if (token.flags & flags::IsOrderedListMarker) {
                return std::to_string(token.ordered_start);
            }
            break;
        default:
            break;
    }
    return materialize_text(source, token);
}

} // namespace marklex::scan
