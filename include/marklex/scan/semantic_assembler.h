#pragma once
#include <marklex/scan/markup_matcher.h>
#include <marklex/scan/provisional_scanner.h>
#include <marklex/scan/scan_issue.h>
#include <marklex/scan/token.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace marklex::scan {

// Everything phase 2 reads for one segment. All pointers are borrowed.
struct SegmentInput {
    std::string_view source;
    size_t region_begin = 0;
    size_t region_end = 0;
    const SegmentEntry* entry = nullptr;
    const ProvisionalResult* result = nullptr;
    const std::vector<uint32_t>* records = nullptr;
    const std::vector<SegmentLine>* lines = nullptr;
};

// Phase 2. Turns one segment's records into tokens in a fixed sequence of
// passes: line markers, code spans and inline math, emphasis pairing, link
// punctuation, leftover punctuation, then text coalescing with line joining.
class SemanticAssembler {
public:
    void assemble(const SegmentInput& input, std::vector<Token>& tokens,
                  std::vector<ScanIssue>& issues);

private:
    enum class Role : uint8_t {
        Text,        // plain, escaped or degraded punctuation
        Whitespace,
        Newline,
        Punct,       // special character not yet resolved
        Delimiter,   // emphasis candidate waiting for a partner
        Final,       // kind and flags decided
    };

    struct Piece {
        size_t start = 0;
        size_t end = 0;
        Role role = Role::Text;
        TokenKind kind = TokenKind::Unknown;
        uint32_t flags = 0;
        TextForm form = TextForm::Verbatim;
        int64_t ordered_start = -1;
        bool trivia = false;          // whitespace that never joins text
        bool html_block = false;      // markup that opens an HTML block at line start
        char marker = 0;
    };

    // Records of one shape that phase 1 split at the length cap, rejoined.
    struct Span {
        size_t start = 0;
        size_t end = 0;
        RecordShape shape = RecordShape::None;
        bool open_ended = false;
    };

    void build_pieces(std::vector<ScanIssue>& issues);
    void add_tag_pieces(const Span& span, std::vector<ScanIssue>& issues);
    void resolve_line_markers(std::vector<ScanIssue>& issues);
    void resolve_code_spans();
    void resolve_emphasis();
    void resolve_links();
    void resolve_leftovers();
    void emit_tokens(std::vector<Token>& tokens);

    size_t find_piece(size_t offset) const;
    size_t find_code_closer(size_t opener) const;
    bool adjacent_punct(size_t index, char c) const;
    size_t text_group_end(size_t index) const;
    size_t trimmed_end(size_t group_end) const;
    bool joins_next_line(size_t group_end, size_t& next_text) const;

    SegmentInput input_;
    std::vector<Span> spans_;
    std::vector<TagPart> tag_parts_;
    std::vector<Piece> pieces_;
    std::vector<Piece> scratch_;
    std::vector<size_t> stack_;
};

// Text of a token as handed to the tree builder.
std::string materialize_text(std::string_view source, const Token& token);

// Logical payload: decoded entity, escaped text, comment body, autolink
// address, attribute value, ordered list start. Falls back to the text.
std::string materialize_value(std::string_view source, const Token& token);

} // namespace marklex::scan
