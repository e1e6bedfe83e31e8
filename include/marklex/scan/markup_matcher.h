#pragma once
#include <marklex/scan/provisional_record.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marklex::scan {

enum class MarkupKind : uint8_t {
    StartTag,
    EndTag,
    Comment,
    CData,
    Doctype,
    ProcessingInstruction,
    AutolinkUrl,
    AutolinkEmail,
};

struct MarkupMatch {
    MarkupKind kind = MarkupKind::StartTag;
    size_t length = 0;
    bool open_ended = false;      // comment/CDATA/doctype/PI ran into `end`
    bool self_closing = false;
    bool unterminated_value = false;  // tag stops inside a quoted attribute value
    std::string_view tag_name;    // tags only
};

// Recognizes one markup construct at the '<' at `pos`. Tags and autolinks
// must be complete, except that a quoted attribute value with no closing
// quote ends the tag at the next '>' or line break. Declarations that never
// close run to `end` and are reported as open ended.
std::optional<MarkupMatch> match_markup(std::string_view source, size_t pos, size_t end);

enum class TagPartKind : uint8_t {
    Open,            // <
    CloseOpen,       // </
    Name,
    Whitespace,
    LineBreak,
    AttributeName,
    Equals,
    AttributeValue,
    End,             // >
    SelfClosingEnd,  // />
    Other,           // anything a tag cannot hold
};

struct TagPart {
    TagPartKind kind = TagPartKind::Other;
    size_t start = 0;
    size_t end = 0;
    bool unterminated = false;  // quoted value without its closing quote
};

// Splits the tag spanning [start, end) into parts that cover it exactly.
// Appends to `parts`.
void split_tag(std::string_view source, size_t start, size_t end, std::vector<TagPart>& parts);

// Logical value of an attribute value span: quotes removed, character
// references and %HH escapes decoded, CR and CRLF read as LF.
std::string decode_attribute_value(std::string_view span);

// Tag name following "<" or "</" at `pos`, empty when there is none.
std::string_view read_tag_name(std::string_view source, size_t pos, size_t end);

// Names that start an HTML block when their tag opens a line.
bool is_block_tag_name(std::string_view name);

RecordShape record_shape_for(MarkupKind kind);

} // namespace marklex::scan
