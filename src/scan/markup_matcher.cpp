#include <marklex/scan/markup_matcher.h>
#include <marklex/scan/char_codes.h>
#include <marklex/scan/entity_resolver.h>

namespace marklex::scan {

namespace {

size_t find_sequence(std::string_view source, size_t from, size_t end, std::string_view needle) {
    if (end < needle.size()) return std::string_view::npos;
    for (size_t i = from; i + needle.size() <= end; ++i) {
        if (source.compare(i, needle.size(), needle) == 0) return i;
    }
    return std::string_view::npos;
}

bool starts_with_at(std::string_view source, size_t pos, size_t end, std::string_view prefix) {
    return pos + prefix.size() <= end && source.compare(pos, prefix.size(), prefix) == 0;
}

// Construct that runs until `terminator`, or to `end` when it never closes.
MarkupMatch match_until(MarkupKind kind, std::string_view source, size_t pos, size_t body,
                        size_t end, std::string_view terminator) {
    MarkupMatch match;
    match.kind = kind;
    size_t close = find_sequence(source, body, end, terminator);
    if (close == std::string_view::npos) {
        match.length = end - pos;
        match.open_ended = true;
    } else {
        match.length = close + terminator.size() - pos;
    }
    return match;
}

size_t skip_whitespace(std::string_view source, size_t pos, size_t end) {
    while (pos < end && is_whitespace(source[pos])) ++pos;
    return pos;
}

// ============================================================================
// Tags
// ============================================================================

bool is_unquoted_value_char(char c) {
    return !is_whitespace(c) && c != '"' && c != '\'' && c != '=' && c != '<' &&
           c != '>' && c != '`';
}

bool is_attribute_name_start(char c) {
    return is_ascii_letter(c) || c == '_' || c == ':';
}

// "/>" ends an unquoted value as well as '>'.
size_t unquoted_value_end(std::string_view source, size_t pos, size_t end) {
    while (pos < end && is_unquoted_value_char(source[pos])) {
        if (source[pos] == '/' && pos + 1 < end && source[pos + 1] == '>') break;
        ++pos;
    }
    return pos;
}

bool at_tag_close(std::string_view source, size_t pos, size_t end) {
    if (pos >= end) return false;
    if (source[pos] == '>') return true;
    return source[pos] == '/' && pos + 1 < end && source[pos + 1] == '>';
}

struct TagRest {
    size_t close = 0;
    bool self_closing = false;
    bool unterminated_value = false;
};

// Attribute list and tag end after the tag name.
std::optional<TagRest> match_tag_rest(std::string_view source, size_t pos, size_t end) {
    TagRest rest;
    while (pos < end) {
        size_t after_ws = skip_whitespace(source, pos, end);
        if (after_ws >= end) return std::nullopt;

        char c = source[after_ws];
        if (c == '>') {
            rest.close = after_ws + 1;
            return rest;
        }
        if (c == '/') {
            if (after_ws + 1 < end && source[after_ws + 1] == '>') {
                rest.self_closing = true;
                rest.close = after_ws + 2;
                return rest;
            }
            return std::nullopt;
        }

        // Attributes must be separated from what precedes them.
        if (after_ws == pos) return std::nullopt;
        if (!is_attribute_name_start(c)) return std::nullopt;

        pos = after_ws;
        while (pos < end && is_attribute_name_char(source[pos])) ++pos;

        size_t before_eq = skip_whitespace(source, pos, end);
        if (before_eq >= end || source[before_eq] != '=') continue;

        size_t value = skip_whitespace(source, before_eq + 1, end);
        if (value >= end) return std::nullopt;
        if (at_tag_close(source, value, end)) {
            // name= with no value; the tag still closes
            pos = value;
            continue;
        }

        char quote = source[value];
        if (quote == '"' || quote == '\'') {
            size_t close = source.find(quote, value + 1);
            if (close == std::string_view::npos || close >= end) {
                size_t stop = value + 1;
                while (stop < end && source[stop] != '>' && !is_line_break(source[stop])) ++stop;
                rest.close = stop;
                rest.unterminated_value = true;
                return rest;
            }
            pos = close + 1;
        } else {
            size_t v = unquoted_value_end(source, value, end);
            if (v == value) return std::nullopt;
            pos = v;
        }
    }
    return std::nullopt;
}

std::optional<MarkupMatch> match_start_tag(std::string_view source, size_t pos, size_t end) {
    std::string_view name = read_tag_name(source, pos + 1, end);
    if (name.empty()) return std::nullopt;

    auto rest = match_tag_rest(source, pos + 1 + name.size(), end);
    if (!rest) return std::nullopt;

    MarkupMatch match;
    match.kind = MarkupKind::StartTag;
    match.length = rest->close - pos;
    match.self_closing = rest->self_closing;
    match.unterminated_value = rest->unterminated_value;
    match.tag_name = name;
    return match;
}

std::optional<MarkupMatch> match_end_tag(std::string_view source, size_t pos, size_t end) {
    std::string_view name = read_tag_name(source, pos + 2, end);
    if (name.empty()) return std::nullopt;

    size_t after = skip_whitespace(source, pos + 2 + name.size(), end);
    if (after >= end || source[after] != '>') return std::nullopt;

    MarkupMatch match;
    match.kind = MarkupKind::EndTag;
    match.length = after + 1 - pos;
    match.tag_name = name;
    return match;
}

// ============================================================================
// Autolinks
// ============================================================================

bool is_email_local_char(char c) {
    if (is_ascii_alnum(c)) return true;
    switch (c) {
        case '.': case '!': case '#': case '$': case '%': case '&': case '\'':
        case '*': case '+': case '/': case '=': case '?': case '^': case '_':
        case '`': case '{': case '|': case '}': case '~': case '-':
            return true;
        default:
            return false;
    }
}

std::optional<MarkupMatch> match_url_autolink(std::string_view source, size_t pos, size_t end) {
    size_t i = pos + 1;
    if (i >= end || !is_ascii_letter(source[i])) return std::nullopt;
    size_t scheme_start = i;
    ++i;
    while (i < end && (is_ascii_alnum(source[i]) || source[i] == '+' || source[i] == '.' ||
                       source[i] == '-')) {
        ++i;
    }
    size_t scheme_length = i - scheme_start;
    if (scheme_length < 2 || scheme_length > 32) return std::nullopt;
    if (i >= end || source[i] != ':') return std::nullopt;
    ++i;
    while (i < end && source[i] != '>') {
        char c = source[i];
        if (is_whitespace(c) || c == '<' || static_cast<unsigned char>(c) < 0x20) {
            return std::nullopt;
        }
        ++i;
    }
    if (i >= end) return std::nullopt;

    MarkupMatch match;
    match.kind = MarkupKind::AutolinkUrl;
    match.length = i + 1 - pos;
    return match;
}

std::optional<MarkupMatch> match_email_autolink(std::string_view source, size_t pos,
                                                size_t end) {
    size_t i = pos + 1;
    size_t local_start = i;
    while (i < end && is_email_local_char(source[i])) ++i;
    if (i == local_start || i >= end || source[i] != '@') return std::nullopt;
    ++i;

    // One or more dot-separated labels of at most 63 characters.
    while (true) {
        size_t label_start = i;
        while (i < end && (is_ascii_alnum(source[i]) || source[i] == '-')) ++i;
        size_t label_length = i - label_start;
        if (label_length == 0 || label_length > 63) return std::nullopt;
        if (source[label_start] == '-' || source[i - 1] == '-') return std::nullopt;
        if (i < end && source[i] == '.') {
            ++i;
            continue;
        }
        break;
    }
    if (i >= end || source[i] != '>') return std::nullopt;

    MarkupMatch match;
    match.kind = MarkupKind::AutolinkEmail;
    match.length = i + 1 - pos;
    return match;
}

} // namespace

std::string_view read_tag_name(std::string_view source, size_t pos, size_t end) {
    if (pos >= end || !is_ascii_letter(source[pos])) return {};
    size_t i = pos + 1;
    while (i < end && is_tag_name_char(source[i])) ++i;
    return source.substr(pos, i - pos);
}

std::optional<MarkupMatch> match_markup(std::string_view source, size_t pos, size_t end) {
    if (end > source.size()) end = source.size();
    if (pos + 1 >= end || source[pos] != '<') return std::nullopt;

    char next = source[pos + 1];

    if (next == '!') {
        if (starts_with_at(source, pos, end, "<!--")) {
            // "<!-->" and "<!--->" are complete, empty comments.
            if (starts_with_at(source, pos + 4, end, ">")) {
                MarkupMatch match;
                match.kind = MarkupKind::Comment;
                match.length = 5;
                return match;
            }
            if (starts_with_at(source, pos + 4, end, "->")) {
                MarkupMatch match;
                match.kind = MarkupKind::Comment;
                match.length = 6;
                return match;
            }
            return match_until(MarkupKind::Comment, source, pos, pos + 4, end, "-->");
        }
        if (starts_with_at(source, pos, end, "<![CDATA[")) {
            return match_until(MarkupKind::CData, source, pos, pos + 9, end, "]]>");
        }
        if (pos + 2 < end && is_ascii_letter(source[pos + 2])) {
            return match_until(MarkupKind::Doctype, source, pos, pos + 2, end, ">");
        }
        return std::nullopt;
    }

    if (next == '?') {
        return match_until(MarkupKind::ProcessingInstruction, source, pos, pos + 2, end, "?>");
    }

    if (next == '/') {
        return match_end_tag(source, pos, end);
    }

    if (auto url = match_url_autolink(source, pos, end)) return url;
    if (auto email = match_email_autolink(source, pos, end)) return email;
    return match_start_tag(source, pos, end);
}

bool is_block_tag_name(std::string_view name) {
    static constexpr std::string_view kBlockTags[] = {
        "address", "article", "aside", "base", "basefont", "blockquote", "body",
        "caption", "center", "col", "colgroup", "dd", "details", "dialog", "dir",
        "div", "dl", "dt", "fieldset", "figcaption", "figure", "footer", "form",
        "frame", "frameset", "h1", "h2", "h3", "h4", "h5", "h6", "head", "header",
        "hr", "html", "iframe", "legend", "li", "link", "main", "menu", "menuitem",
        "nav", "noframes", "ol", "optgroup", "option", "p", "param", "pre", "script",
        "search", "section", "style", "summary", "table", "tbody", "td", "textarea",
        "tfoot", "th", "thead", "title", "tr", "track", "ul",
    };

    if (name.empty() || name.size() > 10) return false;
    char lowered[10];
    for (size_t i = 0; i < name.size(); ++i) lowered[i] = to_ascii_lower(name[i]);
    std::string_view key(lowered, name.size());
    for (std::string_view tag : kBlockTags) {
        if (tag == key) return true;
    }
    return false;
}

// ============================================================================
// Tag parts
// ============================================================================

void split_tag(std::string_view source, size_t start, size_t end, std::vector<TagPart>& parts) {
    if (end > source.size()) end = source.size();
    size_t pos = start;
    auto add = [&](TagPartKind kind, size_t to) {
        parts.push_back(TagPart{kind, pos, to, false});
        pos = to;
    };

    if (pos >= end) return;
    if (pos + 1 < end && source[pos + 1] == '/') {
        add(TagPartKind::CloseOpen, pos + 2);
    } else {
        add(TagPartKind::Open, pos + 1);
    }
    std::string_view name = read_tag_name(source, pos, end);
    if (!name.empty()) add(TagPartKind::Name, pos + name.size());

    bool expect_value = false;
    while (pos < end) {
        const char c = source[pos];

        if (is_line_break(c)) {
            size_t to = pos + 1;
            if (c == '\r' && to < end && source[to] == '\n') ++to;
            add(TagPartKind::LineBreak, to);
            continue;
        }
        if (is_whitespace(c)) {
            size_t to = pos;
            while (to < end && is_whitespace(source[to]) && !is_line_break(source[to])) ++to;
            add(TagPartKind::Whitespace, to);
            continue;
        }
        if (c == '>') {
            add(TagPartKind::End, pos + 1);
            expect_value = false;
            continue;
        }
        if (c == '/' && pos + 1 < end && source[pos + 1] == '>') {
            add(TagPartKind::SelfClosingEnd, pos + 2);
            expect_value = false;
            continue;
        }

        if (expect_value) {
            expect_value = false;
            if (c == '"' || c == '\'') {
                size_t close = source.find(c, pos + 1);
                if (close != std::string_view::npos && close < end) {
                    add(TagPartKind::AttributeValue, close + 1);
                } else {
                    parts.push_back(TagPart{TagPartKind::AttributeValue, pos, end, true});
                    pos = end;
                }
                continue;
            }
            size_t to = unquoted_value_end(source, pos, end);
            if (to > pos) {
                add(TagPartKind::AttributeValue, to);
                continue;
            }
        }

        if (c == '=') {
            add(TagPartKind::Equals, pos + 1);
            expect_value = true;
            continue;
        }
        if (is_attribute_name_start(c)) {
            size_t to = pos + 1;
            while (to < end && is_attribute_name_char(source[to])) ++to;
            add(TagPartKind::AttributeName, to);
            continue;
        }

        size_t to = pos + 1;
        while (to < end && !is_whitespace(source[to]) && !is_line_break(source[to]) &&
               source[to] != '>') {
            ++to;
        }
        add(TagPartKind::Other, to);
    }
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string decode_attribute_value(std::string_view span) {
    if (!span.empty() && (span[0] == '"' || span[0] == '\'')) {
        const char quote = span[0];
        span.remove_prefix(1);
        if (!span.empty() && span.back() == quote) span.remove_suffix(1);
    }

    std::string result;
    result.reserve(span.size());
    for (size_t i = 0; i < span.size(); ++i) {
        const char c = span[i];
        if (c == '&') {
            if (auto match = match_entity(span, i, span.size())) {
                append_decoded(result, *match, span.substr(i, match->length));
                i += match->length - 1;
                continue;
            }
        } else if (c == '%' && i + 2 < span.size()) {
            int hi = hex_value(span[i + 1]);
            int lo = hex_value(span[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        } else if (c == '\r') {
            result += '\n';
            if (i + 1 < span.size() && span[i + 1] == '\n') ++i;
            continue;
        }
        result += c;
    }
    return result;
}

RecordShape record_shape_for(MarkupKind kind) {
    switch (kind) {
        case MarkupKind::StartTag:
        case MarkupKind::EndTag:                return RecordShape::HtmlTag;
        case MarkupKind::Comment:               return RecordShape::HtmlComment;
        case MarkupKind::CData:                 return RecordShape::HtmlCData;
        case MarkupKind::Doctype:               return RecordShape::HtmlDoctype;
        case MarkupKind::ProcessingInstruction: return RecordShape::HtmlProcessingInstruction;
        case MarkupKind::AutolinkUrl:
        case MarkupKind::AutolinkEmail:         return RecordShape::Autolink;
    }
    return RecordShape::HtmlTag;
}

} // namespace marklex::scan
