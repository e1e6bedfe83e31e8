#pragma once

namespace marklex::scan {

// Byte-level character classes. Input is treated as UTF-8 bytes; every
// non-ASCII byte is an ordinary text character.

// NUL ends a line like '\n'.
inline bool is_line_break(char c) {
    return c == '\n' || c == '\r' || c == '\0';
}

inline bool is_space_or_tab(char c) {
    return c == ' ' || c == '\t';
}

inline bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

inline bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_ascii_alnum(char c) {
    return is_ascii_letter(c) || is_ascii_digit(c);
}

inline bool is_hex_digit(char c) {
    return is_ascii_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline bool is_ascii_punctuation(char c) {
    return (c >= 0x21 && c <= 0x2F) || (c >= 0x3A && c <= 0x40) ||
           (c >= 0x5B && c <= 0x60) || (c >= 0x7B && c <= 0x7E);
}

inline bool is_tag_name_char(char c) {
    return is_ascii_alnum(c) || c == '-';
}

inline bool is_attribute_name_char(char c) {
    return is_ascii_alnum(c) || c == '-' || c == '_' || c == ':' || c == '.';
}

inline char to_ascii_lower(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<char>(c + 32);
    return c;
}

// Characters that end a plain text run in phase 1.
inline bool is_special_char(char c) {
    switch (c) {
        case '*': case '_': case '`': case '~': case '#': case '-':
        case '+': case '=': case '$': case '[': case ']': case '(':
        case ')': case '!': case ':': case '|': case '<': case '>':
        case '/': case '&': case '\\':
            return true;
        default:
            return false;
    }
}

// Special characters that phase 1 groups into a single run record.
inline bool is_run_char(char c) {
    switch (c) {
        case '*': case '_': case '`': case '~': case '#': case '-':
        case '+': case '=': case '$':
            return true;
        default:
            return false;
    }
}

} // namespace marklex::scan
