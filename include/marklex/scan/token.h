#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace marklex::scan {

// Numeric values are part of the contract with the tree builder. Append new
// kinds at the end; never renumber.
enum class TokenKind : std::uint8_t {
    Unknown = 0,
    EndOfFileToken = 1,

    // HTML
    LessThanToken = 2,
    LessThanSlashToken = 3,
    GreaterThanToken = 4,
    SlashGreaterThanToken = 5,
    HtmlText = 6,
    HtmlComment = 7,
    HtmlCDATA = 8,
    HtmlDoctype = 9,
    HtmlProcessingInstruction = 10,
    HtmlEntity = 11,

    // Markdown structure
    HashToken = 12,
    DashToken = 13,
    DashDashDash = 14,
    AsteriskToken = 15,
    AsteriskAsterisk = 16,
    UnderscoreToken = 17,
    UnderscoreUnderscore = 18,
    BacktickToken = 19,
    TildeToken = 20,
    TildeTilde = 21,
    PlusToken = 22,
    EqualsToken = 23,
    DollarToken = 24,
    DollarDollar = 25,

    // Links, tables
    OpenBracketToken = 26,
    CloseBracketToken = 27,
    OpenParenToken = 28,
    CloseParenToken = 29,
    ExclamationToken = 30,
    ColonToken = 31,
    PipeToken = 32,
    BackslashToken = 33,
    BlockquoteToken = 34,
    AmpersandToken = 35,

    // Trivia and literals
    WhitespaceTrivia = 36,
    NewLineTrivia = 37,
    StringLiteral = 38,
    NumericLiteral = 39,
    Identifier = 40,

    // Tag attributes
    HtmlAttributeName = 41,
    HtmlAttributeValue = 42,
};

inline constexpr std::size_t kTokenKindCount = 43;

namespace token_flags {

inline constexpr std::uint32_t None = 0;
inline constexpr std::uint32_t Unterminated = 1u << 0;
inline constexpr std::uint32_t PrecedingLineBreak = 1u << 1;
inline constexpr std::uint32_t ContainsHtml = 1u << 2;
inline constexpr std::uint32_t ContainsMath = 1u << 3;
inline constexpr std::uint32_t IsEscaped = 1u << 4;
inline constexpr std::uint32_t IsAtLineStart = 1u << 5;
inline constexpr std::uint32_t IsInRawText = 1u << 6;
inline constexpr std::uint32_t IsInRcdata = 1u << 7;
inline constexpr std::uint32_t IsHtmlBlock = 1u << 8;
inline constexpr std::uint32_t CanOpen = 1u << 9;
inline constexpr std::uint32_t CanClose = 1u << 10;
inline constexpr std::uint32_t HardBreakHint = 1u << 11;
inline constexpr std::uint32_t IsAutolinkEmail = 1u << 12;
inline constexpr std::uint32_t IsAutolinkUrl = 1u << 13;
inline constexpr std::uint32_t IsOrderedListMarker = 1u << 14;
inline constexpr std::uint32_t OrderedListDelimiterParen = 1u << 15;

// Bits 16-21: run length of backtick/tilde/marker runs (0-63).
inline constexpr std::uint32_t RunLengthShift = 16;
inline constexpr std::uint32_t RunLengthMask = 0x3Fu << RunLengthShift;

inline constexpr std::uint32_t MaybeDefinition = 1u << 22;
inline constexpr std::uint32_t IsBlankLine = 1u << 23;
inline constexpr std::uint32_t CanRollbackHere = 1u << 24;

// Bits 25-27: RollbackKind of a CanRollbackHere token.
inline constexpr std::uint32_t RollbackKindShift = 25;
inline constexpr std::uint32_t RollbackKindMask = 0x7u << RollbackKindShift;

} // namespace token_flags

enum class RollbackKind : std::uint8_t {
    DocumentStart = 0,
    BlankLineBoundary = 1,
    RawTextContent = 2,
    CodeBlockContent = 3,
    HtmlElementInner = 4,
    HtmlTagBoundary = 5,
    HtmlEntityComplete = 6,
    ContentModeBoundary = 7,
};

// How the text of a token is derived from its source span.
enum class TextForm : std::uint8_t {
    Verbatim,    // the span as written
    Normalized,  // whitespace runs and joined line breaks read as one space
    CodeSpan,    // as written, line breaks read as spaces
    Space,       // a single " "
};

// Token descriptor. Text is materialized on request from the source buffer.
struct Token {
    TokenKind kind = TokenKind::Unknown;
    std::uint32_t flags = token_flags::None;
    std::size_t start = 0;
    std::size_t end = 0;
    TextForm form = TextForm::Verbatim;
    std::int64_t ordered_start = -1;
};

// Saturates at 63.
std::uint32_t with_run_length(std::uint32_t flags, std::size_t length);
std::uint32_t run_length(std::uint32_t flags);

std::uint32_t with_rollback_kind(std::uint32_t flags, RollbackKind kind);
RollbackKind rollback_kind(std::uint32_t flags);

const char* token_kind_name(TokenKind kind);
std::optional<TokenKind> parse_token_kind(std::string_view name);

const char* rollback_kind_name(RollbackKind kind);

// "PrecedingLineBreak|IsAtLineStart|CanOpen"; run length and rollback kind are
// rendered as "RunLength=3" and "Rollback=BlankLineBoundary". Zero is "None".
std::string token_flags_to_string(std::uint32_t flags);

// Accepts a decimal number or '|'-separated flag names.
std::optional<std::uint32_t> parse_token_flags(std::string_view text);

} // namespace marklex::scan
