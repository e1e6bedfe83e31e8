#include <marklex/scan/token.h>
#include <marklex/core/config.h>

#include <array>

namespace marklex::scan {

namespace {

constexpr std::array<const char*, kTokenKindCount> kKindNames = {
    "Unknown",
    "EndOfFileToken",
    "LessThanToken",
    "LessThanSlashToken",
    "GreaterThanToken",
    "SlashGreaterThanToken",
    "HtmlText",
    "HtmlComment",
    "HtmlCDATA",
    "HtmlDoctype",
    "HtmlProcessingInstruction",
    "HtmlEntity",
    "HashToken",
    "DashToken",
    "DashDashDash",
    "AsteriskToken",
    "AsteriskAsterisk",
    "UnderscoreToken",
    "UnderscoreUnderscore",
    "BacktickToken",
    "TildeToken",
    "TildeTilde",
    "PlusToken",
    "EqualsToken",
    "DollarToken",
    "DollarDollar",
    "OpenBracketToken",
    "CloseBracketToken",
    "OpenParenToken",
    "CloseParenToken",
    "ExclamationToken",
    "ColonToken",
    "PipeToken",
    "BackslashToken",
    "BlockquoteToken",
    "AmpersandToken",
    "WhitespaceTrivia",
    "NewLineTrivia",
    "StringLiteral",
    "NumericLiteral",
    "Identifier",
    "HtmlAttributeName",
    "HtmlAttributeValue",
};

struct FlagName {
    std::uint32_t bit;
    const char* name;
};

constexpr std::array<FlagName, 20> kFlagNames = {{
    {token_flags::Unterminated, "Unterminated"},
    {token_flags::PrecedingLineBreak, "PrecedingLineBreak"},
    {token_flags::ContainsHtml, "ContainsHtml"},
    {token_flags::ContainsMath, "ContainsMath"},
    {token_flags::IsEscaped, "IsEscaped"},
    {token_flags::IsAtLineStart, "IsAtLineStart"},
    {token_flags::IsInRawText, "IsInRawText"},
    {token_flags::IsInRcdata, "IsInRcdata"},
    {token_flags::IsHtmlBlock, "IsHtmlBlock"},
    {token_flags::CanOpen, "CanOpen"},
    {token_flags::CanClose, "CanClose"},
    {token_flags::HardBreakHint, "HardBreakHint"},
    {token_flags::IsAutolinkEmail, "IsAutolinkEmail"},
    {token_flags::IsAutolinkUrl, "IsAutolinkUrl"},
    {token_flags::IsOrderedListMarker, "IsOrderedListMarker"},
    {token_flags::OrderedListDelimiterParen, "OrderedListDelimiterParen"},
    {token_flags::MaybeDefinition, "MaybeDefinition"},
    {token_flags::IsBlankLine, "IsBlankLine"},
    {token_flags::CanRollbackHere, "CanRollbackHere"},
    // Kept last: only matched by name, never printed as a bit.
    {0, "None"},
}};

constexpr std::array<const char*, 8> kRollbackNames = {
    "DocumentStart",
    "BlankLineBoundary",
    "RawTextContent",
    "CodeBlockContent",
    "HtmlElementInner",
    "HtmlTagBoundary",
    "HtmlEntityComplete",
    "ContentModeBoundary",
};

bool parse_decimal(std::string_view text, std::uint32_t& out) {
    if (text.empty() || text.size() > 10) return false;
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (value > 0xFFFFFFFFull) return false;
    out = static_cast<std::uint32_t>(value);
    return true;
}

std::optional<std::uint32_t> parse_flag_name(std::string_view name) {
    constexpr std::string_view kRunPrefix = "RunLength=";
    constexpr std::string_view kRollbackPrefix = "Rollback=";

    if (name.substr(0, kRunPrefix.size()) == kRunPrefix) {
        std::uint32_t n = 0;
        if (!parse_decimal(name.substr(kRunPrefix.size()), n)) return std::nullopt;
        if (n > core::config::kMaxRunLength) return std::nullopt;
        return with_run_length(0, n);
    }
    if (name.substr(0, kRollbackPrefix.size()) == kRollbackPrefix) {
        auto kind_name = name.substr(kRollbackPrefix.size());
        for (std::size_t i = 0; i < kRollbackNames.size(); ++i) {
            if (kind_name == kRollbackNames[i]) {
                return with_rollback_kind(0, static_cast<RollbackKind>(i));
            }
        }
        return std::nullopt;
    }
    for (const auto& f : kFlagNames) {
        if (name == f.name) return f.bit;
    }
    return std::nullopt;
}

} // namespace

std::uint32_t with_run_length(std::uint32_t flags, std::size_t length) {
    if (length > core::config::kMaxRunLength) length = core::config::kMaxRunLength;
    return (flags & ~token_flags::RunLengthMask) |
           ((static_cast<std::uint32_t>(length) << token_flags::RunLengthShift) &
            token_flags::RunLengthMask);
}

std::uint32_t run_length(std::uint32_t flags) {
    return (flags & token_flags::RunLengthMask) >> token_flags::RunLengthShift;
}

std::uint32_t with_rollback_kind(std::uint32_t flags, RollbackKind kind) {
    return (flags & ~token_flags::RollbackKindMask) |
           ((static_cast<std::uint32_t>(kind) << token_flags::RollbackKindShift) &
            token_flags::RollbackKindMask);
}

RollbackKind rollback_kind(std::uint32_t flags) {
    return static_cast<RollbackKind>(
        (flags & token_flags::RollbackKindMask) >> token_flags::RollbackKindShift);
}

const char* token_kind_name(TokenKind kind) {
    auto index = static_cast<std::size_t>(kind);
    if (index < kKindNames.size()) return kKindNames[index];
    return "Unknown";
}

std::optional<TokenKind> parse_token_kind(std::string_view name) {
    for (std::size_t i = 0; i < kKindNames.size(); ++i) {
        if (name == kKindNames[i]) return static_cast<TokenKind>(i);
    }
    return std::nullopt;
}

const char* rollback_kind_name(RollbackKind kind) {
    auto index = static_cast<std::size_t>(kind);
    if (index < kRollbackNames.size()) return kRollbackNames[index];
    return "Unknown";
}

std::string token_flags_to_string(std::uint32_t flags) {
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) out += '|';
        out += part;
    };

    for (const auto& f : kFlagNames) {
        if (f.bit != 0 && (flags & f.bit) != 0) append(f.name);
    }
    std::uint32_t run = run_length(flags);
    if (run != 0) append("RunLength=" + std::to_string(run));
    if ((flags & token_flags::CanRollbackHere) != 0) {
        append(std::string("Rollback=") + rollback_kind_name(rollback_kind(flags)));
    }
    if (out.empty()) out = "None";
    return out;
}

std::optional<std::uint32_t> parse_token_flags(std::string_view text) {
    if (text.empty()) return std::nullopt;

    std::uint32_t numeric = 0;
    if (parse_decimal(text, numeric)) return numeric;

    std::uint32_t flags = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t bar = text.find('|', pos);
        if (bar == std::string_view::npos) bar = text.size();
        auto part = text.substr(pos, bar - pos);
        auto bit = parse_flag_name(part);
        if (!bit) return std::nullopt;
        flags |= *bit;
        pos = bar + 1;
    }
    return flags;
}

} // namespace marklex::scan
