#include <marklex/scan/token.h>
#include <marklex/scan/provisional_record.h>
#include <gtest/gtest.h>
#include <string>

using namespace marklex::scan;

// ============================================================================
// Token kinds
// ============================================================================

// 1. Kind numbering is part of the tree builder contract
TEST(TokenKind, NumericValuesArePinned) {
    EXPECT_EQ(static_cast<int>(TokenKind::Unknown), 0);
    EXPECT_EQ(static_cast<int>(TokenKind::EndOfFileToken), 1);
    EXPECT_EQ(static_cast<int>(TokenKind::LessThanToken), 2);
    EXPECT_EQ(static_cast<int>(TokenKind::HtmlEntity), 11);
    EXPECT_EQ(static_cast<int>(TokenKind::HashToken), 12);
    EXPECT_EQ(static_cast<int>(TokenKind::DollarDollar), 25);
    EXPECT_EQ(static_cast<int>(TokenKind::OpenBracketToken), 26);
    EXPECT_EQ(static_cast<int>(TokenKind::AmpersandToken), 35);
    EXPECT_EQ(static_cast<int>(TokenKind::WhitespaceTrivia), 36);
    EXPECT_EQ(static_cast<int>(TokenKind::Identifier), 40);
    EXPECT_EQ(static_cast<int>(TokenKind::HtmlAttributeName), 41);
    EXPECT_EQ(static_cast<int>(TokenKind::HtmlAttributeValue), 42);
    EXPECT_EQ(kTokenKindCount, 43u);
}

// 2. Every kind name parses back to the same kind
TEST(TokenKind, NamesRoundTrip) {
    for (size_t i = 0; i < kTokenKindCount; ++i) {
        auto kind = static_cast<TokenKind>(i);
        auto parsed = parse_token_kind(token_kind_name(kind));
        ASSERT_TRUE(parsed.has_value()) << token_kind_name(kind);
        EXPECT_EQ(*parsed, kind);
    }
}

// 3. Unknown names are rejected
TEST(TokenKind, UnknownNameRejected) {
    EXPECT_FALSE(parse_token_kind("Paragraph").has_value());
    EXPECT_FALSE(parse_token_kind("").has_value());
}

// ============================================================================
// Token flags
// ============================================================================

// 4. Flag bits are pinned
TEST(TokenFlags, BitValuesArePinned) {
    EXPECT_EQ(token_flags::Unterminated, 1u << 0);
    EXPECT_EQ(token_flags::PrecedingLineBreak, 1u << 1);
    EXPECT_EQ(token_flags::ContainsHtml, 1u << 2);
    EXPECT_EQ(token_flags::ContainsMath, 1u << 3);
    EXPECT_EQ(token_flags::IsEscaped, 1u << 4);
    EXPECT_EQ(token_flags::IsAtLineStart, 1u << 5);
    EXPECT_EQ(token_flags::IsInRawText, 1u << 6);
    EXPECT_EQ(token_flags::IsInRcdata, 1u << 7);
    EXPECT_EQ(token_flags::IsHtmlBlock, 1u << 8);
    EXPECT_EQ(token_flags::CanOpen, 1u << 9);
    EXPECT_EQ(token_flags::CanClose, 1u << 10);
    EXPECT_EQ(token_flags::HardBreakHint, 1u << 11);
    EXPECT_EQ(token_flags::IsAutolinkEmail, 1u << 12);
    EXPECT_EQ(token_flags::IsAutolinkUrl, 1u << 13);
    EXPECT_EQ(token_flags::IsOrderedListMarker, 1u << 14);
    EXPECT_EQ(token_flags::OrderedListDelimiterParen, 1u << 15);
    EXPECT_EQ(token_flags::RunLengthMask, 0x3Fu << 16);
    EXPECT_EQ(token_flags::MaybeDefinition, 1u << 22);
    EXPECT_EQ(token_flags::IsBlankLine, 1u << 23);
    EXPECT_EQ(token_flags::CanRollbackHere, 1u << 24);
    EXPECT_EQ(token_flags::RollbackKindMask, 0x7u << 25);
}

// 5. Run length lives in bits 16-21 and saturates
TEST(TokenFlags, RunLengthSaturates) {
    uint32_t flags = with_run_length(token_flags::CanOpen, 3);
    EXPECT_EQ(run_length(flags), 3u);
    EXPECT_TRUE(flags & token_flags::CanOpen);

    EXPECT_EQ(run_length(with_run_length(0, 63)), 63u);
    EXPECT_EQ(run_length(with_run_length(0, 64)), 63u);
    EXPECT_EQ(run_length(with_run_length(0, 100000)), 63u);

    // Replacing keeps neighbouring bits
    flags = with_run_length(flags | token_flags::MaybeDefinition, 5);
    EXPECT_EQ(run_length(flags), 5u);
    EXPECT_TRUE(flags & token_flags::MaybeDefinition);
}

// 6. Rollback kind packing
TEST(TokenFlags, RollbackKindPacking) {
    uint32_t flags = with_rollback_kind(token_flags::CanRollbackHere | token_flags::IsAtLineStart,
                                        RollbackKind::ContentModeBoundary);
    EXPECT_EQ(rollback_kind(flags), RollbackKind::ContentModeBoundary);
    EXPECT_TRUE(flags & token_flags::IsAtLineStart);

    flags = with_rollback_kind(flags, RollbackKind::BlankLineBoundary);
    EXPECT_EQ(rollback_kind(flags), RollbackKind::BlankLineBoundary);
    EXPECT_EQ(flags & token_flags::RunLengthMask, 0u);
}

// 7. Rendering flags
TEST(TokenFlags, ToString) {
    EXPECT_EQ(token_flags_to_string(0), "None");
    EXPECT_EQ(token_flags_to_string(with_run_length(token_flags::CanOpen, 2)),
              "CanOpen|RunLength=2");
    uint32_t flags = with_rollback_kind(token_flags::IsAtLineStart | token_flags::CanRollbackHere,
                                        RollbackKind::DocumentStart);
    EXPECT_EQ(token_flags_to_string(flags),
              "IsAtLineStart|CanRollbackHere|Rollback=DocumentStart");
}

// 8. Parsing flag lists and numbers
TEST(TokenFlags, Parse) {
    auto flags = parse_token_flags("IsAtLineStart|CanOpen");
    ASSERT_TRUE(flags.has_value());
    EXPECT_EQ(*flags, token_flags::IsAtLineStart | token_flags::CanOpen);

    flags = parse_token_flags("32");
    ASSERT_TRUE(flags.has_value());
    EXPECT_EQ(*flags, 32u);

    flags = parse_token_flags("None");
    ASSERT_TRUE(flags.has_value());
    EXPECT_EQ(*flags, 0u);

    flags = parse_token_flags("CanClose|RunLength=3|Rollback=RawTextContent");
    ASSERT_TRUE(flags.has_value());
    EXPECT_TRUE(*flags & token_flags::CanClose);
    EXPECT_EQ(run_length(*flags), 3u);
    EXPECT_EQ(rollback_kind(*flags), RollbackKind::RawTextContent);

    EXPECT_FALSE(parse_token_flags("").has_value());
    EXPECT_FALSE(parse_token_flags("Bogus").has_value());
    EXPECT_FALSE(parse_token_flags("CanOpen|").has_value());
    EXPECT_FALSE(parse_token_flags("RunLength=64").has_value());
}

// 9. Rendered flags parse back
TEST(TokenFlags, RenderedFlagsParseBack) {
    uint32_t flags = with_rollback_kind(
        with_run_length(token_flags::CanClose | token_flags::HardBreakHint |
                            token_flags::CanRollbackHere,
                        7),
        RollbackKind::HtmlTagBoundary);
    auto parsed = parse_token_flags(token_flags_to_string(flags));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, flags);
}

// 10. Rollback kind names
TEST(RollbackKind, Names) {
    EXPECT_STREQ(rollback_kind_name(RollbackKind::DocumentStart), "DocumentStart");
    EXPECT_STREQ(rollback_kind_name(RollbackKind::CodeBlockContent), "CodeBlockContent");
    EXPECT_STREQ(rollback_kind_name(RollbackKind::ContentModeBoundary), "ContentModeBoundary");
}

// ============================================================================
// Provisional records
// ============================================================================

// 11. Packing and unpacking
TEST(ProvisionalRecord, PackUnpack) {
    uint32_t packed = pack_record(RecordShape::HtmlComment, 17, true);
    EXPECT_EQ(record_length(packed), 17u);
    EXPECT_EQ(record_shape(packed), RecordShape::HtmlComment);
    EXPECT_TRUE(record_open_ended(packed));

    ProvisionalRecord record = unpack_record(pack_record(RecordShape::Text, 5));
    EXPECT_EQ(record.length, 5u);
    EXPECT_EQ(record.shape, RecordShape::Text);
    EXPECT_FALSE(record.open_ended);
}

// 12. Growing in place keeps shape and open-ended bit
TEST(ProvisionalRecord, Grow) {
    uint32_t packed = pack_record(RecordShape::Whitespace, 2, true);
    packed = grow_record(packed, 3);
    EXPECT_EQ(record_length(packed), 5u);
    EXPECT_EQ(record_shape(packed), RecordShape::Whitespace);
    EXPECT_TRUE(record_open_ended(packed));
}

// 13. Length cap
TEST(ProvisionalRecord, LengthCap) {
    uint32_t full = pack_record(RecordShape::Text, marklex::core::config::kMaxRecordLength);
    EXPECT_EQ(record_length(full), marklex::core::config::kMaxRecordLength);
    EXPECT_FALSE(record_can_grow(full, 1));
    EXPECT_TRUE(record_can_grow(pack_record(RecordShape::Text, 10), 100));
}

// 14. Shape names
TEST(ProvisionalRecord, ShapeNames) {
    EXPECT_STREQ(record_shape_name(RecordShape::Text), "Text");
    EXPECT_STREQ(record_shape_name(RecordShape::CodeLine), "CodeLine");
    EXPECT_STREQ(record_shape_name(RecordShape::HtmlProcessingInstruction),
                 "HtmlProcessingInstruction");
}
