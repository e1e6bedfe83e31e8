#include <marklex/scan/entity_resolver.h>
#include <marklex/scan/delimiter_run.h>
#include <marklex/scan/token.h>
#include <gtest/gtest.h>
#include <string>

using namespace marklex::scan;

static std::string decode(std::string_view text) {
    auto match = match_entity(text, 0, text.size());
    if (!match) return "<no match>";
    std::string out;
    append_decoded(out, *match, text.substr(0, match->length));
    return out;
}

// ============================================================================
// Entity Tests
// ============================================================================

// 1. Named entities
TEST(EntityResolver, NamedEntities) {
    EXPECT_EQ(decode("&amp;"), "&");
    EXPECT_EQ(decode("&lt;"), "<");
    EXPECT_EQ(decode("&quot;"), "\"");
    EXPECT_EQ(decode("&copy;"), "\xC2\xA9");
    EXPECT_EQ(decode("&nbsp;"), "\xC2\xA0");

    auto match = match_entity("&amp; rest", 0, 10);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->length, 5u);
    EXPECT_EQ(match->form, EntityForm::Named);
    EXPECT_TRUE(match->known);
}

// 2. Decimal and hex references
TEST(EntityResolver, NumericReferences) {
    EXPECT_EQ(decode("&#65;"), "A");
    EXPECT_EQ(decode("&#x41;"), "A");
    EXPECT_EQ(decode("&#X41;"), "A");
    EXPECT_EQ(decode("&#8364;"), "\xE2\x82\xAC");

    auto match = match_entity("&#x1F600;", 0, 9);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->form, EntityForm::Hex);
    EXPECT_EQ(match->code_point, 0x1F600u);
    EXPECT_EQ(match->length, 9u);
}

// 3. Invalid code points become U+FFFD
TEST(EntityResolver, InvalidCodePointsReplaced) {
    const std::string replacement = "\xEF\xBF\xBD";
    EXPECT_EQ(decode("&#0;"), replacement);
    EXPECT_EQ(decode("&#xD800;"), replacement);
    EXPECT_EQ(decode("&#x110000;"), replacement);
    EXPECT_EQ(decode("&#99999999999999999999;"), replacement);
}

// 4. The semicolon is required
TEST(EntityResolver, SemicolonRequired) {
    EXPECT_FALSE(match_entity("&amp", 0, 4).has_value());
    EXPECT_FALSE(match_entity("&#65", 0, 4).has_value());
    EXPECT_FALSE(match_entity("&amp rest", 0, 9).has_value());
    // The region end hides the semicolon
    EXPECT_FALSE(match_entity("&amp;", 0, 4).has_value());
}

// 5. Malformed references
TEST(EntityResolver, Malformed) {
    EXPECT_FALSE(match_entity("&;", 0, 2).has_value());
    EXPECT_FALSE(match_entity("&#;", 0, 3).has_value());
    EXPECT_FALSE(match_entity("&#x;", 0, 4).has_value());
    EXPECT_FALSE(match_entity("& amp;", 0, 6).has_value());
    EXPECT_FALSE(match_entity("&1abc;", 0, 6).has_value());
    EXPECT_FALSE(match_entity("&", 0, 1).has_value());
}

// 6. Well-formed but unknown names match and stay verbatim
TEST(EntityResolver, UnknownNameKeptVerbatim) {
    auto match = match_entity("&bogus;", 0, 7);
    ASSERT_TRUE(match.has_value());
    EXPECT_FALSE(match->known);
    EXPECT_EQ(match->length, 7u);
    EXPECT_EQ(decode("&bogus;"), "&bogus;");
}

// 7. Names longer than any real entity never match
TEST(EntityResolver, OverlongName) {
    std::string text = "&" + std::string(40, 'a') + ";";
    EXPECT_FALSE(match_entity(text, 0, text.size()).has_value());
}

// 8. Table lookups
TEST(EntityResolver, Lookup) {
    auto value = lookup_named_entity("gt");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, ">");
    EXPECT_FALSE(lookup_named_entity("GT2").has_value());
    EXPECT_GT(named_entity_count(), 50u);
}

// 9. UTF-8 encoding widths
TEST(EntityResolver, EncodeUtf8) {
    EXPECT_EQ(encode_utf8(0x41), "A");
    EXPECT_EQ(encode_utf8(0xE9), "\xC3\xA9");
    EXPECT_EQ(encode_utf8(0x20AC), "\xE2\x82\xAC");
    EXPECT_EQ(encode_utf8(0x1F600), "\xF0\x9F\x98\x80");
    EXPECT_EQ(encode_utf8(0x110000), "\xEF\xBF\xBD");
}

// 10. sanitize_code_point boundaries
TEST(EntityResolver, Sanitize) {
    EXPECT_EQ(sanitize_code_point(0), kReplacementCharacter);
    EXPECT_EQ(sanitize_code_point(0xD7FF), 0xD7FFu);
    EXPECT_EQ(sanitize_code_point(0xDFFF), kReplacementCharacter);
    EXPECT_EQ(sanitize_code_point(0xE000), 0xE000u);
    EXPECT_EQ(sanitize_code_point(0x10FFFF), 0x10FFFFu);
}

// ============================================================================
// Delimiter Run Tests
// ============================================================================

// 11. Opening and closing double asterisks
TEST(DelimiterRun, BoldRuns) {
    std::string src = "**bold**";
    DelimiterRun open = compute_delimiter_run(src, 0, src.size(), 0);
    EXPECT_EQ(open.marker, '*');
    EXPECT_EQ(open.length, 2u);
    EXPECT_TRUE(open.can_open);
    EXPECT_FALSE(open.can_close);

    DelimiterRun close = compute_delimiter_run(src, 6, src.size(), 0);
    EXPECT_EQ(close.length, 2u);
    EXPECT_FALSE(close.can_open);
    EXPECT_TRUE(close.can_close);
}

// 12. Underscores inside words do neither
TEST(DelimiterRun, IntrawordUnderscore) {
    std::string src = "snake_case_variable";
    DelimiterRun run = compute_delimiter_run(src, 5, src.size(), 0);
    EXPECT_EQ(run.length, 1u);
    EXPECT_FALSE(run.can_open);
    EXPECT_FALSE(run.can_close);
}

// 13. Intraword asterisks may do both
TEST(DelimiterRun, IntrawordAsterisk) {
    std::string src = "a*b";
    DelimiterRun run = compute_delimiter_run(src, 1, src.size(), 0);
    EXPECT_TRUE(run.can_open);
    EXPECT_TRUE(run.can_close);
}

// 14. Whitespace on both sides
TEST(DelimiterRun, SurroundedBySpaces) {
    std::string src = "a * b";
    DelimiterRun run = compute_delimiter_run(src, 2, src.size(), 0);
    EXPECT_FALSE(run.can_open);
    EXPECT_FALSE(run.can_close);
}

// 15. Punctuation neighbours
TEST(DelimiterRun, PunctuationNeighbours) {
    // *"foo"* : the opener is followed by punctuation and preceded by the edge
    std::string src = "*\"foo\"*";
    DelimiterRun open = compute_delimiter_run(src, 0, src.size(), 0);
    EXPECT_TRUE(open.can_open);
    DelimiterRun close = compute_delimiter_run(src, 6, src.size(), 0);
    EXPECT_TRUE(close.can_close);

    // a*"b" : punctuation after, a letter before, so not left-flanking
    src = "a*\"b\"";
    DelimiterRun mid = compute_delimiter_run(src, 1, src.size(), 0);
    EXPECT_FALSE(mid.can_open);
    EXPECT_TRUE(mid.can_close);
}

// 16. Tildes only pair as a run of two
TEST(DelimiterRun, TildeRuns) {
    std::string src = "~~del~~";
    DelimiterRun two = compute_delimiter_run(src, 0, src.size(), 0);
    EXPECT_EQ(two.length, 2u);
    EXPECT_TRUE(two.can_open);

    src = "~del~";
    DelimiterRun one = compute_delimiter_run(src, 0, src.size(), 0);
    EXPECT_FALSE(one.can_open);
    EXPECT_FALSE(one.can_close);
}

// 17. Region bounds act as whitespace
TEST(DelimiterRun, RegionBoundsAreWhitespace) {
    std::string src = "x*y";
    // With the region starting at the '*', the 'x' is not visible.
    DelimiterRun run = compute_delimiter_run(src, 1, src.size(), 1);
    EXPECT_TRUE(run.can_open);
    EXPECT_FALSE(run.can_close);

    run = compute_delimiter_run(src, 1, 2, 0);
    EXPECT_FALSE(run.can_open);
    EXPECT_TRUE(run.can_close);
}

// 18. Flags for the token stream
TEST(DelimiterRun, Flags) {
    DelimiterRun run;
    run.marker = '*';
    run.length = 3;
    run.can_open = true;
    uint32_t flags = delimiter_flags(run);
    EXPECT_TRUE(flags & token_flags::CanOpen);
    EXPECT_FALSE(flags & token_flags::CanClose);
    EXPECT_EQ(run_length(flags), 3u);
}
