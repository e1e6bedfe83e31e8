#include <marklex/scan/position_tracker.h>
#include <marklex/scan/mode_stack.h>
#include <gtest/gtest.h>
#include <string>

using namespace marklex::scan;

// ============================================================================
// PositionTracker Tests
// ============================================================================

// 1. Fresh cursor
TEST(PositionTracker, StartCursor) {
    PositionTracker tracker;
    tracker.reset("abc", 0, 3, 4);
    Cursor c = tracker.start();
    EXPECT_EQ(c.offset, 0u);
    EXPECT_EQ(c.line, 1u);
    EXPECT_EQ(c.column, 1u);
    EXPECT_TRUE(c.at_line_start);
    EXPECT_FALSE(c.preceding_line_break);
}

// 2. Advancing across a line break
TEST(PositionTracker, AdvanceAcrossLines) {
    std::string src = "ab\ncd";
    PositionTracker tracker;
    tracker.reset(src, 0, src.size(), 4);
    Cursor c = tracker.start();

    tracker.advance(c, 3);
    EXPECT_EQ(c.line, 2u);
    EXPECT_EQ(c.column, 1u);
    EXPECT_EQ(c.line_start, 3u);
    EXPECT_TRUE(c.at_line_start);
    EXPECT_TRUE(c.preceding_line_break);

    tracker.advance(c, 4);
    EXPECT_EQ(c.column, 2u);
    EXPECT_FALSE(c.at_line_start);
    EXPECT_FALSE(c.preceding_line_break);
}

// 3. Tabs expand to the configured width
TEST(PositionTracker, TabExpansion) {
    std::string src = "\tx";
    PositionTracker four;
    four.reset(src, 0, src.size(), 4);
    Cursor c = four.start();
    four.advance(c, 1);
    EXPECT_EQ(c.column, 5u);
    EXPECT_TRUE(c.at_line_start);

    PositionTracker eight;
    eight.reset(src, 0, src.size(), 8);
    c = eight.start();
    eight.advance(c, 1);
    EXPECT_EQ(c.column, 9u);

    // "ab\t" reaches the same stop as "\t"
    std::string mixed = "ab\tx";
    four.reset(mixed, 0, mixed.size(), 4);
    c = four.start();
    four.advance(c, 3);
    EXPECT_EQ(c.column, 5u);
}

// 4. CRLF is one break
TEST(PositionTracker, CrLfIsOneBreak) {
    std::string src = "a\r\nb\rc";
    PositionTracker tracker;
    tracker.reset(src, 0, src.size(), 4);
    Cursor c = tracker.start();
    tracker.advance(c, 3);
    EXPECT_EQ(c.line, 2u);
    EXPECT_EQ(c.line_start, 3u);

    tracker.advance(c, src.size());
    EXPECT_EQ(c.line, 3u);
    EXPECT_EQ(c.column, 2u);
}

// 5. UTF-8 continuation bytes share a column
TEST(PositionTracker, Utf8Columns) {
    std::string src = "\xC3\xA9x";  // e-acute, then x
    PositionTracker tracker;
    tracker.reset(src, 0, src.size(), 4);
    Cursor c = tracker.start();
    tracker.advance(c, 2);
    EXPECT_EQ(c.column, 2u);
    tracker.advance(c, 3);
    EXPECT_EQ(c.column, 3u);
}

// 6. locate() agrees with advance() at every position
TEST(PositionTracker, LocateMatchesAdvance) {
    std::string src = "# one\n  two\r\n\tthree\n\nfour";
    PositionTracker walker;
    walker.reset(src, 0, src.size(), 4);
    PositionTracker locator;
    locator.reset(src, 0, src.size(), 4);

    Cursor c = walker.start();
    for (size_t pos = 0; pos <= src.size(); ++pos) {
        walker.advance(c, pos);
        // The middle of a CRLF pair has no cursor of its own.
        if (pos > 0 && src[pos - 1] == '\r' && pos < src.size() && src[pos] == '\n') continue;
        Cursor located = locator.locate(pos);
        EXPECT_EQ(located.offset, c.offset) << "pos " << pos;
        EXPECT_EQ(located.line, c.line) << "pos " << pos;
        EXPECT_EQ(located.column, c.column) << "pos " << pos;
        EXPECT_EQ(located.line_start, c.line_start) << "pos " << pos;
        EXPECT_EQ(located.at_line_start, c.at_line_start) << "pos " << pos;
    }
}

// 7. locate() inside indentation
TEST(PositionTracker, LocateInsideIndent) {
    std::string src = "a\n  b";
    PositionTracker tracker;
    tracker.reset(src, 0, src.size(), 4);
    Cursor c = tracker.locate(4);
    EXPECT_EQ(c.line, 2u);
    EXPECT_EQ(c.column, 3u);
    EXPECT_TRUE(c.at_line_start);
    EXPECT_TRUE(c.preceding_line_break);
}

// 8. Backward locate after a forward walk does not rescan
TEST(PositionTracker, LineIndexGrowsOnce) {
    std::string src = "a\nb\nc\nd";
    PositionTracker tracker;
    tracker.reset(src, 0, src.size(), 4);
    tracker.locate(src.size());
    EXPECT_EQ(tracker.indexed_lines(), 4u);
    Cursor c = tracker.locate(2);
    EXPECT_EQ(c.line, 2u);
    EXPECT_EQ(tracker.indexed_lines(), 4u);
}

// 9. A region that starts mid-buffer starts at line 1
TEST(PositionTracker, RegionOffset) {
    std::string src = "xx\nab";
    PositionTracker tracker;
    tracker.reset(src, 3, src.size(), 4);
    Cursor c = tracker.start();
    EXPECT_EQ(c.offset, 3u);
    EXPECT_EQ(c.line, 1u);
    tracker.advance(c, 5);
    EXPECT_EQ(c.column, 3u);
}

// ============================================================================
// ModeStack Tests
// ============================================================================

// 10. Start tags that switch modes, any case
TEST(ModeStack, ModeForStartTag) {
    auto script = mode_for_start_tag("SCRIPT", 8);
    ASSERT_TRUE(script.has_value());
    EXPECT_EQ(script->mode, LexicalMode::RawText);
    EXPECT_EQ(script->tag, ModeTag::Script);
    EXPECT_EQ(script->entered_at, 8u);

    auto style = mode_for_start_tag("style", 0);
    ASSERT_TRUE(style.has_value());
    EXPECT_EQ(style->mode, LexicalMode::RawText);

    auto textarea = mode_for_start_tag("TextArea", 0);
    ASSERT_TRUE(textarea.has_value());
    EXPECT_EQ(textarea->mode, LexicalMode::Rcdata);

    auto title = mode_for_start_tag("title", 0);
    ASSERT_TRUE(title.has_value());
    EXPECT_EQ(title->mode, LexicalMode::Rcdata);

    EXPECT_FALSE(mode_for_start_tag("div", 0).has_value());
    EXPECT_FALSE(mode_for_start_tag("scripts", 0).has_value());
}

// 11. Push, pop and the current mode
TEST(ModeStack, PushPop) {
    ModeStack stack;
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.mode(), LexicalMode::Normal);
    EXPECT_EQ(stack.top(), nullptr);

    ASSERT_TRUE(stack.push(*mode_for_start_tag("textarea", 10)));
    EXPECT_EQ(stack.mode(), LexicalMode::Rcdata);
    ASSERT_NE(stack.top(), nullptr);
    EXPECT_EQ(stack.top()->tag, ModeTag::Textarea);

    stack.pop();
    EXPECT_EQ(stack.mode(), LexicalMode::Normal);
    stack.pop();  // popping an empty stack is harmless
    EXPECT_EQ(stack.depth(), 0u);
}

// 12. A full stack refuses pushes without changing the mode
TEST(ModeStack, CapacityIsBounded) {
    ModeStack stack;
    for (size_t i = 0; i < marklex::core::config::kMaxModeDepth; ++i) {
        ASSERT_TRUE(stack.push(*mode_for_start_tag("script", i)));
    }
    EXPECT_FALSE(stack.push(*mode_for_start_tag("title", 99)));
    EXPECT_EQ(stack.mode(), LexicalMode::RawText);
    EXPECT_EQ(stack.depth(), marklex::core::config::kMaxModeDepth);
}

// 13. Unwinding drops frames entered after a position
TEST(ModeStack, UnwindTo) {
    ModeStack stack;
    stack.push(*mode_for_start_tag("script", 5));
    stack.push(*mode_for_start_tag("title", 20));
    stack.unwind_to(10);
    EXPECT_EQ(stack.depth(), 1u);
    EXPECT_EQ(stack.top()->tag, ModeTag::Script);
    stack.unwind_to(0);
    EXPECT_TRUE(stack.empty());
}

// 14. Equality compares live frames only
TEST(ModeStack, Equality) {
    ModeStack a;
    ModeStack b;
    EXPECT_EQ(a, b);
    a.push(*mode_for_start_tag("script", 3));
    EXPECT_NE(a, b);
    b.push(*mode_for_start_tag("script", 3));
    EXPECT_EQ(a, b);
    a.pop();
    b.pop();
    EXPECT_EQ(a, b);
}

// 15. End tag detection
TEST(ModeStack, MatchesEndTag) {
    std::string src = "x</SCRIPT >";
    EXPECT_TRUE(matches_end_tag(src, 1, src.size(), ModeTag::Script));

    src = "</scriptx>";
    EXPECT_FALSE(matches_end_tag(src, 0, src.size(), ModeTag::Script));

    src = "</script";
    EXPECT_TRUE(matches_end_tag(src, 0, src.size(), ModeTag::Script));

    src = "</style>";
    EXPECT_FALSE(matches_end_tag(src, 0, src.size(), ModeTag::Script));
    EXPECT_TRUE(matches_end_tag(src, 0, src.size(), ModeTag::Style));
}

// 16. Mode names used in debug output
TEST(ModeStack, ModeNames) {
    EXPECT_STREQ(lexical_mode_name(LexicalMode::Normal), "Normal");
    EXPECT_STREQ(lexical_mode_name(LexicalMode::RawText), "RawText");
    EXPECT_STREQ(lexical_mode_name(LexicalMode::Rcdata), "RCDATA");
}
