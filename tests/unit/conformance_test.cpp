#include "annotated_tokens.h"

#include <gtest/gtest.h>
#include <stdexcept>

using marklex::testing::matches_annotations;
using marklex::testing::parse_annotated;

// ============================================================================
// Annotation Format Tests
// ============================================================================

// 1. Markers resolve to document offsets
TEST(AnnotatedTokens, ParsesMarkers) {
    auto doc = parse_annotated(R"md(
ab cd
1  2
ef
3
@1 StringLiteral "ab cd ef"
@2 StringLiteral
@3 StringLiteral IsAtLineStart|PrecedingLineBreak
)md");
    EXPECT_EQ(doc.document, "ab cd\nef");
    ASSERT_EQ(doc.expectations.size(), 3u);
    EXPECT_EQ(doc.expectations[0].offset, 0u);
    ASSERT_TRUE(doc.expectations[0].text.has_value());
    EXPECT_EQ(*doc.expectations[0].text, "ab cd ef");
    EXPECT_EQ(doc.expectations[1].offset, 3u);
    EXPECT_FALSE(doc.expectations[1].text.has_value());
    EXPECT_EQ(doc.expectations[2].offset, 6u);
    EXPECT_NE(doc.expectations[2].flags, 0u);
}

// 2. Malformed annotations are rejected
TEST(AnnotatedTokens, RejectsMalformed) {
    EXPECT_THROW(parse_annotated("x\n1\n@2 StringLiteral"), std::runtime_error);
    EXPECT_THROW(parse_annotated("x\n1\n@1 NoSuchKind"), std::runtime_error);
    EXPECT_THROW(parse_annotated("x\n1\n@1 StringLiteral \"open"), std::runtime_error);
    EXPECT_THROW(parse_annotated("xy\n11"), std::runtime_error);
    EXPECT_THROW(parse_annotated("x\n1\n@1 StringLiteral NotAFlag"), std::runtime_error);
}

// 3. A wrong expectation fails
TEST(AnnotatedTokens, ReportsMismatch) {
    EXPECT_FALSE(matches_annotations(R"md(
plain
1
@1 HashToken
)md"));
    EXPECT_FALSE(matches_annotations(R"md(
plain
1
@1 StringLiteral "other"
)md"));
}

// ============================================================================
// Inline Conformance
// ============================================================================

// 4. Strong emphasis
TEST(Conformance, StrongEmphasis) {
    EXPECT_TRUE(matches_annotations(R"md(
**bold** text
1 2   3 4
@1 AsteriskAsterisk "**" CanOpen|RunLength=2|IsAtLineStart|CanRollbackHere|Rollback=DocumentStart
@2 StringLiteral "bold"
@3 AsteriskAsterisk "**" CanClose|RunLength=2
@4 StringLiteral " text"
)md"));
}

// 5. Code spans, inline math and strikethrough
TEST(Conformance, SpansMathStrike) {
    EXPECT_TRUE(matches_annotations(R"md(
`a*b*` $x^2$ ~~s~~
12   3 45  6 7
@1 BacktickToken "`" RunLength=1
@2 StringLiteral "a*b*"
@3 BacktickToken "`"
@4 DollarToken "$" ContainsMath
@5 StringLiteral "x^2" ContainsMath
@6 DollarToken "$" ContainsMath
@7 TildeTilde "~~" CanOpen
)md"));
}

// 6. Escapes and character references
TEST(Conformance, EscapesAndEntities) {
    EXPECT_TRUE(matches_annotations(R"md(
\*not\* &amp; &bogus; &x
1       2     3       4
@1 StringLiteral "\\*not\\* " IsEscaped
@2 HtmlEntity "&amp;"
@3 HtmlEntity "&bogus;"
@4 AmpersandToken "&"
)md"));
}

// 7. Link and image punctuation
TEST(Conformance, LinkPunctuation) {
    EXPECT_TRUE(matches_annotations(R"md(
![alt](src "t") [ref]
12   34       5 6
@1 ExclamationToken "!"
@2 OpenBracketToken "["
@3 CloseBracketToken "]"
@4 OpenParenToken "("
@5 CloseParenToken ")"
@6 OpenBracketToken "["
)md"));
}

// 8. Multi-byte text keeps byte offsets
TEST(Conformance, Utf8Text) {
    EXPECT_TRUE(matches_annotations(R"md(
café *x*
1     2
@1 StringLiteral "café "
@2 AsteriskToken "*" CanOpen
)md"));
}

// ============================================================================
// Block Conformance
// ============================================================================

// 9. Headings end their segment
TEST(Conformance, AtxHeading) {
    EXPECT_TRUE(matches_annotations(R"md(
# Title
1 2
next
3
@1 HashToken "#" RunLength=1|IsAtLineStart
@2 StringLiteral "Title"
@3 StringLiteral "next" IsAtLineStart|PrecedingLineBreak|CanRollbackHere|Rollback=ContentModeBoundary
)md"));
}

// 10. List and blockquote markers
TEST(Conformance, ContainerMarkers) {
    EXPECT_TRUE(matches_annotations(R"md(
3) item
1  2
> quote
3 4
@1 NumericLiteral "3)" IsOrderedListMarker|OrderedListDelimiterParen
@2 StringLiteral "item"
@3 BlockquoteToken ">" IsAtLineStart|CanRollbackHere
@4 StringLiteral "quote"
)md"));
}

// 11. Setext underline and thematic break
TEST(Conformance, SetextAndRule) {
    EXPECT_TRUE(matches_annotations(R"md(
Title
1
===
2
***
3
@1 StringLiteral "Title" IsAtLineStart
@2 EqualsToken "===" RunLength=3|IsAtLineStart|PrecedingLineBreak
@3 AsteriskToken "***" RunLength=3
)md"));
}

// 12. Frontmatter
TEST(Conformance, Frontmatter) {
    EXPECT_TRUE(matches_annotations(R"md(
---
1
title: x
2
---
3
@1 DashDashDash "---" RunLength=3|CanRollbackHere
@2 StringLiteral "title: x"
@3 DashDashDash "---" RunLength=3
)md"));
}

// 13. Fenced code keeps its content verbatim
TEST(Conformance, FencedCode) {
    EXPECT_TRUE(matches_annotations(R"md(
~~~ python
1   2
x = *y*  # &amp;
3
~~~
4
@1 TildeToken "~~~" RunLength=3
@2 Identifier "python"
@3 StringLiteral "x = *y*  # &amp;"
@4 TildeToken "~~~" RunLength=3
)md"));
}

// ============================================================================
// HTML Conformance
// ============================================================================

// 14. Block HTML, comments, inline tags and autolinks
TEST(Conformance, Html) {
    EXPECT_TRUE(matches_annotations(R"md(
<div class="a">
12   3    45  6
<!-- note -->
7
text <span>x</span> <me@x.org>
     89   A B C   D E
@1 LessThanToken "<" ContainsHtml|IsHtmlBlock
@2 Identifier "div" ContainsHtml
@3 HtmlAttributeName "class" ContainsHtml
@4 EqualsToken "=" ContainsHtml
@5 HtmlAttributeValue "\"a\"" ContainsHtml
@6 GreaterThanToken ">" ContainsHtml
@7 HtmlComment "<!-- note -->" ContainsHtml|IsHtmlBlock
@8 LessThanToken "<" ContainsHtml
@9 Identifier "span" ContainsHtml
@A GreaterThanToken ">" ContainsHtml
@B LessThanSlashToken "</" ContainsHtml
@C Identifier "span" ContainsHtml
@D GreaterThanToken ">" ContainsHtml
@E HtmlText "<me@x.org>" ContainsHtml|IsAutolinkEmail
)md"));
}

// 15. Script content is raw text
TEST(Conformance, ScriptRawText) {
    EXPECT_TRUE(matches_annotations(R"md(
<script>if (a < b && c) {}</script>
12     34                 5 6     7
@1 LessThanToken "<" ContainsHtml
@2 Identifier "script" ContainsHtml
@3 GreaterThanToken ">" ContainsHtml
@4 HtmlText "if (a < b && c) {}" IsInRawText|CanRollbackHere|Rollback=RawTextContent
@5 LessThanSlashToken "</" ContainsHtml
@6 Identifier "script" ContainsHtml
@7 GreaterThanToken ">" ContainsHtml
)md"));
}

// 16. Attribute forms and self-closing tags
TEST(Conformance, TagAttributes) {
    EXPECT_TRUE(matches_annotations(R"md(
a<br/> <img src=x.png alt='a b' hidden>
 12 3  45   6  78     9  AB     C     D
@1 LessThanToken "<" ContainsHtml
@2 Identifier "br" ContainsHtml
@3 SlashGreaterThanToken "/>" ContainsHtml
@4 LessThanToken "<" ContainsHtml
@5 Identifier "img" ContainsHtml
@6 HtmlAttributeName "src" ContainsHtml
@7 EqualsToken "="
@8 HtmlAttributeValue "x.png" ContainsHtml
@9 HtmlAttributeName "alt"
@A EqualsToken "="
@B HtmlAttributeValue "'a b'"
@C HtmlAttributeName "hidden"
@D GreaterThanToken ">"
)md"));
}

// 17. Bare angle brackets are punctuation
TEST(Conformance, BareAngleBrackets) {
    EXPECT_TRUE(matches_annotations(R"md(
< >
1 2
@1 LessThanToken "<" IsAtLineStart
@2 GreaterThanToken ">"
)md"));
}

// ============================================================================
// Whitespace Conformance
// ============================================================================

// 18. Spaces between two emphasis runs read as one space
TEST(Conformance, SpaceBetweenRuns) {
    EXPECT_TRUE(matches_annotations(R"md(
**bold**  *italic*
1 2   3 4 5
@1 AsteriskAsterisk "**" CanOpen
@2 StringLiteral "bold"
@3 AsteriskAsterisk "**" CanClose
@4 StringLiteral " "
@5 AsteriskToken "*" CanOpen
)md"));
}

// 19. A whitespace-only line is a single space and stays blank
TEST(Conformance, WhitespaceOnlyLine) {
    EXPECT_TRUE(matches_annotations("  \t  \n1\n@1 StringLiteral \" \" IsAtLineStart"));
    EXPECT_TRUE(matches_annotations(R"md(
a
   
1  2
b
@1 StringLiteral " "
@2 NewLineTrivia IsBlankLine
)md"));
}

// 20. One trailing space stays in the text, longer runs do not
TEST(Conformance, TrailingWhitespace) {
    EXPECT_TRUE(matches_annotations("Single space followed by newline \n"
                                    "1\n"
                                    "@1 StringLiteral \"Single space followed by newline \""));
    EXPECT_TRUE(matches_annotations("Onlytabs\t\t\t\n"
                                    "1       2\n"
                                    "@1 StringLiteral \"Onlytabs\"\n"
                                    "@2 WhitespaceTrivia"));
}

// 21. Tab width changes nothing but columns
TEST(Conformance, TabWidthEight) {
    marklex::scan::ScannerOptions options;
    options.tab_width = 8;
    EXPECT_TRUE(matches_annotations(R"md(
- a *b*
1 2 3
@1 DashToken "-" IsAtLineStart
@2 StringLiteral "a "
@3 AsteriskToken "*" CanOpen
)md", options));
}
