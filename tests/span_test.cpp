//! # Span Unit Tests
//!
//! Construction and clamping, line/column computation, joining, and the
//! per-line windows used by diagnostic rendering.

#include "prose/text/span.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace prose;

class SpanTest : public ::testing::Test {
protected:
    auto source(std::string_view text) -> Rc<Source> {
        return make_rc<Source>(Source::from_str(text));
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(SpanTest, SourceTextOfRange) {
    auto src = source("Hello, world!");
    Span span(src, 7, 12);
    EXPECT_EQ(span.source_text(), "world");
    EXPECT_EQ(span.len(), 5u);
    EXPECT_EQ(span.char_range(), (Range{7, 12}));
    EXPECT_EQ(span.source(), src);
}

TEST_F(SpanTest, RangeIsClamped) {
    auto src = source("abc");
    Span past_end(src, 1, 50);
    EXPECT_EQ(past_end.char_range(), (Range{1, 3}));
    Span inverted(src, 3, 1);
    EXPECT_EQ(inverted.char_range(), (Range{1, 1}));
    EXPECT_TRUE(inverted.is_blank());
}

TEST_F(SpanTest, ByteRangeFollowsCharacters) {
    auto src = source("a€b€c");
    Span span(src, 1, 4);
    EXPECT_EQ(span.source_text(), "€b€");
    EXPECT_EQ(span.byte_range(), (Range{1, 8}));
}

TEST_F(SpanTest, BlankSpan) {
    Span blank = Span::blank();
    EXPECT_TRUE(blank.is_blank());
    EXPECT_EQ(blank.source_text(), "");
    EXPECT_FALSE(blank.source_path().has_value());
    EXPECT_EQ(blank, Span());
}

TEST_F(SpanTest, StreamsSourceText) {
    Span span(source("this is a triumph"), 10, 17);
    std::ostringstream out;
    out << span;
    EXPECT_EQ(out.str(), "triumph");
}

// ============================================================================
// Line and Column
// ============================================================================

TEST_F(SpanTest, StartAndEndOnOneLine) {
    Span span(source("this is a triumph"), 5, 7);
    EXPECT_EQ(span.start(), (LineCol{0, 5}));
    EXPECT_EQ(span.end(), (LineCol{0, 7}));
}

TEST_F(SpanTest, StartAndEndAcrossLines) {
    auto src = source("first\nsecond line\nthird");
    Span span(src, 9, 20);
    EXPECT_EQ(span.source_text(), "ond line\nth");
    EXPECT_EQ(span.start(), (LineCol{1, 3}));
    EXPECT_EQ(span.end(), (LineCol{2, 2}));
}

TEST_F(SpanTest, ColumnsCountCharacters) {
    Span span(source("€€€x"), 3, 4);
    EXPECT_EQ(span.start(), (LineCol{0, 3}));
}

// ============================================================================
// Joining
// ============================================================================

TEST_F(SpanTest, JoinSameSource) {
    auto src = source("Hello, world!");
    Span hello(src, 0, 5);
    Span world(src, 7, 12);
    auto joined = hello.join(world);
    ASSERT_TRUE(is_ok(joined));
    EXPECT_EQ(unwrap(joined).source_text(), "Hello, world");

    auto reversed = world.join(hello);
    ASSERT_TRUE(is_ok(reversed));
    EXPECT_EQ(unwrap(reversed), unwrap(joined));
}

TEST_F(SpanTest, JoinWithBlankIsIdentity) {
    Span span(source("abc"), 1, 2);
    auto left = Span::blank().join(span);
    auto right = span.join(Span::blank());
    ASSERT_TRUE(is_ok(left));
    ASSERT_TRUE(is_ok(right));
    EXPECT_EQ(unwrap(left), span);
    EXPECT_EQ(unwrap(right), span);
}

TEST_F(SpanTest, JoinDifferentSourcesFails) {
    Span a(source("one text"), 0, 3);
    Span b(source("another text"), 0, 7);
    auto joined = a.join(b);
    ASSERT_TRUE(is_err(joined));
    EXPECT_STREQ(unwrap_err(joined).message(),
                 "the specified spans do not come from the same source");
}

TEST_F(SpanTest, EqualContentCountsAsSameSource) {
    Span a(source("shared"), 0, 2);
    Span b(source("shared"), 3, 6);
    EXPECT_TRUE(a.same_source(b));
    auto joined = a.join(b);
    ASSERT_TRUE(is_ok(joined));
    EXPECT_EQ(unwrap(joined).char_range(), (Range{0, 6}));
}

TEST_F(SpanTest, JoinSpansList) {
    auto src = source("a b c d");
    auto joined = join_spans({Span(src, 4, 5), Span(src, 2, 3), Span::blank()});
    ASSERT_TRUE(is_ok(joined));
    EXPECT_EQ(unwrap(joined).source_text(), "b c");

    auto none = join_spans({});
    ASSERT_TRUE(is_ok(none));
    EXPECT_TRUE(unwrap(none).is_blank());
}

TEST_F(SpanTest, SpanOfSpannedValue) {
    struct Token {
        Span where;
        auto span() const -> Span {
            return where;
        }
    };
    auto src = source("token");
    Token token{Span(src, 0, 5)};
    EXPECT_EQ(span_of(token).source_text(), "token");
    EXPECT_EQ(span_of(Span(src, 1, 2)).source_text(), "o");
}

// ============================================================================
// Source Lines
// ============================================================================

TEST_F(SpanTest, SingleLineWindow) {
    Span span(source("this is a triumph"), 5, 7);
    auto lines = span.source_lines().to_vector();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "this is a triumph");
    EXPECT_EQ(lines[0].start_col, 5u);
    EXPECT_EQ(lines[0].end_col, 7u);
}

TEST_F(SpanTest, MultiLineWindows) {
    auto src = source("first\nsecond line\nthird\nfourth");
    Span span(src, 2, 20);
    auto lines = span.source_lines().to_vector();
    ASSERT_EQ(lines.size(), 3u);

    EXPECT_EQ(lines[0].text, "first");
    EXPECT_EQ(lines[0].start_col, 2u);
    EXPECT_EQ(lines[0].end_col, 5u);

    EXPECT_EQ(lines[1].text, "second line");
    EXPECT_EQ(lines[1].start_col, 0u);
    EXPECT_EQ(lines[1].end_col, 11u);

    EXPECT_EQ(lines[2].text, "third");
    EXPECT_EQ(lines[2].start_col, 0u);
    EXPECT_EQ(lines[2].end_col, 2u);
}

TEST_F(SpanTest, CarriageReturnIsNotPartOfLine) {
    auto src = source("ab\r\ncd\r\n");
    Span span(src, 0, 6);
    auto lines = span.source_lines().to_vector();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "ab");
    EXPECT_EQ(lines[1].text, "cd");
}

TEST_F(SpanTest, NoLineAfterTrailingNewline) {
    auto src = source("ab\n");
    Span span(src, 3, 3);
    EXPECT_TRUE(span.source_lines().to_vector().empty());
}

TEST_F(SpanTest, SourceLinesAreRestartable) {
    Span span(source("one\ntwo"), 0, 7);
    auto lines = span.source_lines();
    size_t first = 0;
    for (const auto& line : lines) {
        (void)line;
        first += 1;
    }
    size_t second = 0;
    for (const auto& line : lines) {
        (void)line;
        second += 1;
    }
    EXPECT_EQ(first, 2u);
    EXPECT_EQ(second, 2u);
}
