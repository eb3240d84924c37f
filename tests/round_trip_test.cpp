//! # Round-Trip Tests
//!
//! A small composite grammar built from the leaf types, checked against the
//! round-trip law: unparsing a parsed value gives back the consumed text, and
//! parsing that text again gives an equal value.

#include "prose/prose.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace prose;
using namespace prose::parsable;

namespace {

/// `name = number`, with optional whitespace around the '='.
class Setting {
public:
    static auto parse(ParseStream& stream) -> ParseResult<Setting> {
        Setting setting;
        size_t start = stream.position();

        auto key = stream.parse_regex("[a-z_]+");
        if (is_err(key))
            return unwrap_err(key);
        setting.key_ = std::move(unwrap(key));

        auto before = stream.parse<Optional<Whitespace>>();
        if (is_err(before))
            return unwrap_err(before);
        setting.before_ = std::move(unwrap(before));

        auto equals = stream.parse_str("=");
        if (is_err(equals))
            return unwrap_err(equals);
        setting.equals_ = std::move(unwrap(equals));

        auto after = stream.parse<Optional<Whitespace>>();
        if (is_err(after))
            return unwrap_err(after);
        setting.after_ = std::move(unwrap(after));

        auto value = stream.parse<U64>();
        if (is_err(value))
            return unwrap_err(value);
        setting.value_ = std::move(unwrap(value));

        setting.span_ = Span(stream.source(), start, stream.position());
        return setting;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    void unparse(std::ostream& out) const {
        unparse_to(out, key_);
        unparse_to(out, before_);
        unparse_to(out, equals_);
        unparse_to(out, after_);
        unparse_to(out, value_);
    }

    [[nodiscard]] auto key() const -> const std::string& {
        return key_.text();
    }

    [[nodiscard]] auto value() const -> uint64_t {
        return value_.value();
    }

    auto operator==(const Setting& other) const -> bool {
        return key_ == other.key_ && before_ == other.before_ && after_ == other.after_ &&
               value_ == other.value_;
    }

private:
    Exact key_;
    Optional<Whitespace> before_;
    Exact equals_;
    Optional<Whitespace> after_;
    U64 value_;
    Span span_;
};

} // namespace

class RoundTripTest : public ::testing::TestWithParam<std::string> {};

TEST_P(RoundTripTest, UnparseReproducesInput) {
    const std::string& text = GetParam();
    auto parsed = prose::parse<Setting>(text);
    ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed);
    EXPECT_EQ(unparse(unwrap(parsed)), text);
    EXPECT_EQ(unwrap(parsed).span().source_text(), text);
}

TEST_P(RoundTripTest, ReparseGivesEqualValue) {
    auto parsed = prose::parse<Setting>(GetParam());
    ASSERT_TRUE(is_ok(parsed));
    auto reparsed = prose::parse<Setting>(unparse(unwrap(parsed)));
    ASSERT_TRUE(is_ok(reparsed));
    EXPECT_TRUE(unwrap(reparsed) == unwrap(parsed));
}

INSTANTIATE_TEST_SUITE_P(Settings, RoundTripTest,
                         ::testing::Values("a=1", "key = 42", "max_depth  =\t007",
                                           "x\n=\n18446744073709551615"));

TEST(CompositeTest, FieldsAreParsed) {
    auto parsed = prose::parse<Setting>("timeout = 30");
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).key(), "timeout");
    EXPECT_EQ(unwrap(parsed).value(), 30u);
}

TEST(CompositeTest, WhitespaceDifferenceIsVisible) {
    auto spaced = prose::parse<Setting>("a = 1");
    auto tight = prose::parse<Setting>("a=1");
    ASSERT_TRUE(is_ok(spaced));
    ASSERT_TRUE(is_ok(tight));
    EXPECT_FALSE(unwrap(spaced) == unwrap(tight));
}

TEST(CompositeTest, ParseValueUsesUnparsedText) {
    auto expected = unwrap(prose::parse<Setting>("port = 80"));
    auto stream = ParseStream::from_str("port = 80\nport = 81");
    auto first = stream.parse_value(expected);
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first).span().char_range(), (Range{0, 9}));
    ASSERT_TRUE(is_ok(stream.parse<Whitespace>()));

    auto second = stream.parse_value(expected);
    ASSERT_TRUE(is_err(second));
    EXPECT_EQ(unwrap_err(second).message(), "expected `0`");
    EXPECT_EQ(unwrap_err(second).span().char_range().start, 18u);
}

TEST(CompositeTest, ErrorPointsAtFailure) {
    auto parsed = prose::parse<Setting>("name = value");
    ASSERT_TRUE(is_err(parsed));
    const Error& error = unwrap_err(parsed);
    EXPECT_EQ(error.message(), "expected digit (0-9)");
    EXPECT_EQ(error.to_string(), "error: expected digit (0-9)\n"
                                 " --> input:1:7\n"
                                 "  |\n"
                                 "1 | name = value\n"
                                 "           ^\n");
}
