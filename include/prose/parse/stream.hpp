//! # Parse Streams
//!
//! A `ParseStream` is the cursor threaded through a recursive-descent parse:
//! a shared `Source` plus a character position. Copying a stream copies a
//! reference count and an integer, so backtracking is done by forking:
//!
//! ```cpp
//! auto stream = ParseStream::from_str("3.14");
//! auto whole = stream.parse<U64>();
//! if (stream.peek_str(".")) {
//!     stream.parse_str(".");
//!     auto frac = stream.parse<U64>();
//! }
//! ```
//!
//! ## Failure Positions
//!
//! Failed operations leave the cursor where it was, with one exception:
//! literal matching (`parse_value`, `parse_str`, `parse_istr`) advances past
//! the longest matched prefix before failing, so the error and the cursor both
//! point at the first character that differs. Callers that need the old
//! position back fork first, or use `peek_*`. When the literal text matches
//! but the type's own grammar then rejects it, `parse_value` rewinds.

#ifndef PROSE_PARSE_STREAM_HPP
#define PROSE_PARSE_STREAM_HPP

#include "prose/common.hpp"
#include "prose/parse/error.hpp"
#include "prose/parse/parsable.hpp"
#include "prose/parse/pattern.hpp"
#include "prose/parsable/exact.hpp"
#include "prose/text/source.hpp"
#include "prose/text/span.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace prose {

/// The literal matched by `parse_any_str_of` and the index of its alternative.
struct StrMatch {
    parsable::Exact matched;
    size_t index = 0;
};

class ParseStream {
public:
    explicit ParseStream(Rc<Source> source, size_t position = 0);

    /// A stream over a fresh source holding `text`.
    [[nodiscard]] static auto from_str(std::string_view text) -> ParseStream;

    [[nodiscard]] auto source() const -> const Rc<Source>& {
        return source_;
    }

    [[nodiscard]] auto position() const -> size_t {
        return position_;
    }

    /// Moves the cursor, clamped to the end of the source.
    void set_position(size_t position);

    [[nodiscard]] auto at_end() const -> bool {
        return position_ >= source_->len();
    }

    // ========================================================================
    // Spans and Text
    // ========================================================================

    /// The character under the cursor; empty at the end of input.
    [[nodiscard]] auto current_span() const -> Span;

    /// From the cursor to the end of input.
    [[nodiscard]] auto remaining_span() const -> Span;

    [[nodiscard]] auto remaining() const -> IndexedSlice {
        return source_->slice_from(position_);
    }

    // ========================================================================
    // Cursor Movement
    // ========================================================================

    [[nodiscard]] auto fork() const -> ParseStream {
        return *this;
    }

    /// Advances exactly `n` characters, or fails without moving.
    auto consume(size_t n) -> ParseResult<Span>;

    /// Advances to the end of input.
    auto consume_remaining() -> Span;

    [[nodiscard]] auto next_char() const -> ParseResult<char32_t>;
    auto parse_char() -> ParseResult<char32_t>;

    [[nodiscard]] auto next_digit() const -> ParseResult<uint8_t>;
    auto parse_digit() -> ParseResult<uint8_t>;

    /// ASCII letters only.
    [[nodiscard]] auto next_alpha() const -> ParseResult<char32_t>;
    auto parse_alpha() -> ParseResult<char32_t>;

    // ========================================================================
    // Grammar Types
    // ========================================================================

    template <typename T> auto parse() -> ParseResult<T> {
        return T::parse(*this);
    }

    /// Matches a specific, already known value of `T`.
    ///
    /// Without an override the value's text is matched literally and `T` is
    /// then parsed over the same characters, so the result still satisfies
    /// the grammar of `T`. A grammar that rejects the text, or reads past it,
    /// fails with the stream back where it started.
    template <typename T> auto parse_value(T value) -> ParseResult<T> {
        if constexpr (has_parse_value<T>::value) {
            return T::parse_value(std::move(value), *this);
        } else {
            size_t start = position_;
            std::string text = unparse(value);
            auto matched = match_text(text);
            if (is_err(matched))
                return unwrap_err(matched);

            ParseStream attempt(source_, start);
            auto parsed = attempt.parse<T>();
            if (is_err(parsed)) {
                position_ = start;
                return unwrap_err(parsed);
            }
            if (attempt.position() != position_) {
                position_ = start;
                return Error::expected(unwrap(matched), text);
            }
            T result = std::move(unwrap(parsed));
            result.set_span(std::move(unwrap(matched)));
            return result;
        }
    }

    template <typename T> [[nodiscard]] auto peek() const -> bool {
        ParseStream lookahead = fork();
        return is_ok(lookahead.parse<T>());
    }

    template <typename T> [[nodiscard]] auto peek_value(T value) const -> bool {
        ParseStream lookahead = fork();
        return is_ok(lookahead.parse_value(std::move(value)));
    }

    /// Tries each value in order; the first that matches is parsed.
    template <typename T> auto parse_any_value_of(const std::vector<T>& values) -> ParseResult<T> {
        for (const auto& value : values) {
            if (peek_value(value)) {
                return parse_value(value);
            }
        }
        std::vector<std::string> texts;
        texts.reserve(values.size());
        for (const auto& value : values) {
            texts.push_back(unparse(value));
        }
        return expected_one_of(texts);
    }

    template <typename T> [[nodiscard]] auto peek_any_value_of(const std::vector<T>& values) const
        -> bool {
        ParseStream lookahead = fork();
        return is_ok(lookahead.parse_any_value_of(values));
    }

    // ========================================================================
    // Literals and Patterns
    // ========================================================================

    /// Matches a regular expression anchored at the cursor.
    auto parse_regex(const Pattern& pattern) -> ParseResult<parsable::Exact>;
    [[nodiscard]] auto peek_regex(const Pattern& pattern) const -> bool;

    auto parse_str(std::string_view text) -> ParseResult<parsable::Exact>;
    [[nodiscard]] auto peek_str(std::string_view text) const -> bool;

    /// ASCII case-insensitive; the match holds the source's own text.
    auto parse_istr(std::string_view text) -> ParseResult<parsable::Exact>;
    [[nodiscard]] auto peek_istr(std::string_view text) const -> bool;

    auto parse_any_str_of(const std::vector<std::string_view>& texts) -> ParseResult<StrMatch>;
    [[nodiscard]] auto peek_any_str_of(const std::vector<std::string_view>& texts) const -> bool;

    auto parse_any_istr_of(const std::vector<std::string_view>& texts) -> ParseResult<StrMatch>;
    [[nodiscard]] auto peek_any_istr_of(const std::vector<std::string_view>& texts) const -> bool;

    /// Consumes `text` if the input starts with it. Otherwise advances past the
    /// common prefix and fails with "expected `<rest of text>`".
    auto match_text(std::string_view text) -> ParseResult<Span>;

    /// `match_text` with ASCII case folding.
    auto match_itext(std::string_view text) -> ParseResult<Span>;

    /// Two streams are equal when they share a source and a position.
    auto operator==(const ParseStream& other) const -> bool {
        return source_ == other.source_ && position_ == other.position_;
    }

private:
    [[nodiscard]] auto expected_one_of(const std::vector<std::string>& texts) const -> Error;

    Rc<Source> source_;
    size_t position_ = 0;
};

// ============================================================================
// Entry Points
// ============================================================================

/// Parses `T` from the start of `source`.
template <typename T> [[nodiscard]] auto parse(Rc<Source> source) -> ParseResult<T> {
    ParseStream stream(std::move(source));
    return stream.parse<T>();
}

/// Parses `T` from the start of `text`.
template <typename T> [[nodiscard]] auto parse(std::string_view text) -> ParseResult<T> {
    return parse<T>(make_rc<Source>(Source::from_str(text)));
}

} // namespace prose

#endif // PROSE_PARSE_STREAM_HPP
