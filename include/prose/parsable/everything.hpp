//! # Everything and Nothing
//!
//! `Everything` swallows the rest of the input; `Nothing` matches only at the
//! end of it. Together they bracket a grammar: a top-level type usually ends
//! by parsing `Nothing` to reject trailing garbage.

#ifndef PROSE_PARSABLE_EVERYTHING_HPP
#define PROSE_PARSABLE_EVERYTHING_HPP

#include "prose/parse/error.hpp"
#include "prose/text/span.hpp"

#include <ostream>

namespace prose {
class ParseStream;
} // namespace prose

namespace prose::parsable {

/// All remaining input, possibly none.
class Everything {
public:
    Everything() = default;
    explicit Everything(Span span) : span_(std::move(span)) {}

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    static auto parse(ParseStream& stream) -> ParseResult<Everything>;

    /// Succeeds only if the remaining input equals the expected text exactly.
    /// The stream does not move on failure.
    static auto parse_value(Everything value, ParseStream& stream) -> ParseResult<Everything>;

    auto operator==(const Everything& other) const -> bool {
        return span_.source_text() == other.span_.source_text();
    }

private:
    Span span_;
};

/// The end of input. Always zero-width.
class Nothing {
public:
    Nothing() = default;
    explicit Nothing(Span span) : span_(std::move(span)) {}

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    static auto parse(ParseStream& stream) -> ParseResult<Nothing>;

    static auto parse_value(Nothing value, ParseStream& stream) -> ParseResult<Nothing>;

    void unparse(std::ostream&) const {}

    auto operator==(const Nothing&) const -> bool {
        return true;
    }

private:
    Span span_;
};

} // namespace prose::parsable

#endif // PROSE_PARSABLE_EVERYTHING_HPP
