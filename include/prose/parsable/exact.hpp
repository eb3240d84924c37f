//! # Exact
//!
//! A literal piece of text. `Exact` values are what the string-matching
//! operations of `ParseStream` return, and `Exact::from("...")` is how a
//! grammar asks for a specific keyword or punctuation mark:
//!
//! ```cpp
//! auto dot = stream.parse_value(Exact::from("."));
//! ```

#ifndef PROSE_PARSABLE_EXACT_HPP
#define PROSE_PARSABLE_EXACT_HPP

#include "prose/parse/error.hpp"
#include "prose/text/span.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace prose {
class ParseStream;
} // namespace prose

namespace prose::parsable {

class Exact {
public:
    Exact() = default;
    Exact(std::string text, Span span);

    /// A literal that has not been matched against any source yet.
    [[nodiscard]] static auto from(std::string_view text) -> Exact;

    [[nodiscard]] auto text() const -> const std::string& {
        return text_;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    /// Zero-width: without an expected value there is nothing to match.
    static auto parse(ParseStream& stream) -> ParseResult<Exact>;

    /// Matches `value.text()` at the cursor.
    static auto parse_value(Exact value, ParseStream& stream) -> ParseResult<Exact>;

    void unparse(std::ostream& out) const {
        out << text_;
    }

    /// Literals compare by text, wherever they were matched.
    auto operator==(const Exact& other) const -> bool {
        return text_ == other.text_;
    }

private:
    std::string text_;
    Span span_;
};

inline auto operator<<(std::ostream& out, const Exact& exact) -> std::ostream& {
    return out << exact.text();
}

} // namespace prose::parsable

#endif // PROSE_PARSABLE_EXACT_HPP
