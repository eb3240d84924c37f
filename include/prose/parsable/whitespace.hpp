#ifndef PROSE_PARSABLE_WHITESPACE_HPP
#define PROSE_PARSABLE_WHITESPACE_HPP

#include "prose/parse/error.hpp"
#include "prose/text/span.hpp"

namespace prose {
class ParseStream;
} // namespace prose

namespace prose::parsable {

/// One or more Unicode whitespace characters, newlines included.
class Whitespace {
public:
    Whitespace() = default;
    explicit Whitespace(Span span) : span_(std::move(span)) {}

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    static auto parse(ParseStream& stream) -> ParseResult<Whitespace>;

    auto operator==(const Whitespace& other) const -> bool {
        return span_.source_text() == other.span_.source_text();
    }

private:
    Span span_;
};

} // namespace prose::parsable

#endif // PROSE_PARSABLE_WHITESPACE_HPP
