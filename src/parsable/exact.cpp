#include "prose/parsable/exact.hpp"

#include "prose/parse/stream.hpp"

namespace prose::parsable {

Exact::Exact(std::string text, Span span) : text_(std::move(text)), span_(std::move(span)) {}

auto Exact::from(std::string_view text) -> Exact {
    return Exact(std::string(text), Span::blank());
}

auto Exact::parse(ParseStream& stream) -> ParseResult<Exact> {
    return Exact("", Span(stream.source(), stream.position(), stream.position()));
}

auto Exact::parse_value(Exact value, ParseStream& stream) -> ParseResult<Exact> {
    auto matched = stream.match_text(value.text_);
    if (is_err(matched))
        return unwrap_err(matched);
    value.span_ = std::move(unwrap(matched));
    return value;
}

} // namespace prose::parsable
