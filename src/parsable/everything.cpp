#include "prose/parsable/everything.hpp"

#include "prose/parse/stream.hpp"

namespace prose::parsable {

auto Everything::parse(ParseStream& stream) -> ParseResult<Everything> {
    return Everything(stream.consume_remaining());
}

auto Everything::parse_value(Everything value, ParseStream& stream) -> ParseResult<Everything> {
    auto expected = value.span_.source_text();
    auto remaining = stream.remaining();
    if (remaining == expected) {
        auto span = stream.consume(remaining.len());
        if (is_err(span))
            return unwrap_err(span);
        value.span_ = std::move(unwrap(span));
        return value;
    }

    size_t prefix = common_prefix_len(expected.chars(), remaining.chars());
    ParseStream fork = stream.fork();
    fork.set_position(stream.position() + prefix);
    Span missing_span = fork.current_span();
    auto missing = expected.slice_from(prefix);
    if (!missing.empty()) {
        return Error::expected(missing_span, missing.as_str());
    }
    return Error(missing_span, "expected end of input");
}

auto Nothing::parse(ParseStream& stream) -> ParseResult<Nothing> {
    if (!stream.at_end()) {
        Span found = stream.current_span();
        return Error(found, "expected nothing, found `" + found.source_text().to_string() + "`");
    }
    return Nothing(stream.current_span());
}

auto Nothing::parse_value(Nothing, ParseStream& stream) -> ParseResult<Nothing> {
    return parse(stream);
}

} // namespace prose::parsable
