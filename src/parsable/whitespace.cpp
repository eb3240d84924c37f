#include "prose/parsable/whitespace.hpp"

#include "prose/parse/stream.hpp"

namespace prose::parsable {

auto Whitespace::parse(ParseStream& stream) -> ParseResult<Whitespace> {
    size_t start = stream.position();
    while (true) {
        auto c = stream.next_char();
        if (is_err(c) || !is_whitespace(unwrap(c))) {
            break;
        }
        stream.set_position(stream.position() + 1);
    }
    if (stream.position() == start) {
        return Error(stream.current_span(), "expected whitespace");
    }
    return Whitespace(Span(stream.source(), start, stream.position()));
}

} // namespace prose::parsable
