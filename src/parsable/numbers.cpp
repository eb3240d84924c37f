#include "prose/parsable/numbers.hpp"

namespace prose::parsable::detail {

auto scan_digits(ParseStream& stream) -> ParseResult<Span> {
    size_t start = stream.position();
    auto first = stream.parse_digit();
    if (is_err(first))
        return unwrap_err(first);
    while (is_ok(stream.next_digit())) {
        stream.set_position(stream.position() + 1);
    }
    return Span(stream.source(), start, stream.position());
}

} // namespace prose::parsable::detail
