//! # The Parsable Contract
//!
//! A grammar type `T` is any value type providing:
//!
//! | member                                                | required |
//! |-------------------------------------------------------|----------|
//! | `static auto parse(ParseStream&) -> ParseResult<T>`   | yes      |
//! | `auto span() const -> Span`                           | yes      |
//! | `void set_span(Span)`                                 | yes      |
//! | `static auto parse_value(T, ParseStream&) -> ParseResult<T>` | no |
//! | `void unparse(std::ostream&) const`                   | no       |
//!
//! Dispatch is static: `ParseStream::parse_value<T>` calls `T::parse_value`
//! when the type declares one and otherwise matches the value's unparsed text
//! literally. `unparse` defaults to the exact source text of the value's span.
//!
//! Every grammar type obeys the round-trip law: unparsing a parsed value
//! reproduces the consumed text byte for byte, and parsing that text again
//! yields an equal value.

#ifndef PROSE_PARSE_PARSABLE_HPP
#define PROSE_PARSE_PARSABLE_HPP

#include "prose/text/span.hpp"

#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace prose {

class ParseStream;

/// True if `T` declares its own `parse_value`.
template <typename T, typename = void> struct has_parse_value : std::false_type {};

template <typename T>
struct has_parse_value<T, std::void_t<decltype(T::parse_value(std::declval<T>(),
                                                               std::declval<ParseStream&>()))>>
    : std::true_type {};

/// True if `T` declares its own `unparse`.
template <typename T, typename = void> struct has_unparse : std::false_type {};

template <typename T>
struct has_unparse<T, std::void_t<decltype(std::declval<const T&>().unparse(
                          std::declval<std::ostream&>()))>> : std::true_type {};

/// Writes the textual form of `value`.
template <typename T> void unparse_to(std::ostream& out, const T& value) {
    if constexpr (has_unparse<T>::value) {
        value.unparse(out);
    } else {
        out << value.span().source_text();
    }
}

/// The textual form of `value`; the inverse of parsing it.
template <typename T> [[nodiscard]] auto unparse(const T& value) -> std::string {
    std::ostringstream out;
    unparse_to(out, value);
    return out.str();
}

} // namespace prose

#endif // PROSE_PARSE_PARSABLE_HPP
