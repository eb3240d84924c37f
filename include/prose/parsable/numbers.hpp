//! # Integers
//!
//! Decimal integers of every fixed width. The span keeps the text exactly as
//! written (leading zeros, the minus sign), so `unparse` reproduces it; a
//! value built in code with no span unparses to its canonical form.
//!
//! ```cpp
//! auto port = prose::parse<U16>("08080");   // value 8080, text "08080"
//! auto big = prose::parse<U8>("256");       // "number too large"
//! ```
//!
//! Integers are parsed on a fork: a failure leaves the stream untouched.

#ifndef PROSE_PARSABLE_NUMBERS_HPP
#define PROSE_PARSABLE_NUMBERS_HPP

#include "prose/parse/stream.hpp"

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

namespace prose::parsable {

namespace detail {

/// Consumes one or more decimal digits; "expected digit (0-9)" if there are none.
auto scan_digits(ParseStream& stream) -> ParseResult<Span>;

} // namespace detail

/// An unsigned decimal integer stored as `I`.
template <typename I> class UnsignedInt {
    static_assert(std::is_unsigned_v<I>, "UnsignedInt requires an unsigned type");

public:
    UnsignedInt() = default;
    UnsignedInt(I value) : value_(value) {}
    UnsignedInt(I value, Span span) : value_(value), span_(std::move(span)) {}

    [[nodiscard]] auto value() const -> I {
        return value_;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    static auto parse(ParseStream& stream) -> ParseResult<UnsignedInt> {
        ParseStream attempt = stream.fork();
        auto digits = detail::scan_digits(attempt);
        if (is_err(digits))
            return unwrap_err(digits);
        const Span& span = unwrap(digits);

        constexpr I max = std::numeric_limits<I>::max();
        I value = 0;
        for (char32_t c : span.source_text().chars()) {
            I digit = static_cast<I>(c - U'0');
            if (value > static_cast<I>((max - digit) / 10)) {
                return Error(span, "number too large");
            }
            value = static_cast<I>(value * 10 + digit);
        }
        stream = attempt;
        return UnsignedInt(value, span);
    }

    void unparse(std::ostream& out) const {
        if (span_.is_blank()) {
            out << std::to_string(static_cast<uint64_t>(value_));
        } else {
            out << span_.source_text();
        }
    }

    auto operator==(const UnsignedInt& other) const -> bool {
        return value_ == other.value_;
    }

private:
    I value_ = 0;
    Span span_;
};

/// A signed decimal integer with an optional leading '-'.
template <typename I> class SignedInt {
    static_assert(std::is_signed_v<I> && std::is_integral_v<I>,
                  "SignedInt requires a signed integer type");

public:
    SignedInt() = default;
    SignedInt(I value) : value_(value) {}
    SignedInt(I value, Span span) : value_(value), span_(std::move(span)) {}

    [[nodiscard]] auto value() const -> I {
        return value_;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    static auto parse(ParseStream& stream) -> ParseResult<SignedInt> {
        ParseStream attempt = stream.fork();
        size_t start = attempt.position();
        bool negative = attempt.peek_str("-");
        if (negative) {
            attempt.set_position(start + 1);
        }
        auto digits = detail::scan_digits(attempt);
        if (is_err(digits))
            return unwrap_err(digits);
        Span span(attempt.source(), start, attempt.position());

        constexpr I max = std::numeric_limits<I>::max();
        constexpr I min = std::numeric_limits<I>::min();
        I value = 0;
        for (char32_t c : unwrap(digits).source_text().chars()) {
            I digit = static_cast<I>(c - U'0');
            if (negative) {
                if (value < static_cast<I>((min + digit) / 10)) {
                    return Error(span, "number too small");
                }
                value = static_cast<I>(value * 10 - digit);
            } else {
                if (value > static_cast<I>((max - digit) / 10)) {
                    return Error(span, "number too large");
                }
                value = static_cast<I>(value * 10 + digit);
            }
        }
        stream = attempt;
        return SignedInt(value, span);
    }

    void unparse(std::ostream& out) const {
        if (span_.is_blank()) {
            out << std::to_string(static_cast<int64_t>(value_));
        } else {
            out << span_.source_text();
        }
    }

    auto operator==(const SignedInt& other) const -> bool {
        return value_ == other.value_;
    }

private:
    I value_ = 0;
    Span span_;
};

using U8 = UnsignedInt<uint8_t>;
using U16 = UnsignedInt<uint16_t>;
using U32 = UnsignedInt<uint32_t>;
using U64 = UnsignedInt<uint64_t>;
using USize = UnsignedInt<size_t>;

using I8 = SignedInt<int8_t>;
using I16 = SignedInt<int16_t>;
using I32 = SignedInt<int32_t>;
using I64 = SignedInt<int64_t>;

} // namespace prose::parsable

#endif // PROSE_PARSABLE_NUMBERS_HPP
