//! # Optional
//!
//! `Optional<T>` parses a `T` if one is present and otherwise succeeds
//! without consuming anything. An absent value still has a span: the empty
//! span at the position where the `T` would have started.

#ifndef PROSE_PARSABLE_OPTIONAL_HPP
#define PROSE_PARSABLE_OPTIONAL_HPP

#include "prose/parse/parsable.hpp"
#include "prose/parse/stream.hpp"

#include <optional>
#include <ostream>

namespace prose::parsable {

template <typename T> class Optional {
public:
    /// An absent value with a blank span.
    Optional() = default;

    Optional(T value) : value_(std::move(value)) {}

    /// An absent value located at `at`.
    [[nodiscard]] static auto none(Span at) -> Optional {
        Optional absent;
        absent.span_ = std::move(at);
        return absent;
    }

    [[nodiscard]] auto has_value() const -> bool {
        return value_.has_value();
    }

    explicit operator bool() const {
        return has_value();
    }

    /// The present value. Throws `std::bad_optional_access` when absent.
    [[nodiscard]] auto value() const -> const T& {
        return value_.value();
    }

    [[nodiscard]] auto get() const -> const std::optional<T>& {
        return value_;
    }

    [[nodiscard]] auto span() const -> Span {
        return value_ ? value_->span() : span_;
    }

    void set_span(Span span) {
        if (value_) {
            value_->set_span(span);
        }
        span_ = std::move(span);
    }

    static auto parse(ParseStream& stream) -> ParseResult<Optional> {
        ParseStream attempt = stream.fork();
        auto parsed = attempt.parse<T>();
        if (is_err(parsed)) {
            return none(Span(stream.source(), stream.position(), stream.position()));
        }
        stream = attempt;
        return Optional(std::move(unwrap(parsed)));
    }

    /// An absent value matches as zero-width; a present one must match as `T`.
    static auto parse_value(Optional value, ParseStream& stream) -> ParseResult<Optional> {
        if (!value.value_) {
            return none(Span(stream.source(), stream.position(), stream.position()));
        }
        auto parsed = stream.parse_value(std::move(*value.value_));
        if (is_err(parsed))
            return unwrap_err(parsed);
        return Optional(std::move(unwrap(parsed)));
    }

    void unparse(std::ostream& out) const {
        if (value_) {
            unparse_to(out, *value_);
        }
    }

    auto operator==(const Optional& other) const -> bool {
        return value_ == other.value_;
    }

private:
    std::optional<T> value_;
    Span span_;
};

} // namespace prose::parsable

#endif // PROSE_PARSABLE_OPTIONAL_HPP
