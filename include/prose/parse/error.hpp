//! # Parse Errors
//!
//! `Error` wraps a single error-level `Diagnostic` anchored to the span where
//! parsing went wrong. Every fallible parse returns a `ParseResult<T>`.

#ifndef PROSE_PARSE_ERROR_HPP
#define PROSE_PARSE_ERROR_HPP

#include "prose/common.hpp"
#include "prose/diag/diagnostic.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace prose {

class Error {
public:
    Error(Span span, std::string message);

    /// An error reading "expected `text`".
    [[nodiscard]] static auto expected(Span span, std::string_view text) -> Error;

    [[nodiscard]] auto diagnostic() const -> const Diagnostic& {
        return diagnostic_;
    }

    /// Releases the diagnostic, e.g. to attach notes before emitting it.
    [[nodiscard]] auto into_diagnostic() && -> Diagnostic {
        return std::move(diagnostic_);
    }

    [[nodiscard]] auto message() const -> const std::string& {
        return diagnostic_.message();
    }

    [[nodiscard]] auto span() const -> Span {
        return diagnostic_.span();
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return diagnostic_.to_string();
    }

    auto operator==(const Error& other) const -> bool = default;

private:
    Diagnostic diagnostic_;
};

inline auto operator<<(std::ostream& out, const Error& error) -> std::ostream& {
    return out << error.diagnostic();
}

/// The result of every parse operation.
template <typename T> using ParseResult = Result<T, Error>;

} // namespace prose

#endif // PROSE_PARSE_ERROR_HPP
