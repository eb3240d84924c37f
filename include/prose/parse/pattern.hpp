//! # Patterns
//!
//! A `Pattern` is regular expression source text together with the means to
//! compile it. Grammar code usually passes string literals straight to
//! `ParseStream::parse_regex`; the implicit conversions build the pattern.
//!
//! Invalid syntax in a pattern is a mistake in the grammar, not in the input:
//! `to_regex()` throws `std::regex_error`, while `try_to_regex()` reports it
//! as a `RegexError` for callers that build patterns at runtime.

#ifndef PROSE_PARSE_PATTERN_HPP
#define PROSE_PARSE_PATTERN_HPP

#include "prose/common.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace prose {

/// Describes a pattern that failed to compile.
struct RegexError {
    std::string pattern;
    std::string message;
    std::regex_constants::error_type code;
};

class Pattern {
public:
    Pattern(std::string source);
    Pattern(const char* source);
    Pattern(std::string_view source);

    /// Wraps an already compiled expression; `source` is used in messages.
    Pattern(std::regex regex, std::string source);

    [[nodiscard]] auto source() const -> const std::string& {
        return source_;
    }

    /// Compiles the pattern, reporting invalid syntax as an error.
    [[nodiscard]] auto try_to_regex() const -> Result<std::regex, RegexError>;

    /// Compiles the pattern; throws `std::regex_error` on invalid syntax.
    [[nodiscard]] auto to_regex() const -> std::regex;

private:
    std::string source_;
    std::optional<std::regex> compiled_;
};

} // namespace prose

#endif // PROSE_PARSE_PATTERN_HPP
