#include "prose/parse/error.hpp"

namespace prose {

Error::Error(Span span, std::string message)
    : diagnostic_(DiagnosticLevel::Error, std::move(span), std::move(message)) {}

auto Error::expected(Span span, std::string_view text) -> Error {
    std::string message = "expected `";
    message += text;
    message += "`";
    return Error(std::move(span), std::move(message));
}

} // namespace prose
