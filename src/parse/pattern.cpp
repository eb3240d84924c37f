#include "prose/parse/pattern.hpp"

#include "prose/log/log.hpp"

namespace prose {

Pattern::Pattern(std::string source) : source_(std::move(source)) {}

Pattern::Pattern(const char* source) : source_(source) {}

Pattern::Pattern(std::string_view source) : source_(source) {}

Pattern::Pattern(std::regex regex, std::string source)
    : source_(std::move(source)), compiled_(std::move(regex)) {}

auto Pattern::try_to_regex() const -> Result<std::regex, RegexError> {
    if (compiled_) {
        return *compiled_;
    }
    try {
        return std::regex(source_, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        PROSE_LOG_DEBUG("regex", "invalid pattern `" << source_ << "`: " << e.what());
        return RegexError{source_, e.what(), e.code()};
    }
}

auto Pattern::to_regex() const -> std::regex {
    if (compiled_) {
        return *compiled_;
    }
    return std::regex(source_, std::regex::ECMAScript);
}

} // namespace prose
