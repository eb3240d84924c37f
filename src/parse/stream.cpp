#include "prose/parse/stream.hpp"

#include "prose/log/log.hpp"

#include <algorithm>

namespace prose {

using parsable::Exact;

ParseStream::ParseStream(Rc<Source> source, size_t position) : source_(std::move(source)) {
    if (!source_) {
        source_ = make_rc<Source>();
    }
    position_ = std::min(position, source_->len());
}

auto ParseStream::from_str(std::string_view text) -> ParseStream {
    return ParseStream(make_rc<Source>(Source::from_str(text)));
}

void ParseStream::set_position(size_t position) {
    position_ = std::min(position, source_->len());
}

auto ParseStream::current_span() const -> Span {
    return Span(source_, position_, std::min(source_->len(), position_ + 1));
}

auto ParseStream::remaining_span() const -> Span {
    return Span(source_, position_, source_->len());
}

// ============================================================================
// Cursor Movement
// ============================================================================

auto ParseStream::consume(size_t n) -> ParseResult<Span> {
    size_t available = source_->len() - position_;
    if (available < n) {
        return Error(remaining_span(), "expected at least " + std::to_string(n) +
                                           " more characters, found " + std::to_string(available));
    }
    size_t start = position_;
    position_ += n;
    return Span(source_, start, position_);
}

auto ParseStream::consume_remaining() -> Span {
    Span span = remaining_span();
    position_ = source_->len();
    return span;
}

auto ParseStream::next_char() const -> ParseResult<char32_t> {
    auto c = source_->char_at(position_);
    if (!c) {
        return Error(current_span(), "unexpected end of input");
    }
    return *c;
}

auto ParseStream::parse_char() -> ParseResult<char32_t> {
    auto c = next_char();
    if (is_ok(c)) {
        position_ += 1;
    }
    return c;
}

auto ParseStream::next_digit() const -> ParseResult<uint8_t> {
    auto c = next_char();
    if (is_err(c))
        return unwrap_err(c);
    char32_t ch = unwrap(c);
    if (ch < U'0' || ch > U'9') {
        return Error(current_span(), "expected digit (0-9)");
    }
    return static_cast<uint8_t>(ch - U'0');
}

auto ParseStream::parse_digit() -> ParseResult<uint8_t> {
    auto digit = next_digit();
    if (is_ok(digit)) {
        position_ += 1;
    }
    return digit;
}

auto ParseStream::next_alpha() const -> ParseResult<char32_t> {
    auto c = next_char();
    if (is_err(c))
        return c;
    char32_t ch = unwrap(c);
    if (!((ch >= U'a' && ch <= U'z') || (ch >= U'A' && ch <= U'Z'))) {
        return Error(current_span(), "expected alphabetic (A-Z|a-z)");
    }
    return ch;
}

auto ParseStream::parse_alpha() -> ParseResult<char32_t> {
    auto c = next_alpha();
    if (is_ok(c)) {
        position_ += 1;
    }
    return c;
}

// ============================================================================
// Literal Matching
// ============================================================================

namespace {

/// Number of leading characters of `a` and `b` equal under ASCII case folding.
auto common_iprefix_len(std::span<const char32_t> a, std::span<const char32_t> b) -> size_t {
    size_t n = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < n && to_ascii_lower(a[i]) == to_ascii_lower(b[i])) {
        i += 1;
    }
    return i;
}

} // namespace

auto ParseStream::match_text(std::string_view text) -> ParseResult<Span> {
    auto expected = IndexedString::from_str(text);
    size_t prefix = common_prefix_len(expected.chars(), remaining().chars());
    if (prefix == expected.len()) {
        return consume(expected.len());
    }

    Span missing(source_, position_ + prefix, position_ + expected.len());
    PROSE_LOG_TRACE("stream", "literal `" << text << "` diverges after " << prefix
                                          << " chars at " << position_);
    position_ += prefix;
    return Error::expected(missing, expected.slice_from(prefix).as_str());
}

auto ParseStream::match_itext(std::string_view text) -> ParseResult<Span> {
    auto expected = IndexedString::from_str(text);
    size_t prefix = common_iprefix_len(expected.chars(), remaining().chars());
    if (prefix == expected.len()) {
        return consume(expected.len());
    }

    Span missing(source_, position_ + prefix, position_ + expected.len());
    position_ += prefix;
    return Error::expected(missing, expected.slice_from(prefix).as_str());
}

auto ParseStream::parse_str(std::string_view text) -> ParseResult<Exact> {
    return parse_value(Exact::from(text));
}

auto ParseStream::peek_str(std::string_view text) const -> bool {
    return remaining().starts_with(text);
}

auto ParseStream::parse_istr(std::string_view text) -> ParseResult<Exact> {
    auto matched = match_itext(text);
    if (is_err(matched))
        return unwrap_err(matched);
    Span span = unwrap(matched);
    return Exact(span.source_text().to_string(), span);
}

auto ParseStream::peek_istr(std::string_view text) const -> bool {
    ParseStream lookahead = fork();
    return is_ok(lookahead.match_itext(text));
}

auto ParseStream::expected_one_of(const std::vector<std::string>& texts) const -> Error {
    std::string message = "expected one of ";
    for (size_t i = 0; i < texts.size(); ++i) {
        if (i > 0) {
            message += ", ";
        }
        message += "`" + texts[i] + "`";
    }
    return Error(current_span(), std::move(message));
}

auto ParseStream::parse_any_str_of(const std::vector<std::string_view>& texts)
    -> ParseResult<StrMatch> {
    for (size_t i = 0; i < texts.size(); ++i) {
        if (peek_str(texts[i])) {
            auto matched = parse_str(texts[i]);
            if (is_err(matched))
                return unwrap_err(matched);
            return StrMatch{std::move(unwrap(matched)), i};
        }
    }
    return expected_one_of(std::vector<std::string>(texts.begin(), texts.end()));
}

auto ParseStream::peek_any_str_of(const std::vector<std::string_view>& texts) const -> bool {
    return std::any_of(texts.begin(), texts.end(),
                       [this](std::string_view text) { return peek_str(text); });
}

auto ParseStream::parse_any_istr_of(const std::vector<std::string_view>& texts)
    -> ParseResult<StrMatch> {
    for (size_t i = 0; i < texts.size(); ++i) {
        if (peek_istr(texts[i])) {
            auto matched = parse_istr(texts[i]);
            if (is_err(matched))
                return unwrap_err(matched);
            return StrMatch{std::move(unwrap(matched)), i};
        }
    }
    return expected_one_of(std::vector<std::string>(texts.begin(), texts.end()));
}

auto ParseStream::peek_any_istr_of(const std::vector<std::string_view>& texts) const -> bool {
    return std::any_of(texts.begin(), texts.end(),
                       [this](std::string_view text) { return peek_istr(text); });
}

// ============================================================================
// Patterns
// ============================================================================

auto ParseStream::parse_regex(const Pattern& pattern) -> ParseResult<Exact> {
    std::regex regex = pattern.to_regex();
    const auto& text = source_->text();
    std::string_view rest = text.as_str().substr(text.byte_offset(position_));

    std::cmatch match;
    bool found = std::regex_search(rest.data(), rest.data() + rest.size(), match, regex,
                                   std::regex_constants::match_continuous);
    if (!found) {
        PROSE_LOG_TRACE("regex", "`" << pattern.source() << "` does not match at " << position_);
        return Error(current_span(), "expected match for `" + pattern.source() + "`");
    }

    // A match ending inside a multi-byte character takes the whole character
    size_t end_byte = text.byte_offset(position_) + static_cast<size_t>(match.length(0));
    size_t end = text.char_index(end_byte);
    if (end < text.len() && text.byte_offset(end) < end_byte) {
        end += 1;
    }

    Span span(source_, position_, end);
    position_ = span.char_range().end;
    return Exact(span.source_text().to_string(), span);
}

auto ParseStream::peek_regex(const Pattern& pattern) const -> bool {
    ParseStream lookahead = fork();
    return is_ok(lookahead.parse_regex(pattern));
}

} // namespace prose
