#include "prose/text/indexed_string.hpp"

#include <algorithm>
#include <iterator>

namespace prose {

namespace {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

/// False for surrogates and values past U+10FFFF, which have no UTF-8 form.
auto is_scalar_value(char32_t cp) -> bool {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

/// Decodes one UTF-8 sequence starting at `pos`, returning the code point and
/// its byte length. Malformed sequences decode as U+FFFD of length 1.
auto decode_one(std::string_view text, size_t pos) -> std::pair<char32_t, size_t> {
    auto byte = static_cast<unsigned char>(text[pos]);
    if (byte < 0x80) {
        return {byte, 1};
    }

    size_t len;
    char32_t cp;
    char32_t min;
    if ((byte & 0xE0) == 0xC0) {
        len = 2;
        cp = byte & 0x1F;
        min = 0x80;
    } else if ((byte & 0xF0) == 0xE0) {
        len = 3;
        cp = byte & 0x0F;
        min = 0x800;
    } else if ((byte & 0xF8) == 0xF0) {
        len = 4;
        cp = byte & 0x07;
        min = 0x10000;
    } else {
        return {REPLACEMENT_CHAR, 1};
    }

    if (pos + len > text.size()) {
        return {REPLACEMENT_CHAR, 1};
    }
    for (size_t i = 1; i < len; ++i) {
        auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return {REPLACEMENT_CHAR, 1};
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    // Overlong encodings, surrogates and out-of-range values
    if (cp < min || !is_scalar_value(cp)) {
        return {REPLACEMENT_CHAR, 1};
    }
    return {cp, len};
}

} // namespace

// ============================================================================
// IndexedString
// ============================================================================

auto IndexedString::from_str(std::string_view text) -> IndexedString {
    IndexedString result;
    result.string_ = std::string(text);
    result.chars_.reserve(text.size());
    result.offsets_.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        auto [cp, len] = decode_one(text, pos);
        result.chars_.push_back(cp);
        result.offsets_.push_back(pos);
        pos += len;
    }
    return result;
}

auto IndexedString::from_chars(std::span<const char32_t> chars) -> IndexedString {
    IndexedString result;
    result.chars_.reserve(chars.size());
    result.offsets_.reserve(chars.size());

    for (char32_t c : chars) {
        if (!is_scalar_value(c)) {
            c = REPLACEMENT_CHAR;
        }
        result.chars_.push_back(c);
        result.offsets_.push_back(result.string_.size());
        encode_utf8(result.string_, c);
    }
    return result;
}

auto IndexedString::char_at(size_t index) const -> std::optional<char32_t> {
    if (index >= chars_.size()) {
        return std::nullopt;
    }
    return chars_[index];
}

auto IndexedString::byte_offset(size_t index) const -> size_t {
    if (index >= offsets_.size()) {
        return string_.size();
    }
    return offsets_[index];
}

auto IndexedString::char_index(size_t offset) const -> size_t {
    if (offset >= string_.size()) {
        return chars_.size();
    }
    // Last character starting at or before `offset`
    auto it = std::upper_bound(offsets_.begin(), offsets_.end(), offset);
    return static_cast<size_t>(std::distance(offsets_.begin(), it)) - 1;
}

auto IndexedString::slice(size_t start, size_t end) const -> IndexedSlice {
    return IndexedSlice(*this, start, end);
}

auto IndexedString::slice_from(size_t start) const -> IndexedSlice {
    return IndexedSlice(*this, start, len());
}

auto IndexedString::slice_to(size_t end) const -> IndexedSlice {
    return IndexedSlice(*this, 0, end);
}

auto IndexedString::slice_inclusive(size_t first, size_t last) const -> IndexedSlice {
    // `last + 1` would wrap for SIZE_MAX; clamping handles everything else
    size_t end = last >= len() ? len() : last + 1;
    return IndexedSlice(*this, first, end);
}

auto IndexedString::slice() const -> IndexedSlice {
    return IndexedSlice(*this, 0, len());
}

// ============================================================================
// IndexedSlice
// ============================================================================

IndexedSlice::IndexedSlice(const IndexedString& source, size_t start, size_t end)
    : source_(&source) {
    end_ = std::min(end, source.len());
    start_ = std::min(start, end_);
}

auto IndexedSlice::byte_len() const -> size_t {
    if (!source_) {
        return 0;
    }
    return source_->byte_offset(end_) - source_->byte_offset(start_);
}

auto IndexedSlice::char_at(size_t index) const -> std::optional<char32_t> {
    if (!source_ || index >= len()) {
        return std::nullopt;
    }
    return source_->chars_[start_ + index];
}

auto IndexedSlice::chars() const -> std::span<const char32_t> {
    if (!source_) {
        return {};
    }
    return std::span<const char32_t>(source_->chars_).subspan(start_, len());
}

auto IndexedSlice::as_str() const -> std::string_view {
    if (!source_) {
        return {};
    }
    size_t start_byte = source_->byte_offset(start_);
    size_t end_byte = source_->byte_offset(end_);
    return std::string_view(source_->string_).substr(start_byte, end_byte - start_byte);
}

auto IndexedSlice::slice(size_t start, size_t end) const -> IndexedSlice {
    if (!source_) {
        return {};
    }
    end = std::min(end, len());
    start = std::min(start, end);
    return IndexedSlice(*source_, start_ + start, start_ + end);
}

auto IndexedSlice::to_lower() const -> IndexedString {
    std::vector<char32_t> lowered;
    lowered.reserve(len());
    for (char32_t c : chars()) {
        lowered.push_back(to_ascii_lower(c));
    }
    return IndexedString::from_chars(lowered);
}

// ============================================================================
// Character Helpers
// ============================================================================

auto is_whitespace(char32_t c) -> bool {
    switch (c) {
    case 0x09: // \t
    case 0x0A: // \n
    case 0x0B:
    case 0x0C:
    case 0x0D: // \r
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

auto is_valid_utf8(std::string_view text) -> bool {
    size_t pos = 0;
    while (pos < text.size()) {
        auto [cp, len] = decode_one(text, pos);
        if (cp == REPLACEMENT_CHAR && len == 1) {
            return false;
        }
        pos += len;
    }
    return true;
}

void encode_utf8(std::string& out, char32_t cp) {
    if (!is_scalar_value(cp)) {
        cp = REPLACEMENT_CHAR;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto common_prefix_len(std::span<const char32_t> a, std::span<const char32_t> b) -> size_t {
    size_t n = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < n && a[i] == b[i]) {
        ++i;
    }
    return i;
}

} // namespace prose
