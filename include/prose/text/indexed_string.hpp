//! # Indexed Strings
//!
//! Character-indexed storage for UTF-8 text.
//!
//! An `IndexedString` keeps three aligned views of the same text: the decoded
//! characters, the byte offset of every character, and the raw bytes. Parsers
//! index and slice by *character* while diagnostics and I/O need the exact
//! bytes; the offset table turns every character range into a byte range in
//! O(1), so no operation re-scans the UTF-8.
//!
//! ```cpp
//! auto text = IndexedString::from_str("h€llo");
//! text.len();                 // 5
//! text.byte_len();            // 7
//! text.slice(1, 3).as_str();  // "€l"
//! text.slice(3, 1).as_str();  // "" (inverted ranges are empty, never an error)
//! ```
//!
//! Invalid UTF-8 decodes to U+FFFD, one character per offending byte; the
//! byte buffer keeps the original bytes.

#ifndef PROSE_TEXT_INDEXED_STRING_HPP
#define PROSE_TEXT_INDEXED_STRING_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace prose {

class IndexedSlice;

/// Owned, immutable, character-indexed UTF-8 text.
class IndexedString {
public:
    /// Creates an empty string.
    IndexedString() = default;

    /// Decodes UTF-8 text.
    [[nodiscard]] static auto from_str(std::string_view text) -> IndexedString;

    /// Encodes a sequence of code points.
    [[nodiscard]] static auto from_chars(std::span<const char32_t> chars) -> IndexedString;

    /// Number of characters.
    [[nodiscard]] auto len() const -> size_t {
        return chars_.size();
    }

    /// Number of bytes.
    [[nodiscard]] auto byte_len() const -> size_t {
        return string_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return chars_.empty();
    }

    /// Returns the character at `index`, or nullopt if `index >= len()`.
    [[nodiscard]] auto char_at(size_t index) const -> std::optional<char32_t>;

    /// Byte offset of character `index`; `byte_len()` for `index >= len()`.
    [[nodiscard]] auto byte_offset(size_t index) const -> size_t;

    /// Character index containing byte `offset`; `len()` past the end.
    [[nodiscard]] auto char_index(size_t offset) const -> size_t;

    [[nodiscard]] auto chars() const -> std::span<const char32_t> {
        return chars_;
    }

    [[nodiscard]] auto as_str() const -> std::string_view {
        return string_;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return string_;
    }

    [[nodiscard]] auto contains(std::string_view text) const -> bool {
        return string_.find(text) != std::string::npos;
    }

    [[nodiscard]] auto starts_with(std::string_view text) const -> bool {
        return std::string_view(string_).starts_with(text);
    }

    /// Characters `[start, end)`, clamped to the string.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> IndexedSlice;

    /// Characters `[start, len())`.
    [[nodiscard]] auto slice_from(size_t start) const -> IndexedSlice;

    /// Characters `[0, end)`.
    [[nodiscard]] auto slice_to(size_t end) const -> IndexedSlice;

    /// Characters `[first, last]`.
    [[nodiscard]] auto slice_inclusive(size_t first, size_t last) const -> IndexedSlice;

    /// The whole string.
    [[nodiscard]] auto slice() const -> IndexedSlice;

    auto operator==(const IndexedString& other) const -> bool {
        return string_ == other.string_;
    }

    auto operator==(std::string_view other) const -> bool {
        return string_ == other;
    }

private:
    friend class IndexedSlice;

    std::vector<char32_t> chars_;
    std::vector<size_t> offsets_; ///< Byte offset of each character.
    std::string string_;
};

/// Borrowed view of a character range of an `IndexedString`.
///
/// A slice never copies and never outlives the string it was taken from.
/// Positions passed to its methods are relative to the slice.
class IndexedSlice {
public:
    /// An empty slice of nothing.
    IndexedSlice() = default;

    IndexedSlice(const IndexedString& source, size_t start, size_t end);

    [[nodiscard]] auto len() const -> size_t {
        return end_ - start_;
    }

    [[nodiscard]] auto byte_len() const -> size_t;

    [[nodiscard]] auto empty() const -> bool {
        return start_ == end_;
    }

    /// First character index covered, in the owning string.
    [[nodiscard]] auto start() const -> size_t {
        return start_;
    }

    /// One past the last character index covered, in the owning string.
    [[nodiscard]] auto end() const -> size_t {
        return end_;
    }

    [[nodiscard]] auto char_at(size_t index) const -> std::optional<char32_t>;

    [[nodiscard]] auto chars() const -> std::span<const char32_t>;

    /// The exact bytes of the covered characters.
    [[nodiscard]] auto as_str() const -> std::string_view;

    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(as_str());
    }

    [[nodiscard]] auto starts_with(std::string_view text) const -> bool {
        return as_str().starts_with(text);
    }

    [[nodiscard]] auto contains(std::string_view text) const -> bool {
        return as_str().find(text) != std::string_view::npos;
    }

    /// Sub-slice `[start, end)` relative to this slice, clamped.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> IndexedSlice;

    [[nodiscard]] auto slice_from(size_t start) const -> IndexedSlice {
        return slice(start, len());
    }

    [[nodiscard]] auto slice_to(size_t end) const -> IndexedSlice {
        return slice(0, end);
    }

    /// ASCII lower-cased copy of the covered text.
    [[nodiscard]] auto to_lower() const -> IndexedString;

    auto operator==(const IndexedSlice& other) const -> bool {
        return as_str() == other.as_str();
    }

    auto operator==(std::string_view other) const -> bool {
        return as_str() == other;
    }

private:
    const IndexedString* source_ = nullptr;
    size_t start_ = 0;
    size_t end_ = 0;
};

inline auto operator<<(std::ostream& out, const IndexedString& text) -> std::ostream& {
    return out << text.as_str();
}

inline auto operator<<(std::ostream& out, const IndexedSlice& slice) -> std::ostream& {
    return out << slice.as_str();
}

// ============================================================================
// Character Helpers
// ============================================================================

/// True for the characters of the Unicode White_Space property.
[[nodiscard]] auto is_whitespace(char32_t c) -> bool;

/// ASCII-only case folding; other characters are returned unchanged.
[[nodiscard]] inline auto to_ascii_lower(char32_t c) -> char32_t {
    return (c >= U'A' && c <= U'Z') ? c + (U'a' - U'A') : c;
}

/// True if `text` is well-formed UTF-8.
[[nodiscard]] auto is_valid_utf8(std::string_view text) -> bool;

/// Appends the UTF-8 encoding of `cp` to `out`.
void encode_utf8(std::string& out, char32_t cp);

/// Length, in characters, of the longest common prefix of `a` and `b`.
[[nodiscard]] auto common_prefix_len(std::span<const char32_t> a, std::span<const char32_t> b)
    -> size_t;

} // namespace prose

#endif // PROSE_TEXT_INDEXED_STRING_HPP
