//! # Sources
//!
//! A `Source` is the text every span and parse stream points into: one
//! `IndexedString` plus the path it was read from, if any.
//!
//! Sources are immutable once shared. They are held through `Rc<Source>` so a
//! whole parse tree can reference the same text without copying it; the text
//! lives as long as the last span or stream that refers to it.
//!
//! ```cpp
//! auto loaded = Source::from_file("config.txt");
//! if (is_err(loaded)) {
//!     std::cerr << unwrap_err(loaded).message() << "\n";
//!     return;
//! }
//! auto source = make_rc<Source>(std::move(unwrap(loaded)));
//! ```

#ifndef PROSE_TEXT_SOURCE_HPP
#define PROSE_TEXT_SOURCE_HPP

#include "prose/common.hpp"
#include "prose/text/indexed_string.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>

namespace prose {

/// Text that can be indexed into to define individual `Span`s.
class Source {
public:
    /// An empty source with no path.
    Source() = default;

    [[nodiscard]] static auto from_str(std::string_view text) -> Source;

    /// Reads a whole file.
    ///
    /// No parsing happens here, so only I/O failures and invalid UTF-8
    /// (`std::errc::illegal_byte_sequence`) are reported.
    [[nodiscard]] static auto from_file(const std::filesystem::path& path)
        -> Result<Source, std::error_code>;

    /// The underlying text with its original formatting.
    [[nodiscard]] auto source_text() const -> std::string_view {
        return text_.as_str();
    }

    [[nodiscard]] auto source_path() const -> const std::optional<std::filesystem::path>& {
        return path_;
    }

    void set_path(std::optional<std::filesystem::path> path) {
        path_ = std::move(path);
    }

    [[nodiscard]] auto text() const -> const IndexedString& {
        return text_;
    }

    // Character operations of the underlying IndexedString

    [[nodiscard]] auto len() const -> size_t {
        return text_.len();
    }

    [[nodiscard]] auto byte_len() const -> size_t {
        return text_.byte_len();
    }

    [[nodiscard]] auto empty() const -> bool {
        return text_.empty();
    }

    [[nodiscard]] auto char_at(size_t index) const -> std::optional<char32_t> {
        return text_.char_at(index);
    }

    [[nodiscard]] auto as_str() const -> std::string_view {
        return text_.as_str();
    }

    [[nodiscard]] auto slice(size_t start, size_t end) const -> IndexedSlice {
        return text_.slice(start, end);
    }

    [[nodiscard]] auto slice_from(size_t start) const -> IndexedSlice {
        return text_.slice_from(start);
    }

    [[nodiscard]] auto slice_to(size_t end) const -> IndexedSlice {
        return text_.slice_to(end);
    }

    auto operator==(const Source& other) const -> bool {
        return text_ == other.text_ && path_ == other.path_;
    }

private:
    IndexedString text_;
    std::optional<std::filesystem::path> path_;
};

} // namespace prose

#endif // PROSE_TEXT_SOURCE_HPP
