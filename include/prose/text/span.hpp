//! # Spans
//!
//! A `Span` is a shared reference to a `Source` plus a range of characters in
//! it. Spans never copy text: `source_text()` slices the source on demand, so
//! every node of a parse tree can keep the exact original text it came from.
//!
//! ```cpp
//! auto source = make_rc<Source>(Source::from_str("Hello, world!"));
//! Span hello(source, 0, 5);
//! Span world(source, 7, 12);
//! auto both = hello.join(world);        // "Hello, world"
//! ```
//!
//! Positions are character indices; `byte_range()` maps them to bytes.
//! Line and column numbers are zero-indexed and computed by scanning from the
//! start of the source on every call.

#ifndef PROSE_TEXT_SPAN_HPP
#define PROSE_TEXT_SPAN_HPP

#include "prose/common.hpp"
#include "prose/text/source.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <ostream>
#include <vector>

namespace prose {

/// A line and column within a `Source`, both zero-indexed.
struct LineCol {
    size_t line = 0;
    size_t col = 0;

    [[nodiscard]] auto operator==(const LineCol& other) const -> bool = default;
};

/// A half-open `[start, end)` range.
struct Range {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] auto operator==(const Range& other) const -> bool = default;

    [[nodiscard]] auto len() const -> size_t {
        return end - start;
    }
};

/// Two non-blank spans from different sources cannot be joined.
struct SpanJoinError {
    [[nodiscard]] auto message() const -> const char* {
        return "the specified spans do not come from the same source";
    }

    [[nodiscard]] auto operator==(const SpanJoinError& other) const -> bool = default;
};

/// One source line touched by a span, with the flagged character columns.
struct SourceLine {
    IndexedSlice text;
    size_t start_col = 0;
    size_t end_col = 0;
};

class SourceLines;

/// A contiguous range of characters within a shared `Source`.
class Span {
public:
    /// The blank span: an empty source and an empty range.
    Span();

    /// Creates a span over characters `[start, end)`; the end is clamped to the
    /// source length and the start to the end.
    Span(Rc<Source> source, size_t start, size_t end);

    /// Joining a blank span with any other span yields the other span.
    [[nodiscard]] static auto blank() -> Span {
        return Span();
    }

    [[nodiscard]] auto source() const -> const Rc<Source>& {
        return source_;
    }

    [[nodiscard]] auto source_text() const -> IndexedSlice {
        return source_->slice(start_, end_);
    }

    [[nodiscard]] auto source_path() const -> const std::optional<std::filesystem::path>& {
        return source_->source_path();
    }

    [[nodiscard]] auto char_range() const -> Range {
        return Range{start_, end_};
    }

    /// The byte offsets of the span, derived from the source's offset table.
    [[nodiscard]] auto byte_range() const -> Range;

    [[nodiscard]] auto len() const -> size_t {
        return end_ - start_;
    }

    /// Line and column of the first character.
    [[nodiscard]] auto start() const -> LineCol;

    /// Line and column just past the last character.
    [[nodiscard]] auto end() const -> LineCol;

    /// Every source line the span touches, with the flagged columns.
    [[nodiscard]] auto source_lines() const -> SourceLines;

    /// The smallest span covering both spans.
    [[nodiscard]] auto join(const Span& other) const -> Result<Span, SpanJoinError>;

    /// True if the range is empty.
    [[nodiscard]] auto is_blank() const -> bool {
        return start_ == end_;
    }

    /// True if both spans point into the same source text.
    [[nodiscard]] auto same_source(const Span& other) const -> bool;

    auto operator==(const Span& other) const -> bool;

private:
    Rc<Source> source_;
    size_t start_ = 0;
    size_t end_ = 0;
};

auto operator<<(std::ostream& out, const Span& span) -> std::ostream&;

// ============================================================================
// Source Lines
// ============================================================================

/// Lazy, restartable sequence of the lines a span touches.
///
/// Lines split on '\n'; a trailing '\r' is not part of the line and the empty
/// segment after a final newline is not a line. Every `begin()` starts over.
class SourceLines {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = SourceLine;
        using difference_type = std::ptrdiff_t;
        using pointer = const SourceLine*;
        using reference = const SourceLine&;

        Iterator() = default;

        auto operator*() const -> reference {
            return current_;
        }

        auto operator->() const -> pointer {
            return &current_;
        }

        auto operator++() -> Iterator&;

        auto operator++(int) -> Iterator {
            Iterator copy = *this;
            ++*this;
            return copy;
        }

        auto operator==(const Iterator& other) const -> bool {
            return done_ == other.done_ && (done_ || line_ == other.line_);
        }

    private:
        friend class SourceLines;

        Iterator(const SourceLines* owner, size_t line, size_t line_start);

        /// Loads `current_` for `line_`, or marks the iterator done.
        void load();

        const SourceLines* owner_ = nullptr;
        size_t line_ = 0;       ///< Zero-indexed line number
        size_t line_start_ = 0; ///< Character index where the line starts
        SourceLine current_;
        bool done_ = true;
    };

    SourceLines(Rc<Source> source, LineCol start, LineCol end);

    [[nodiscard]] auto begin() const -> Iterator;

    [[nodiscard]] auto end() const -> Iterator {
        return Iterator();
    }

    /// Collects every line eagerly.
    [[nodiscard]] auto to_vector() const -> std::vector<SourceLine>;

private:
    Rc<Source> source_;
    LineCol start_;
    LineCol end_;
};

// ============================================================================
// Spanned
// ============================================================================

/// The Spanned contract: a type exposes `auto span() const -> Span`, the
/// primary span of the value. Types holding several spans join them rather
/// than storing a separate primary span.
///
/// `Span` itself is trivially spanned.
[[nodiscard]] inline auto span_of(const Span& span) -> Span {
    return span;
}

template <typename T> [[nodiscard]] auto span_of(const T& value) -> Span {
    return value.span();
}

/// Several spans that together locate one value, e.g. a key and its value.
using MultiSpan = std::vector<Span>;

/// Joins a list of spans; an empty list yields the blank span.
[[nodiscard]] auto join_spans(const MultiSpan& spans) -> Result<Span, SpanJoinError>;

} // namespace prose

#endif // PROSE_TEXT_SPAN_HPP
