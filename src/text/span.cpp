#include "prose/text/span.hpp"

#include "prose/log/log.hpp"

#include <algorithm>

namespace prose {

namespace {

auto empty_source() -> const Rc<Source>& {
    static const Rc<Source> empty = make_rc<Source>();
    return empty;
}

/// Advances `pos` over `[from, to)` of `text`, counting newlines.
void advance_line_col(LineCol& pos, const IndexedString& text, size_t from, size_t to) {
    auto chars = text.chars();
    to = std::min(to, chars.size());
    for (size_t i = from; i < to; ++i) {
        if (chars[i] == U'\n') {
            pos.line += 1;
            pos.col = 0;
        } else {
            pos.col += 1;
        }
    }
}

} // namespace

// ============================================================================
// Span
// ============================================================================

Span::Span() : source_(empty_source()) {}

Span::Span(Rc<Source> source, size_t start, size_t end) : source_(std::move(source)) {
    if (!source_) {
        source_ = empty_source();
    }
    end_ = std::min(end, source_->len());
    start_ = std::min(start, end_);
}

auto Span::byte_range() const -> Range {
    const auto& text = source_->text();
    return Range{text.byte_offset(start_), text.byte_offset(end_)};
}

auto Span::start() const -> LineCol {
    LineCol pos;
    advance_line_col(pos, source_->text(), 0, start_);
    return pos;
}

auto Span::end() const -> LineCol {
    LineCol pos = start();
    advance_line_col(pos, source_->text(), start_, end_);
    return pos;
}

auto Span::source_lines() const -> SourceLines {
    return SourceLines(source_, start(), end());
}

auto Span::same_source(const Span& other) const -> bool {
    return source_ == other.source_ || *source_ == *other.source_;
}

auto Span::join(const Span& other) const -> Result<Span, SpanJoinError> {
    if (source_->empty()) {
        return other;
    }
    if (other.source_->empty()) {
        return *this;
    }
    if (!same_source(other)) {
        PROSE_LOG_DEBUG("span", "refusing to join spans of unrelated sources");
        return SpanJoinError{};
    }
    return Span(source_, std::min(start_, other.start_), std::max(end_, other.end_));
}

auto Span::operator==(const Span& other) const -> bool {
    return start_ == other.start_ && end_ == other.end_ && same_source(other);
}

auto operator<<(std::ostream& out, const Span& span) -> std::ostream& {
    return out << span.source_text().as_str();
}

auto join_spans(const std::vector<Span>& spans) -> Result<Span, SpanJoinError> {
    Span merged = Span::blank();
    for (const auto& span : spans) {
        auto joined = merged.join(span);
        if (is_err(joined))
            return unwrap_err(joined);
        merged = std::move(unwrap(joined));
    }
    return merged;
}

// ============================================================================
// SourceLines
// ============================================================================

SourceLines::SourceLines(Rc<Source> source, LineCol start, LineCol end)
    : source_(std::move(source)), start_(start), end_(end) {}

auto SourceLines::begin() const -> Iterator {
    // Skip to the first character of the span's first line
    auto chars = source_->text().chars();
    size_t line = 0;
    size_t pos = 0;
    while (line < start_.line && pos < chars.size()) {
        if (chars[pos] == U'\n') {
            line += 1;
        }
        pos += 1;
    }
    if (line < start_.line) {
        return end();
    }
    return Iterator(this, line, pos);
}

auto SourceLines::to_vector() const -> std::vector<SourceLine> {
    std::vector<SourceLine> lines;
    for (const auto& line : *this) {
        lines.push_back(line);
    }
    return lines;
}

SourceLines::Iterator::Iterator(const SourceLines* owner, size_t line, size_t line_start)
    : owner_(owner), line_(line), line_start_(line_start), done_(false) {
    load();
}

void SourceLines::Iterator::load() {
    const auto& text = owner_->source_->text();
    auto chars = text.chars();
    if (line_ > owner_->end_.line || line_start_ >= chars.size()) {
        done_ = true;
        return;
    }

    size_t line_end = line_start_;
    while (line_end < chars.size() && chars[line_end] != U'\n') {
        line_end += 1;
    }
    // "\r\n" endings leave the '\r' out of the line
    size_t text_end = line_end;
    if (line_end < chars.size() && text_end > line_start_ && chars[text_end - 1] == U'\r') {
        text_end -= 1;
    }

    size_t line_len = text_end - line_start_;
    const LineCol& start = owner_->start_;
    const LineCol& end = owner_->end_;

    current_.text = text.slice(line_start_, text_end);
    if (line_ == start.line && line_ == end.line) {
        current_.start_col = start.col;
        current_.end_col = end.col;
    } else if (line_ == start.line) {
        current_.start_col = start.col;
        current_.end_col = line_len;
    } else if (line_ == end.line) {
        current_.start_col = 0;
        current_.end_col = end.col;
    } else {
        current_.start_col = 0;
        current_.end_col = line_len;
    }
}

auto SourceLines::Iterator::operator++() -> Iterator& {
    if (done_) {
        return *this;
    }
    auto chars = owner_->source_->text().chars();
    size_t pos = line_start_;
    while (pos < chars.size() && chars[pos] != U'\n') {
        pos += 1;
    }
    line_ += 1;
    line_start_ = pos + 1;
    load();
    return *this;
}

} // namespace prose
