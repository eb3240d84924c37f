#include "prose/diag/diagnostic.hpp"

#include "prose/log/log.hpp"

#include <iomanip>
#include <sstream>

namespace prose {

auto level_name(DiagnosticLevel level) -> const char* {
    switch (level) {
    case DiagnosticLevel::Error:
        return "error";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Help:
        return "help";
    }
    return "error";
}

auto operator<<(std::ostream& out, DiagnosticLevel level) -> std::ostream& {
    return out << level_name(level);
}

Diagnostic::Diagnostic(DiagnosticLevel level, Span span, std::string message,
                       std::optional<std::string> context_name, std::vector<Diagnostic> children)
    : level_(level), span_(std::move(span)), message_(std::move(message)),
      context_name_(std::move(context_name)), children_(std::move(children)) {}

auto Diagnostic::context_name() const -> const std::string& {
    if (context_name_) {
        return *context_name_;
    }
    return Options::default_context_name;
}

auto Diagnostic::merged_span() const -> Result<Span, SpanJoinError> {
    Span merged = span_;
    for (const auto& child : children_) {
        auto child_span = child.merged_span();
        if (is_err(child_span))
            return unwrap_err(child_span);
        auto joined = merged.join(unwrap(child_span));
        if (is_err(joined)) {
            PROSE_LOG_DEBUG("diag", "child diagnostic '" << child.message()
                                                         << "' points into another source");
            return unwrap_err(joined);
        }
        merged = std::move(unwrap(joined));
    }
    return merged;
}

auto Diagnostic::to_string() const -> std::string {
    std::ostringstream out;
    out << *this;
    return out.str();
}

// ============================================================================
// Text Rendering
// ============================================================================

namespace {

auto digit_count(size_t n) -> size_t {
    size_t width = 1;
    while (n >= 10) {
        width += 1;
        n /= 10;
    }
    return width;
}

void pad(std::ostream& out, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        out << ' ';
    }
}

/// Writes the caret line under one source line.
///
/// Whitespace inside the flagged range is left blank when it borders other
/// flagged whitespace; columns past the end of the line count as whitespace.
void write_carets(std::ostream& out, const SourceLine& line) {
    auto chars = line.text.chars();
    auto blank_at = [&](size_t col) {
        return col >= chars.size() || is_whitespace(chars[col]);
    };

    bool prev = false;
    for (size_t col = line.start_col; col < line.end_col; ++col) {
        if (col >= chars.size()) {
            out << ' ';
            prev = true;
            continue;
        }
        bool current = is_whitespace(chars[col]);
        bool next = col + 1 < line.end_col && blank_at(col + 1);
        out << ((current && (next || prev)) ? ' ' : '^');
        prev = current;
    }
}

} // namespace

auto operator<<(std::ostream& out, const Diagnostic& diag) -> std::ostream& {
    out << diag.level() << ": " << diag.message() << "\n";

    Span span = diag.span();
    LineCol start = span.start();
    size_t width = digit_count(start.line + 1);

    pad(out, width - 1);
    out << " --> ";
    if (const auto& path = span.source_path()) {
        out << path->string();
    } else {
        out << diag.context_name();
    }
    out << ":" << start.line + 1 << ":" << start.col << "\n";

    pad(out, width);
    out << " |\n";

    size_t index = 0;
    for (const auto& line : span.source_lines()) {
        out << index + start.line + 1 << " | " << line.text << "\n";
        pad(out, width);
        out << "   ";
        pad(out, line.start_col);
        write_carets(out, line);
        out << "\n";
        index += 1;
    }

    for (const auto& child : diag.children()) {
        out << child;
    }
    return out;
}

// ============================================================================
// JSON Rendering
// ============================================================================

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

namespace {

void write_json(std::ostream& out, const Diagnostic& diag) {
    Span span = diag.span();
    LineCol start = span.start();
    LineCol end = span.end();
    std::string context = span.source_path() ? span.source_path()->string() : diag.context_name();

    out << "{";
    out << "\"level\":\"" << diag.level() << "\",";
    out << "\"message\":\"" << escape_json_string(diag.message()) << "\",";
    out << "\"context\":\"" << escape_json_string(context) << "\",";

    // Lines are 1-indexed and columns 0-indexed, as in the text layout
    out << "\"span\":{";
    out << "\"start\":{\"line\":" << start.line + 1 << ",\"col\":" << start.col << "},";
    out << "\"end\":{\"line\":" << end.line + 1 << ",\"col\":" << end.col << "}";
    out << "},";

    out << "\"children\":[";
    bool first = true;
    for (const auto& child : diag.children()) {
        if (!first)
            out << ",";
        first = false;
        write_json(out, child);
    }
    out << "]";
    out << "}";
}

} // namespace

auto to_json(const Diagnostic& diag) -> std::string {
    std::ostringstream out;
    write_json(out, diag);
    return out.str();
}

} // namespace prose
