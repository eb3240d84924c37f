//! # Diagnostics
//!
//! A `Diagnostic` is one reportable fact about a region of text: a level, a
//! span, a message, and related child diagnostics. Rendering produces the
//! familiar compiler layout:
//!
//! ```text
//! error: this is an error
//!  --> the thing:1:5
//!   |
//! 1 | this is a triumph
//!          ^^
//! ```
//!
//! The ` --> ` line shows the source path when the span's source has one,
//! otherwise the diagnostic's context name (default `"input"`), followed by
//! the 1-indexed line and the 0-indexed column. Children are rendered after
//! the parent, in order.

#ifndef PROSE_DIAG_DIAGNOSTIC_HPP
#define PROSE_DIAG_DIAGNOSTIC_HPP

#include "prose/common.hpp"
#include "prose/text/span.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace prose {

enum class DiagnosticLevel {
    Error,
    Warning,
    Note,
    Help,
};

/// "error", "warning", "note" or "help".
[[nodiscard]] auto level_name(DiagnosticLevel level) -> const char*;

auto operator<<(std::ostream& out, DiagnosticLevel level) -> std::ostream&;

/// A leveled, span-anchored message with nested sub-diagnostics.
class Diagnostic {
public:
    Diagnostic(DiagnosticLevel level, Span span, std::string message,
               std::optional<std::string> context_name = std::nullopt,
               std::vector<Diagnostic> children = {});

    void set_level(DiagnosticLevel level) {
        level_ = level;
    }

    void set_message(std::string message) {
        message_ = std::move(message);
    }

    void set_context_name(std::optional<std::string> name) {
        context_name_ = std::move(name);
    }

    void add_child(Diagnostic child) {
        children_.push_back(std::move(child));
    }

    [[nodiscard]] auto level() const -> DiagnosticLevel {
        return level_;
    }

    [[nodiscard]] auto message() const -> const std::string& {
        return message_;
    }

    /// The context name, or `Options::default_context_name` when unset.
    [[nodiscard]] auto context_name() const -> const std::string&;

    [[nodiscard]] auto children() const -> const std::vector<Diagnostic>& {
        return children_;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    /// The smallest span covering this diagnostic and all of its descendants.
    [[nodiscard]] auto merged_span() const -> Result<Span, SpanJoinError>;

    /// Renders this diagnostic and its children.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const Diagnostic& other) const -> bool = default;

private:
    DiagnosticLevel level_;
    Span span_;
    std::string message_;
    std::optional<std::string> context_name_;
    std::vector<Diagnostic> children_;
};

auto operator<<(std::ostream& out, const Diagnostic& diag) -> std::ostream&;

/// Renders a diagnostic tree as a single JSON object.
[[nodiscard]] auto to_json(const Diagnostic& diag) -> std::string;

/// Escapes a string for inclusion in a JSON string literal.
[[nodiscard]] auto escape_json_string(const std::string& s) -> std::string;

} // namespace prose

#endif // PROSE_DIAG_DIAGNOSTIC_HPP
