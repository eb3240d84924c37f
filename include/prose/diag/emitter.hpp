//! # Diagnostic Emitter
//!
//! Writes diagnostic trees to an output stream and keeps running counts of
//! the errors and warnings it has seen. The output format follows
//! `Options::diagnostic_format` unless the emitter is given one explicitly.
//!
//! ```cpp
//! DiagnosticEmitter emitter(std::cerr);
//! emitter.emit(unwrap_err(result).diagnostic());
//! if (emitter.error_count() > 0)
//!     return 1;
//! ```

#ifndef PROSE_DIAG_EMITTER_HPP
#define PROSE_DIAG_EMITTER_HPP

#include "prose/common.hpp"
#include "prose/diag/diagnostic.hpp"

#include <iostream>
#include <optional>

namespace prose {

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    /// Overrides `Options::diagnostic_format` for this emitter.
    void set_format(DiagnosticFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto format() const -> DiagnosticFormat {
        return format_.value_or(Options::diagnostic_format);
    }

    /// Writes one diagnostic tree. JSON output is one object per line.
    void emit(const Diagnostic& diag);

    // Statistics, children included
    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }
    [[nodiscard]] auto warning_count() const -> size_t {
        return warning_count_;
    }
    void reset_counts() {
        error_count_ = 0;
        warning_count_ = 0;
    }

private:
    void count(const Diagnostic& diag);

    std::ostream& out_;
    std::optional<DiagnosticFormat> format_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;
};

} // namespace prose

#endif // PROSE_DIAG_EMITTER_HPP
