#include "prose/diag/emitter.hpp"

#include "prose/log/log.hpp"

namespace prose {

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {}

void DiagnosticEmitter::count(const Diagnostic& diag) {
    if (diag.level() == DiagnosticLevel::Error) {
        error_count_++;
    } else if (diag.level() == DiagnosticLevel::Warning) {
        warning_count_++;
    }
    for (const auto& child : diag.children()) {
        count(child);
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    count(diag);
    PROSE_LOG_TRACE("diag", "emitting " << diag.level() << ": " << diag.message());

    if (format() == DiagnosticFormat::JSON) {
        out_ << to_json(diag) << "\n";
        return;
    }
    out_ << diag;
}

} // namespace prose
