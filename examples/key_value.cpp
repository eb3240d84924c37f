//! # Key/Value Config Reader
//!
//! A small configuration-file reader built on prose. Each line of the input
//! is blank, a `# comment`, or an entry:
//!
//! ```text
//! # server settings
//! port = 8080
//! host = "localhost"
//! verbose = TRUE
//! ```
//!
//! Values are integers, double-quoted strings, or `true`/`false` in any case.
//! Parse errors and duplicate keys are reported as diagnostics on stderr.
//!
//! ## Usage
//!
//! ```bash
//! prose_key_value [--json] [-v|-vv|-vvv] [--log-filter=stream=trace] <file>
//! ```

#include "prose/prose.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace prose;
using namespace prose::parsable;

namespace {

// ============================================================================
// Grammar
// ============================================================================

/// Spaces and tabs only; newlines separate lines.
auto skip_inline_space(ParseStream& stream) -> Span {
    auto spaces = stream.parse_regex("[ \\t]*");
    return is_ok(spaces) ? unwrap(spaces).span() : stream.current_span();
}

class Value {
public:
    enum class Kind { Integer, Boolean, Text };

    static auto parse(ParseStream& stream) -> ParseResult<Value> {
        if (is_ok(stream.next_digit()) || stream.peek_str("-")) {
            auto number = stream.parse<I64>();
            if (is_err(number))
                return unwrap_err(number);
            return Value(Kind::Integer, unwrap(number).span());
        }
        if (stream.peek_str("\"")) {
            auto text = stream.parse_regex("\"[^\"\\n]*\"");
            if (is_err(text))
                return Error(stream.current_span(), "unterminated string");
            return Value(Kind::Text, unwrap(text).span());
        }
        auto word = stream.parse_any_istr_of({"true", "false"});
        if (is_err(word)) {
            return Error(stream.current_span(),
                         "expected a number, a quoted string, `true` or `false`");
        }
        return Value(Kind::Boolean, unwrap(word).matched.span());
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    [[nodiscard]] auto kind() const -> Kind {
        return kind_;
    }

    [[nodiscard]] auto kind_name() const -> const char* {
        switch (kind_) {
        case Kind::Integer:
            return "integer";
        case Kind::Boolean:
            return "boolean";
        case Kind::Text:
            return "string";
        }
        return "value";
    }

private:
    Value(Kind kind, Span span) : kind_(kind), span_(std::move(span)) {}

    Kind kind_ = Kind::Integer;
    Span span_;
};

class Entry {
public:
    static auto parse(ParseStream& stream) -> ParseResult<Entry> {
        Entry entry;
        auto key = stream.parse_regex("[A-Za-z_][A-Za-z0-9_.]*");
        if (is_err(key))
            return Error(stream.current_span(), "expected a key");
        entry.key_ = unwrap(key).span();

        skip_inline_space(stream);
        auto equals = stream.parse_str("=");
        if (is_err(equals))
            return unwrap_err(equals);
        skip_inline_space(stream);

        auto value = stream.parse<Value>();
        if (is_err(value))
            return unwrap_err(value);
        entry.value_ = unwrap(value);

        auto joined = join_spans(MultiSpan{entry.key_, entry.value_->span()});
        if (is_err(joined))
            return Error(entry.key_, unwrap_err(joined).message());
        entry.span_ = unwrap(joined);
        return entry;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    [[nodiscard]] auto key() const -> const Span& {
        return key_;
    }

    [[nodiscard]] auto value() const -> const Value& {
        return *value_;
    }

private:
    Span key_;
    std::optional<Value> value_;
    Span span_;
};

/// A whole file: entries, comments and blank lines, each ended by a newline
/// or the end of input.
class Document {
public:
    static auto parse(ParseStream& stream) -> ParseResult<Document> {
        Document doc;
        while (!stream.at_end()) {
            skip_inline_space(stream);
            if (stream.peek_str("#")) {
                (void)stream.parse_regex("#[^\\n]*");
            } else if (!stream.peek_str("\n") && !stream.peek_str("\r\n") && !stream.at_end()) {
                auto entry = stream.parse<Entry>();
                if (is_err(entry))
                    return unwrap_err(entry);
                doc.entries_.push_back(std::move(unwrap(entry)));
                skip_inline_space(stream);
            }

            if (stream.at_end())
                break;
            auto newline = stream.parse_any_str_of({"\n", "\r\n"});
            if (is_err(newline))
                return Error(stream.current_span(), "expected end of line");
        }
        doc.span_ = Span(stream.source(), 0, stream.position());
        return doc;
    }

    [[nodiscard]] auto span() const -> Span {
        return span_;
    }

    void set_span(Span span) {
        span_ = std::move(span);
    }

    [[nodiscard]] auto entries() const -> const std::vector<Entry>& {
        return entries_;
    }

private:
    std::vector<Entry> entries_;
    Span span_;
};

// ============================================================================
// Driver
// ============================================================================

void print_usage() {
    std::cout << "Usage: prose_key_value [options] <file>\n\n";
    std::cout << "Options:\n";
    std::cout << "  --json           Report diagnostics as JSON\n";
    std::cout << "  -v, -vv, -vvv    Log at info, debug or trace level\n";
    std::cout << "  --log-filter=S   Per-module log levels, e.g. stream=trace,*=warn\n";
    std::cout << "  --help, -h       Show this help\n";
}

/// Warns about every key defined more than once, pointing at the first definition.
void check_duplicates(const Document& doc, DiagnosticEmitter& emitter) {
    std::map<std::string, Span> seen;
    for (const auto& entry : doc.entries()) {
        std::string key = entry.key().source_text().to_string();
        auto it = seen.find(key);
        if (it == seen.end()) {
            seen.emplace(key, entry.key());
            continue;
        }
        Diagnostic warning(DiagnosticLevel::Warning, entry.key(),
                           "duplicate key `" + key + "` overrides an earlier value");
        warning.add_child(Diagnostic(DiagnosticLevel::Note, it->second, "first defined here"));
        emitter.emit(warning);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::string path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--json") {
            Options::diagnostic_format = DiagnosticFormat::JSON;
        } else if (!arg.starts_with("-")) {
            path = arg;
        }
    }
    if (path.empty()) {
        print_usage();
        return 2;
    }

    auto loaded = Source::from_file(path);
    if (is_err(loaded)) {
        std::cerr << "error: cannot read " << path << ": " << unwrap_err(loaded).message() << "\n";
        return 2;
    }
    auto source = make_rc<Source>(std::move(unwrap(loaded)));
    PROSE_LOG_INFO("example", "parsing " << path << " (" << source->len() << " chars)");

    DiagnosticEmitter emitter(std::cerr);
    auto parsed = prose::parse<Document>(source);
    if (is_err(parsed)) {
        emitter.emit(unwrap_err(parsed).diagnostic());
        return 1;
    }

    const Document& doc = unwrap(parsed);
    check_duplicates(doc, emitter);
    for (const auto& entry : doc.entries()) {
        std::cout << entry.key() << " (" << entry.value().kind_name()
                  << ") = " << unparse(entry.value()) << "\n";
    }
    return emitter.error_count() > 0 ? 1 : 0;
}
