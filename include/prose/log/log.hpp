//! # Logging
//!
//! Module-tagged logging for the prose library and the programs embedding it.
//!
//! - Levels Trace through Error, plus Off
//! - Per-module filtering (`"stream=trace,*=warn"`)
//! - Console and file sinks, text or JSON lines
//! - Compile-time level elision via PROSE_MIN_LOG_LEVEL
//!
//! The library logs under the tags `source`, `span`, `stream`, `regex` and
//! `diag`. A logger that was never initialized has no sinks and stays silent.
//!
//! ```cpp
//! Logger::init(parse_log_options(argc, argv));
//! PROSE_LOG_DEBUG("stream", "fork at " << stream.position());
//! ```

#ifndef PROSE_LOG_LOG_HPP
#define PROSE_LOG_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace prose::log {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Cursor movement, individual match attempts
    Debug = 1, ///< Failed matches, loaded sources
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
auto level_name(LogLevel level) -> const char*;

/// Parses a level name in lower or upper case; unknown names give Info.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< e.g. "stream"
    std::string message;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
};

/// Writes to stderr, coloring the level name when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    ConsoleSink(LogFormat format, bool use_colors);

    void write(const LogRecord& record) override;

private:
    LogFormat format_;
    bool colors_;
};

/// Appends to a file, flushing after Error records.
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format);

    void write(const LogRecord& record) override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

/// A record as one text line, without the newline.
auto format_text(const LogRecord& record) -> std::string;

/// A record as one JSON object, without the newline.
auto format_json(const LogRecord& record) -> std::string;

/// Local wall-clock time as "HH:MM:SS.mmm".
auto get_timestamp() -> std::string;

auto epoch_ms() -> int64_t;

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module levels parsed from "stream=trace,diag=debug,*=warn". A bare
/// module name enables everything from that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty for no file
    bool console = true;
    bool colors = true;
};

/// The process-wide logger. Sinks are guarded by a mutex.
class Logger {
public:
    /// Replaces the sinks and levels of the global logger.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, const std::string& message);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Builds a LogConfig from a host program's arguments: --log-level=,
/// --log-filter=, --log-file=, --log-format=, -v/-vv/-vvv and -q. Without a
/// level or filter on the command line, PROSE_LOG is consulted.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Off
#ifndef PROSE_MIN_LOG_LEVEL
#define PROSE_MIN_LOG_LEVEL 0
#endif

#define PROSE_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= PROSE_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::prose::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str());                                        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: PROSE_LOG_TRACE("stream", "consumed " << n);
#define PROSE_LOG_TRACE(module, msg) PROSE_LOG_IMPL(::prose::log::LogLevel::Trace, module, msg)
#define PROSE_LOG_DEBUG(module, msg) PROSE_LOG_IMPL(::prose::log::LogLevel::Debug, module, msg)
#define PROSE_LOG_INFO(module, msg) PROSE_LOG_IMPL(::prose::log::LogLevel::Info, module, msg)
#define PROSE_LOG_WARN(module, msg) PROSE_LOG_IMPL(::prose::log::LogLevel::Warn, module, msg)
#define PROSE_LOG_ERROR(module, msg) PROSE_LOG_IMPL(::prose::log::LogLevel::Error, module, msg)

} // namespace prose::log

#endif // PROSE_LOG_LOG_HPP
