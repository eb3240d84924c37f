//! # Log Initialization
//!
//! Turns the logging flags of a host program and the PROSE_LOG environment
//! variable into a LogConfig.

#include "prose/log/log.hpp"

#include <cstdlib>
#include <string>

namespace prose::log {

namespace {

auto all_v(const std::string& arg) -> bool {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return false;
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return false;
    }
    return true;
}

} // namespace

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (all_v(arg)) {
            int count = static_cast<int>(arg.size() - 1);
            if (count > v_count)
                v_count = count;
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace, unless --log-level was explicit
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* value = std::getenv("PROSE_LOG");
        std::string env = value ? value : "";
        if (!env.empty()) {
            // "stream=trace,*=warn" or "stream,diag" is a filter; anything else a level
            if (env.find('=') != std::string::npos || env.find(',') != std::string::npos) {
                config.filter_spec = env;
            } else {
                config.level = parse_level(env);
            }
        }
    }

    return config;
}

} // namespace prose::log
