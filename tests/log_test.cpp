//! # Logger Unit Tests
//!
//! Filter parsing, record formatting, sinks, option parsing, and the log
//! records the library itself emits while parsing.

#include "prose/log/log.hpp"
#include "prose/parse/stream.hpp"
#include "prose/text/source.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace prose::log;
namespace fs = std::filesystem;

namespace {

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& out) : entries_(out) {}

    void write(const LogRecord& record) override {
        entries_.push_back({record.level, std::string(record.module), record.message});
    }

private:
    std::vector<Entry>& entries_;
};

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.timestamp_ms = 1700000000000;
    return record;
}

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

TEST(LogFilterTest, ModuleLevelsAndDefault) {
    LogFilter filter;
    filter.parse("stream=trace,diag=debug,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "stream"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "diag"));
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "diag"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "source"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "source"));
    EXPECT_EQ(filter.default_level(), LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST(LogFilterTest, BareModuleEnablesEverything) {
    LogFilter filter;
    filter.parse("regex");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "regex"));
    // Unlisted modules keep the Info default
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "span"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "span"));
}

TEST(LogFilterTest, OffSilencesModule) {
    LogFilter filter;
    filter.parse("span=off,*=trace");
    EXPECT_FALSE(filter.should_log(LogLevel::Error, "span"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "stream"));
}

TEST(LogLevelTest, NamesAndParsing) {
    EXPECT_STREQ(level_name(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(parse_level("Off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextLine) {
    std::string line = format_text(make_record(LogLevel::Warn, "stream", "slow path"));
    EXPECT_NE(line.find("WARN "), std::string::npos);
    EXPECT_NE(line.find("[stream] slow path"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(LogFormatTest, JsonLineEscapes) {
    std::string line =
        format_json(make_record(LogLevel::Error, "diag", "bad \"value\"\nnext"));
    EXPECT_EQ(line, "{\"ts\":1700000000000,\"level\":\"ERROR\",\"module\":\"diag\","
                    "\"msg\":\"bad \\\"value\\\"\\nnext\"}");
}

TEST(LogFormatTest, TimestampShape) {
    std::string ts = get_timestamp();
    ASSERT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
    EXPECT_GT(epoch_ms(), 0);
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "prose_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    auto read_file() -> std::string {
        std::ifstream f(temp_file);
        std::ostringstream content;
        content << f.rdbuf();
        return content.str();
    }
};

TEST_F(FileSinkTest, WritesTextRecords) {
    {
        FileSink sink(temp_file.string(), LogFormat::Text);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "source", "loaded config.txt"));
    }
    std::string content = read_file();
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[source] loaded config.txt"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToEarlierRecords) {
    {
        FileSink sink(temp_file.string(), LogFormat::Text);
        sink.write(make_record(LogLevel::Info, "a", "first"));
    }
    {
        FileSink sink(temp_file.string(), LogFormat::JSON);
        sink.write(make_record(LogLevel::Warn, "b", "second"));
    }
    std::string content = read_file();
    EXPECT_NE(content.find("[a] first"), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"second\""), std::string::npos);
}

TEST_F(FileSinkTest, InitAddsFileSink) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Debug;
    config.format = LogFormat::JSON;
    config.log_file = temp_file.string();
    Logger::init(config);

    PROSE_LOG_DEBUG("source", "loaded " << 3 << " lines");
    Logger::instance().clear_sinks();
    Logger::instance().set_level(LogLevel::Warn);

    std::string content = read_file();
    EXPECT_NE(content.find("\"module\":\"source\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"loaded 3 lines\""), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> entries;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<CaptureSink>(entries));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }
};

TEST(LoggerSilenceTest, NoSinksMeansNoLogging) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(LogLevel::Trace);
    EXPECT_FALSE(logger.should_log(LogLevel::Error, "stream"));
    logger.set_level(LogLevel::Warn);
}

TEST_F(LoggerTest, LevelGate) {
    PROSE_LOG_DEBUG("test", "hidden");
    PROSE_LOG_WARN("test", "shown " << 42);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
    EXPECT_EQ(entries[0].module, "test");
    EXPECT_EQ(entries[0].message, "shown 42");
}

TEST_F(LoggerTest, FilterLowersLevelForOneModule) {
    Logger::instance().set_filter("stream=trace,*=error");
    PROSE_LOG_TRACE("stream", "visible");
    PROSE_LOG_WARN("span", "invisible");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].module, "stream");
}

TEST_F(LoggerTest, FailedRegexIsTraced) {
    Logger::instance().set_level(LogLevel::Trace);
    auto stream = prose::ParseStream::from_str("abc");
    EXPECT_FALSE(stream.peek_regex("[0-9]"));

    bool found = false;
    for (const auto& entry : entries) {
        if (entry.module == "regex" && entry.message.find("[0-9]") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(LoggerTest, MissingFileIsLoggedAtDebug) {
    Logger::instance().set_level(LogLevel::Debug);
    auto loaded = prose::Source::from_file(fs::temp_directory_path() / "prose_no_such_file.txt");
    ASSERT_TRUE(prose::is_err(loaded));
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.back().module, "source");
    EXPECT_EQ(entries.back().level, LogLevel::Debug);
}

TEST_F(LoggerTest, InitReplacesSinks) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Info;
    Logger::init(config);
    PROSE_LOG_ERROR("test", "goes nowhere");
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

// ============================================================================
// Option Parsing
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("PROSE_LOG");
    }

    void TearDown() override {
        unsetenv("PROSE_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "prose_key_value");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, Defaults) {
    auto config = parse({});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, ExplicitFlags) {
    auto config = parse({"--log-level=debug", "--log-filter=stream=trace",
                         "--log-file=/tmp/prose.log", "--log-format=json"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "stream=trace");
    EXPECT_EQ(config.log_file, "/tmp/prose.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, VerbosityCounts) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    // An explicit level beats -v
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("PROSE_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("PROSE_LOG", "stream=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "stream=trace,*=warn");

    // Command-line flags win over the environment
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_TRUE(parse({"-q"}).filter_spec.empty());
}
