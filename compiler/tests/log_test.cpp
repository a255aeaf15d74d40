//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, sinks, the Logger singleton and
//! command-line/environment configuration.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cdl::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1700000000123};
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("parser=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "dispatch"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "dispatch"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("sema=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "sema"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lexer"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("dispatch");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "dispatch"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
}

TEST_F(LogFilterTest, EmptyEntriesIgnored) {
    filter.parse(",,lexer=warn,,");

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "lexer"));
}

TEST_F(LogFilterTest, MinLevelCoversModules) {
    filter.parse("parser=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
    EXPECT_EQ(filter.default_level(), LogLevel::Error);
}

TEST(LogLevelTest, ParseLevelIgnoresCase) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("Debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Formatting and Sinks
// ============================================================================

TEST(LogFormatTest, TextLineHasLevelModuleAndMessage) {
    auto line = format_record(make_record(LogLevel::Info, "parser", "parsed 3 commands"),
                              LogFormat::Text, false);

    EXPECT_NE(line.find("INFO "), std::string::npos);
    EXPECT_NE(line.find("[parser] parsed 3 commands"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST(LogFormatTest, ColoredTextUsesAnsi) {
    auto line =
        format_record(make_record(LogLevel::Error, "cli", "boom"), LogFormat::Text, true);
    EXPECT_NE(line.find("\033[31m"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    auto line = format_record(make_record(LogLevel::Warn, "lexer", "bad \"quote\"\n"),
                              LogFormat::JSON, false);

    EXPECT_EQ(line, "{\"ts\":1700000000123,\"level\":\"WARN\",\"module\":\"lexer\","
                    "\"msg\":\"bad \\\"quote\\\"\\n\"}\n");
}

TEST(LogSinkTest, StreamSinkWritesFormattedRecord) {
    std::ostringstream out;
    StreamSink sink(out);
    sink.set_format(LogFormat::JSON);

    sink.write(make_record(LogLevel::Debug, "sema", "resolved"));
    sink.flush();

    EXPECT_NE(out.str().find("\"module\":\"sema\""), std::string::npos);
}

TEST(LogSinkTest, MultiSinkForwardsToEveryChild) {
    std::ostringstream first;
    std::ostringstream second;

    MultiSink multi;
    multi.add(std::make_unique<StreamSink>(first));
    multi.add(std::make_unique<StreamSink>(second));
    multi.add(std::make_unique<NullSink>());
    EXPECT_EQ(multi.size(), 3u);

    multi.write(make_record(LogLevel::Info, "engine", "hello"));

    EXPECT_NE(first.str().find("hello"), std::string::npos);
    EXPECT_NE(second.str().find("hello"), std::string::npos);
}

TEST(LogSinkTest, FileSinkAppendsLines) {
    auto path = fs::temp_directory_path() / "cdl_log_sink_test.log";
    fs::remove(path);

    {
        FileSink sink(path.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "cli", "first"));
        sink.write(make_record(LogLevel::Error, "cli", "second"));
    }

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    fs::remove(path);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[cli] first"), std::string::npos);
    EXPECT_NE(lines[1].find("[cli] second"), std::string::npos);
}

// ============================================================================
// Logger Singleton
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::ostringstream captured;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<StreamSink>(captured));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, MacrosReachSinks) {
    CDL_LOG_INFO("engine", "dispatching " << 2 << " args");
    EXPECT_NE(captured.str().find("[engine] dispatching 2 args"), std::string::npos);
}

TEST_F(LoggerTest, LevelThresholdDropsLowerRecords) {
    Logger::instance().set_level(LogLevel::Warn);

    CDL_LOG_INFO("engine", "hidden");
    CDL_LOG_WARN("engine", "shown");

    EXPECT_EQ(captured.str().find("hidden"), std::string::npos);
    EXPECT_NE(captured.str().find("shown"), std::string::npos);
}

TEST_F(LoggerTest, FilterSelectsModules) {
    Logger::instance().set_filter("parser=debug,*=error");

    CDL_LOG_DEBUG("parser", "parser detail");
    CDL_LOG_DEBUG("lexer", "lexer detail");

    EXPECT_NE(captured.str().find("parser detail"), std::string::npos);
    EXPECT_EQ(captured.str().find("lexer detail"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentWritesKeepLinesWhole) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                CDL_LOG_INFO("dispatch", "thread " << t << " line " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::istringstream in(captured.str());
    size_t count = 0;
    for (std::string line; std::getline(in, line);) {
        EXPECT_NE(line.find("[dispatch] thread "), std::string::npos);
        ++count;
    }
    EXPECT_EQ(count, 200u);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("CDL_LOG");
    }

    void TearDown() override {
        unsetenv("CDL_LOG");
    }

    static auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "cdlc");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"git.cdl", "gitcli"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    auto config = parse({"-vvv", "--log-level=error"});
    EXPECT_EQ(config.level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FileFormatAndFilter) {
    auto config =
        parse({"--log-file=/tmp/cdl.log", "--log-format=json", "--log-filter=sema=trace"});
    EXPECT_EQ(config.log_file, "/tmp/cdl.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.filter_spec, "sema=trace");
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("CDL_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("CDL_LOG", "dispatch=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "dispatch=trace,*=warn");
}

TEST_F(LogOptionsTest, CommandLineOverridesEnvironment) {
    setenv("CDL_LOG", "trace", 1);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(LogOptionTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--force"));
    EXPECT_FALSE(is_log_option("-f"));
    EXPECT_FALSE(is_log_option("remote"));
}
