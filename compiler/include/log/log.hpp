//! # CDL Logging
//!
//! Structured, module-tagged logging shared by the library and `cdlc`:
//! - Six levels (Trace, Debug, Info, Warn, Error, Fatal) plus Off
//! - Per-module filtering ("parser=debug,*=warn")
//! - Console, stream, file and fan-out sinks
//! - Text or JSON line output
//! - Compile-time elision via CDL_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! CDL_LOG_INFO("parser", "parsed " << count << " statements");
//! CDL_LOG_DEBUG("dispatch", "resolved '" << token << "' to " << path);
//! ```
//!
//! ## Module Tags
//!
//! | Tag        | Component                      |
//! |------------|--------------------------------|
//! | `lexer`    | Tokenizer                      |
//! | `parser`   | Statement parser               |
//! | `sema`     | Semantic resolver, emit plan   |
//! | `dispatch` | Argument-vector resolution     |
//! | `engine`   | Handler registry and execution |
//! | `cli`      | The `cdlc` driver              |

#ifndef CDL_LOG_HPP
#define CDL_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cdl::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General progress messages
    Warn = 3,  ///< Suspicious but accepted input
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Failures that end the process
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name, ignoring case. Unknown names map to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "parser")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log lines.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

/// Renders a record as a single newline-terminated line.
std::string format_record(const LogRecord& record, LogFormat format, bool colors);

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes formatted records to a caller-owned stream.
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out, bool use_colors = false)
        : out_(out), colors_enabled_(use_colors) {}

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Stream sink bound to stderr, colored only when stderr is a terminal.
class ConsoleSink : public StreamSink {
public:
    explicit ConsoleSink(bool use_colors = true);
};

/// Appends records to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards every record.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Forwards each record to all child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level thresholds.
///
/// Filter specs are comma-separated `module=level` pairs; `*=level` sets the
/// default and a bare module name enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold across the default and all modules.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to a log file (empty = none)
    bool console = true;                ///< Log to stderr
    bool colors = true;                 ///< Allow ANSI colors on stderr
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger. Sink access is serialized by a mutex.
class Logger {
public:
    /// Replaces all sinks and thresholds according to `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes all sinks.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds a LogConfig from argv.
///
/// Recognizes `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=`, `-v`/`-vv`/`-vvv`, `--verbose` and `-q`/`--quiet`.
/// Falls back to the CDL_LOG environment variable when argv sets neither a
/// level nor a filter.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for arguments consumed by parse_log_options.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Calls below this level are compiled out.
// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef CDL_MIN_LOG_LEVEL
#define CDL_MIN_LOG_LEVEL 0
#endif

#define CDL_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= CDL_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::cdl::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: CDL_LOG_TRACE("module", "message " << value);
#define CDL_LOG_TRACE(module, msg) CDL_LOG_IMPL(::cdl::log::LogLevel::Trace, module, msg)
#define CDL_LOG_DEBUG(module, msg) CDL_LOG_IMPL(::cdl::log::LogLevel::Debug, module, msg)
#define CDL_LOG_INFO(module, msg) CDL_LOG_IMPL(::cdl::log::LogLevel::Info, module, msg)
#define CDL_LOG_WARN(module, msg) CDL_LOG_IMPL(::cdl::log::LogLevel::Warn, module, msg)
#define CDL_LOG_ERROR(module, msg) CDL_LOG_IMPL(::cdl::log::LogLevel::Error, module, msg)
#define CDL_LOG_FATAL(module, msg) CDL_LOG_IMPL(::cdl::log::LogLevel::Fatal, module, msg)

} // namespace cdl::log

#endif // CDL_LOG_HPP
