//! # tfwheels Logging
//!
//! A structured logging library for tfwheels with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Multiple output sinks (Console, File, Null)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via WHEELS_MIN_LOG_LEVEL
//! - ANSI colored console output with terminal detection
//!
//! Diagnostics go to stderr so they never mix with terraform's own stdout.
//!
//! ## Usage
//!
//! ```cpp
//! WHEELS_LOG_INFO("router", "Effective command " << name);
//! WHEELS_LOG_DEBUG("tfgen", "Removing line " << index << " for -" << flag);
//! WHEELS_LOG_WARN("plugin", "Command " << name << " registered twice");
//! ```

#ifndef WHEELS_LOG_HPP
#define WHEELS_LOG_HPP

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

namespace wheels::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
/// Setting a minimum level filters out all messages below that threshold.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues or deprecations
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Errors that end the invocation
    Off = 6    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "router", "tfgen")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< Machine-parseable JSON (one object per line)
};

/// Renders a record as a single JSON object line (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, std::ostream& out = std::cerr);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
    std::ostream& out_;

    const char* level_color(LogLevel level) const;
};

/// File sink that writes log messages to a file.
/// Auto-flushes on Error and Fatal messages.
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

/// Null sink that discards all messages (for testing).
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans a record out to several child sinks.
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

/// Module-based log level filter.
///
/// Parses filter strings like "router=trace,lifecycle=debug,*=warn" and
/// provides fast `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given module should be logged.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
    /// Used for the fast-path check in Logger::should_log().
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Manages sinks, filtering, and dispatches log records. Auto-initializes
/// with a Warn-level console sink if `Logger::init()` is never called.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before constructing the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-formatted record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink to the logger.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove all sinks.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging options from an argument vector (argv[0] excluded).
/// Recognizes --wheels-log-level=, --wheels-log-filter=, --wheels-log-file=
/// and --wheels-log-format=. Falls back to the WHEELS_LOG environment
/// variable when neither a level nor a filter was given.
LogConfig parse_log_options(const std::vector<std::string>& args);

/// Returns `args` without the options consumed by parse_log_options(), so
/// they are never forwarded to terraform.
std::vector<std::string> strip_log_options(const std::vector<std::string>& args);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef WHEELS_MIN_LOG_LEVEL
#define WHEELS_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define WHEELS_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= WHEELS_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::wheels::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: WHEELS_LOG_TRACE("module", "message " << value);
#define WHEELS_LOG_TRACE(module, msg) WHEELS_LOG_IMPL(::wheels::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define WHEELS_LOG_DEBUG(module, msg) WHEELS_LOG_IMPL(::wheels::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define WHEELS_LOG_INFO(module, msg) WHEELS_LOG_IMPL(::wheels::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define WHEELS_LOG_WARN(module, msg) WHEELS_LOG_IMPL(::wheels::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define WHEELS_LOG_ERROR(module, msg) WHEELS_LOG_IMPL(::wheels::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define WHEELS_LOG_FATAL(module, msg) WHEELS_LOG_IMPL(::wheels::log::LogLevel::Fatal, module, msg)

} // namespace wheels::log

#endif // WHEELS_LOG_HPP
