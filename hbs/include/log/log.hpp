//! # HBS Logging
//!
//! A structured logging library for the HBS tokenizer and its tools:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Multiple output sinks (Console, File)
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via HBS_MIN_LOG_LEVEL
//! - Text or JSON-lines record format
//!
//! ## Usage
//!
//! ```cpp
//! HBS_LOG_DEBUG("lexer", "Scanned " << tokens.size() << " tokens");
//! HBS_LOG_WARN("options", "Ignoring unknown option '" << key << "'");
//! ```

#ifndef HBS_LOG_HPP
#define HBS_LOG_HPP

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

namespace hbs::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
/// Setting a minimum level filters out all messages below that threshold.
enum class LogLevel : int {
    Trace = 0, ///< Per-token tracing
    Debug = 1, ///< Scan summaries and state changes
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Ignored configuration, suspicious input
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level from a lower- or upper-case name.
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
    std::string_view module; ///< Module tag (e.g., "lexer", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log records.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

/// Renders a record as a single line (including the trailing newline).
std::string format_record(const LogRecord& record, LogFormat format);

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
    explicit ConsoleSink(bool use_colors = true);

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

    const char* level_color(LogLevel level) const;
};

/// File sink. Auto-flushes on Error and Fatal records.
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

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "lexer=trace,cli=debug,*=warn" and
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

    /// Lowest level configured for any module or the default.
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
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
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
/// Manages sinks and filtering, and dispatches log records. Until
/// `Logger::init()` is called the logger has no sinks and drops everything.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-built record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (records are dropped until one is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
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
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

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

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Falls back to the HBS_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef HBS_MIN_LOG_LEVEL
#define HBS_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define HBS_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= HBS_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::hbs::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: HBS_LOG_TRACE("module", "message " << value);
#define HBS_LOG_TRACE(module, msg) HBS_LOG_IMPL(::hbs::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define HBS_LOG_DEBUG(module, msg) HBS_LOG_IMPL(::hbs::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define HBS_LOG_INFO(module, msg) HBS_LOG_IMPL(::hbs::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define HBS_LOG_WARN(module, msg) HBS_LOG_IMPL(::hbs::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define HBS_LOG_ERROR(module, msg) HBS_LOG_IMPL(::hbs::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define HBS_LOG_FATAL(module, msg) HBS_LOG_IMPL(::hbs::log::LogLevel::Fatal, module, msg)

} // namespace hbs::log

#endif // HBS_LOG_HPP
