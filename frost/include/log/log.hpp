//! # Frost Logging
//!
//! Structured, module-tagged logging used by every build stage:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-stage filtering ("toc", "guts", "pyz", "pkg", "exe",
//!   "collect", "merge", "cache", "build")
//! - Sinks: console (stderr), file, null and an in-memory recorder
//! - Compile-time level elision via FROST_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! FROST_LOG_INFO("pkg", "Building PKG (CArchive) " << name);
//! FROST_LOG_WARN("toc", "Duplicate name " << name << " dropped");
//! ```

#ifndef FROST_LOG_HPP
#define FROST_LOG_HPP

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

namespace frost::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< Build progress
    Warn = 3,  ///< Recoverable problems (duplicate names, failed resource edits)
    Error = 4, ///< Errors reported before a build stops
    Fatal = 5, ///< Build-terminating conditions
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "WARN").
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

/// Parses a log level name, either all lower-case or all upper-case.
/// Unknown names yield LogLevel::Info.
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
    LogLevel level;       ///< Severity level
    std::string module;   ///< Module tag (e.g., "pkg")
    std::string message;  ///< Formatted message text
    const char* file;     ///< Source file (__FILE__)
    int line;             ///< Source line (__LINE__)
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// File sink. Flushes after every Error and Fatal record.
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

/// Keeps records in memory. The driver uses it to count warnings for the
/// build summary; tests use it to observe warn-and-continue paths.
///
/// Keep a raw pointer after handing ownership to the logger.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    /// Number of records at or above `level`.
    size_t count_at_least(LogLevel level) const;

    /// True if some record from `module` at `level` contains `needle`.
    bool contains(LogLevel level, std::string_view module, std::string_view needle) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter parsed from specs like "pkg=trace,cache=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse "module=level" pairs. `*` sets the default level; a bare module
    /// name enables everything from that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
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

/// Thread-safe global logger. Records are dropped until `init()` or
/// `add_sink()` installs a sink.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink (used between tests).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

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

/// Returns current local time formatted as "HH:MM:SS.mmm".
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

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the FROST_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef FROST_MIN_LOG_LEVEL
#define FROST_MIN_LOG_LEVEL 0
#endif

/// Internal macro — do not use directly.
#define FROST_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= FROST_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::frost::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define FROST_LOG_TRACE(module, msg) FROST_LOG_IMPL(::frost::log::LogLevel::Trace, module, msg)
#define FROST_LOG_DEBUG(module, msg) FROST_LOG_IMPL(::frost::log::LogLevel::Debug, module, msg)
#define FROST_LOG_INFO(module, msg) FROST_LOG_IMPL(::frost::log::LogLevel::Info, module, msg)
#define FROST_LOG_WARN(module, msg) FROST_LOG_IMPL(::frost::log::LogLevel::Warn, module, msg)
#define FROST_LOG_ERROR(module, msg) FROST_LOG_IMPL(::frost::log::LogLevel::Error, module, msg)
#define FROST_LOG_FATAL(module, msg) FROST_LOG_IMPL(::frost::log::LogLevel::Fatal, module, msg)

} // namespace frost::log

#endif // FROST_LOG_HPP
