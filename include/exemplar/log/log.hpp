//! # Exemplar Logging
//!
//! Structured, module-tagged logging used by the execution engine:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-component filtering ("example", "hooks", "pending", ...)
//! - Console, file, in-memory and null sinks
//! - Compile-time level elision via EXEMPLAR_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! EXEMPLAR_LOG_DEBUG("example", "started " << example.full_description());
//! EXEMPLAR_LOG_WARN("hooks", "after(:each) hook raised " << failure.type);
//! ```

#ifndef EXEMPLAR_LOG_LOG_HPP
#define EXEMPLAR_LOG_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace exemplar::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-phase tracing of a run
    Debug = 1, ///< Lifecycle transitions
    Info = 2,  ///< Group-level progress
    Warn = 3,  ///< Secondary failures, deprecations
    Error = 4, ///< Misuse of the engine
    Fatal = 5, ///< Unrecoverable
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
const char* level_name(LogLevel level);

/// Parses a level name, case-insensitively. Unknown names map to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;       ///< Severity level
    std::string module;   ///< Module tag
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

/// Writes to stderr, colored when stderr is a terminal.
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
};

/// Appends to a file. Flushes on Error and Fatal records.
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

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Keeps records in memory. Attach it through `SharedSink` to inspect it
/// after the logger has taken ownership of the sink list.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    /// Snapshot of all records written so far.
    std::vector<LogRecord> records() const;

    /// Number of records whose module tag matches `module`.
    size_t count(std::string_view module) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/// Forwards to a sink owned elsewhere.
class SharedSink : public LogSink {
public:
    explicit SharedSink(std::shared_ptr<LogSink> target) : target_(std::move(target)) {}

    void write(const LogRecord& record) override {
        target_->write(record);
    }
    void flush() override {
        target_->flush();
    }

private:
    std::shared_ptr<LogSink> target_;
};

/// Renders a record as a single JSON object (no trailing newline).
std::string to_json_line(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter, parsed from "example=trace,hooks=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parses a filter specification. A bare module name enables Trace for it.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

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
/// Starts with a Warn-level console sink; `init()` replaces the sinks.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Messages are dropped until a sink is added.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const;

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// "HH:MM:SS.mmm" in local time.
std::string get_timestamp();

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the EXEMPLAR_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef EXEMPLAR_MIN_LOG_LEVEL
#define EXEMPLAR_MIN_LOG_LEVEL 0
#endif

/// Internal macro, not for direct use.
#define EXEMPLAR_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= EXEMPLAR_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::exemplar::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define EXEMPLAR_LOG_TRACE(module, msg)                                                            \
    EXEMPLAR_LOG_IMPL(::exemplar::log::LogLevel::Trace, module, msg)
#define EXEMPLAR_LOG_DEBUG(module, msg)                                                            \
    EXEMPLAR_LOG_IMPL(::exemplar::log::LogLevel::Debug, module, msg)
#define EXEMPLAR_LOG_INFO(module, msg)                                                             \
    EXEMPLAR_LOG_IMPL(::exemplar::log::LogLevel::Info, module, msg)
#define EXEMPLAR_LOG_WARN(module, msg)                                                             \
    EXEMPLAR_LOG_IMPL(::exemplar::log::LogLevel::Warn, module, msg)
#define EXEMPLAR_LOG_ERROR(module, msg)                                                            \
    EXEMPLAR_LOG_IMPL(::exemplar::log::LogLevel::Error, module, msg)
#define EXEMPLAR_LOG_FATAL(module, msg)                                                            \
    EXEMPLAR_LOG_IMPL(::exemplar::log::LogLevel::Fatal, module, msg)

} // namespace exemplar::log

#endif // EXEMPLAR_LOG_LOG_HPP
