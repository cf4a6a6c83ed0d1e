//! # gadgetgen Logging
//!
//! Structured, module-tagged logging:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering (`emit=debug,*=warn`)
//! - Console (stderr), file and null sinks, text or JSON lines
//! - Thread-safe dispatch
//! - Compile-time elision via GADGETGEN_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! GADGETGEN_LOG_INFO("cli", "Reading " << path);
//! GADGETGEN_LOG_DEBUG("emit", "Rendered " << kind_name(record.kind));
//! ```
//!
//! Module tags in use: `registry`, `emit`, `symbols`, `listing`, `cli`.

#ifndef GADGETGEN_LOG_HPP
#define GADGETGEN_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gadgetgen::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Returns the upper-case name of a level (e.g. "DEBUG").
auto level_name(LogLevel level) -> const char*;

/// Parses a level name (lower or upper case). Unknown names yield Info.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "emit", "cli")
    std::string message;
    const char* file; ///< Source file (__FILE__)
    int line;         ///< Source line (__LINE__)
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One object per line
};

/// Formats a record as a text line (no newline, no colors).
auto format_text(const LogRecord& record) -> std::string;

/// Formats a record as a JSON object (no newline).
auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract output destination.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, with ANSI colors when stderr is a terminal.
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

/// Writes to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const {
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

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Spec strings look like `"emit=trace,listing=debug,*=warn"`. A bare module
/// name without `=level` enables everything for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level across the default and every module override.
    [[nodiscard]] LogLevel min_level() const;

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
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger.
///
/// Usable before `init()`; it then has no sinks and drops every record.
class Logger {
public:
    /// Replaces sinks, level and filter according to `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast check used by the macros before a message is built.
    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns current local time as "HH:MM:SS.mmm".
auto get_timestamp() -> std::string;

/// Milliseconds since the epoch.
auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts logging options from argv: --log-level, --log-filter,
/// --log-file, --log-format, -v/-vv/-vvv, -q/--quiet. Falls back to the
/// GADGETGEN_LOG environment variable when none of the level/filter options
/// is present.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true if `arg` is one of the options `parse_log_options` consumes.
auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef GADGETGEN_MIN_LOG_LEVEL
#define GADGETGEN_MIN_LOG_LEVEL 0
#endif

/// Internal macro, not for direct use.
#define GADGETGEN_LOG_IMPL(level, module_str, msg)                                                 \
    do {                                                                                           \
        if (static_cast<int>(level) >= GADGETGEN_MIN_LOG_LEVEL) {                                  \
            auto& logger_ = ::gadgetgen::log::Logger::instance();                                  \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define GADGETGEN_LOG_TRACE(module, msg)                                                           \
    GADGETGEN_LOG_IMPL(::gadgetgen::log::LogLevel::Trace, module, msg)
#define GADGETGEN_LOG_DEBUG(module, msg)                                                           \
    GADGETGEN_LOG_IMPL(::gadgetgen::log::LogLevel::Debug, module, msg)
#define GADGETGEN_LOG_INFO(module, msg)                                                            \
    GADGETGEN_LOG_IMPL(::gadgetgen::log::LogLevel::Info, module, msg)
#define GADGETGEN_LOG_WARN(module, msg)                                                            \
    GADGETGEN_LOG_IMPL(::gadgetgen::log::LogLevel::Warn, module, msg)
#define GADGETGEN_LOG_ERROR(module, msg)                                                           \
    GADGETGEN_LOG_IMPL(::gadgetgen::log::LogLevel::Error, module, msg)
#define GADGETGEN_LOG_FATAL(module, msg)                                                           \
    GADGETGEN_LOG_IMPL(::gadgetgen::log::LogLevel::Fatal, module, msg)

} // namespace gadgetgen::log

#endif // GADGETGEN_LOG_HPP
