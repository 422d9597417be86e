//! # jsev Logging
//!
//! A small structured logging layer shared by the library and the `jsev` tool:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks
//! - Thread-safe dispatch (the parse worker and the consumer log concurrently)
//! - Compile-time level elision via JSEV_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! JSEV_LOG_DEBUG("parser", "document " << count << " complete");
//! JSEV_LOG_WARN("tool", "could not open " << path);
//! ```

#ifndef JSEV_LOG_HPP
#define JSEV_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jsev::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity of a record. Comparison follows declaration order.
enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

/// Upper-case name of `level` as printed in log lines ("TRACE", "WARN", ...).
auto level_name(LogLevel level) -> const char*;

/// Level named by `s` in lower or upper case (`debug`, `DEBUG`).
/// Unknown names map to `LogLevel::Info`.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// One message from a jsev component, e.g. the parse worker reporting a
/// cancelled send under module "stream".
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< cursor, parser, stream, writer or tool
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Wall clock, milliseconds since the epoch
};

/// Line format selected by `--log-format=`.
enum class LogFormat { Text, JSON };

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination of formatted records. Called with the logger's mutex held.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr so log lines never mix with the events or JSON the tool
/// prints on stdout. Colors apply to the level name only.
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

/// Appends to the file named by `--log-file=`. Error and Fatal records are
/// flushed at once so a crashed parse still leaves its reason on disk.
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

/// Writes `record` as `HH:MM:SS.mmm LEVEL [module] message\n`.
void write_text_line(std::ostream& out, const LogRecord& record, const char* color = nullptr);

/// Writes `record` as a single-line JSON object.
void write_json_line(std::ostream& out, const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module minimum levels, e.g. `cursor=trace,parser=debug,*=warn`.
///
/// `*=level` sets the level of every module not named explicitly.
class LogFilter {
public:
    LogFilter() = default;

    /// Replaces the module table with the entries of `spec`. A bare module
    /// name enables Trace for it.
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

/// Logging setup of one `jsev` run, built by `parse_log_options`.
struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< `--log-filter=` or a filter-shaped `JSEV_LOG`
    std::string log_file;    ///< Empty for no file sink
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger shared by the parse worker, the consumer thread and
/// the tool.
///
/// Until `Logger::init()` runs (library use without the tool) only warnings
/// and above reach stderr.
class Logger {
public:
    /// Replaces sinks, level and filter.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is formatted.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drops every sink. Records are discarded until a sink is added again.
    void clear_sinks();

    /// Sets both the fast-path level and the filter default.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Local wall-clock time as `HH:MM:SS.mmm`, the prefix of text lines.
auto get_timestamp() -> std::string;

auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds the logging setup from the `jsev` command line.
///
/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv`, `--verbose` and `-q`. Without a level or filter option
/// the `JSEV_LOG` environment variable is consulted. Other arguments are
/// left to `parse_tool_args`.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JSEV_MIN_LOG_LEVEL
#define JSEV_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define JSEV_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= JSEV_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::jsev::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define JSEV_LOG_TRACE(module, msg) JSEV_LOG_IMPL(::jsev::log::LogLevel::Trace, module, msg)
#define JSEV_LOG_DEBUG(module, msg) JSEV_LOG_IMPL(::jsev::log::LogLevel::Debug, module, msg)
#define JSEV_LOG_INFO(module, msg) JSEV_LOG_IMPL(::jsev::log::LogLevel::Info, module, msg)
#define JSEV_LOG_WARN(module, msg) JSEV_LOG_IMPL(::jsev::log::LogLevel::Warn, module, msg)
#define JSEV_LOG_ERROR(module, msg) JSEV_LOG_IMPL(::jsev::log::LogLevel::Error, module, msg)
#define JSEV_LOG_FATAL(module, msg) JSEV_LOG_IMPL(::jsev::log::LogLevel::Fatal, module, msg)

} // namespace jsev::log

#endif // JSEV_LOG_HPP
