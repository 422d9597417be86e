//! # Logger Implementation
//!
//! Sinks, the module filter and the process-wide `Logger`. Records are
//! formatted into a single string before they reach a stream so lines from
//! the parse worker and the consumer thread never interleave.

#include "log/log.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define JSEV_ISATTY(fd) _isatty(fd)
#define JSEV_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define JSEV_ISATTY(fd) isatty(fd)
#define JSEV_FILENO(f) fileno(f)
#endif

namespace jsev::log {

// ============================================================================
// Levels and Time
// ============================================================================

namespace {

struct LevelEntry {
    LogLevel level;
    const char* upper;
    const char* lower;
};

constexpr std::array<LevelEntry, 7> LEVELS = {{
    {LogLevel::Trace, "TRACE", "trace"},
    {LogLevel::Debug, "DEBUG", "debug"},
    {LogLevel::Info, "INFO", "info"},
    {LogLevel::Warn, "WARN", "warn"},
    {LogLevel::Error, "ERROR", "error"},
    {LogLevel::Fatal, "FATAL", "fatal"},
    {LogLevel::Off, "OFF", "off"},
}};

} // namespace

auto level_name(LogLevel level) -> const char* {
    for (const auto& entry : LEVELS) {
        if (entry.level == level) {
            return entry.upper;
        }
    }
    return "???";
}

auto parse_level(std::string_view s) -> LogLevel {
    for (const auto& entry : LEVELS) {
        if (s == entry.upper || s == entry.lower) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

auto get_timestamp() -> std::string {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto seconds = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis;
    return oss.str();
}

auto epoch_ms() -> int64_t {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Terminal Color Detection
// ============================================================================

/// Detects if stderr supports ANSI color codes.
static bool detect_terminal_colors() {
    if (!JSEV_ISATTY(JSEV_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string_view(term) != "dumb";
}

// ============================================================================
// Line Writers
// ============================================================================

void write_text_line(std::ostream& out, const LogRecord& record, const char* color) {
    out << get_timestamp() << " ";
    if (color) {
        out << color;
    }
    // Pad level name to 5 chars for alignment
    out << std::left << std::setw(5) << level_name(record.level);
    if (color) {
        out << "\033[0m";
    }
    out << " [" << record.module << "] " << record.message << "\n";
}

void write_json_line(std::ostream& out, const LogRecord& record) {
    out << "{\"ts\":" << record.timestamp_ms << ","
        << "\"level\":\"" << level_name(record.level) << "\","
        << "\"module\":\"" << record.module << "\","
        << "\"msg\":\"";

    for (char c : record.message) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                out << c;
            }
        }
    }

    out << "\"}\n";
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) const {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    // Build the whole line first so concurrent writers never interleave mid-line.
    std::ostringstream oss;
    if (format_ == LogFormat::JSON) {
        write_json_line(oss, record);
    } else {
        write_text_line(oss, record, colors_enabled_ ? level_color(record.level) : nullptr);
    }
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    if (format_ == LogFormat::JSON) {
        write_json_line(file_, record);
    } else {
        write_text_line(file_, record);
    }

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(LogLevel::Warn);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter();

    if (!config.filter_spec.empty()) {
        // A spec without "*=level" keeps the configured level as default.
        logger.filter_.set_default_level(config.level);
        logger.filter_.parse(config.filter_spec);
        // The fast path must not reject what a per-module override accepts.
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_.set_default_level(config.level);
        logger.level_ = config.level;
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_.load(std::memory_order_relaxed))
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace jsev::log
