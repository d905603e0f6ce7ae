//! # Logger Implementation
//!
//! Sinks, record formatting, the module filter and the Logger singleton.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define JUST_ISATTY(fd) _isatty(fd)
#define JUST_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define JUST_ISATTY(fd) isatty(fd)
#define JUST_FILENO(f) fileno(f)
#endif

namespace just::log {

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
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

LogLevel parse_level(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    if (lower == "off")
        return LogLevel::Off;
    return LogLevel::Info;
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Formatting
// ============================================================================

/// "HH:MM:SS.mmm" in local time.
static std::string format_timestamp(int64_t timestamp_ms) {
    auto secs = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &secs);
#else
    localtime_r(&secs, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return oss.str();
}

static void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    static const char* hex = "0123456789abcdef";
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            oss << '\\' << c;
        } else if (c == '\n') {
            oss << "\\n";
        } else if (c == '\t') {
            oss << "\\t";
        } else if (c == '\r') {
            oss << "\\r";
        } else if (byte < 0x20) {
            oss << "\\u00" << hex[byte >> 4] << hex[byte & 0xf];
        } else {
            oss << c;
        }
    }
}

std::string format_record(const LogRecord& record, LogFormat format) {
    std::ostringstream oss;
    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":\"";
        append_json_escaped(oss, record.module);
        oss << "\",\"msg\":\"";
        append_json_escaped(oss, record.message);
        oss << "\"}\n";
    } else {
        oss << format_timestamp(record.timestamp_ms) << " " << std::left << std::setw(5)
            << level_name(record.level) << " [" << record.module << "] " << record.message << "\n";
    }
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

static bool detect_terminal_colors() {
#ifdef _WIN32
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    if (handle == INVALID_HANDLE_VALUE)
        return false;

    DWORD mode = 0;
    if (!GetConsoleMode(handle, &mode))
        return false;

    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    if (!JUST_ISATTY(JUST_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

static const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

ConsoleSink::ConsoleSink(bool use_colors) : colors_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ != LogFormat::Text || !colors_) {
        std::cerr << format_record(record, format_);
        return;
    }
    std::ostringstream line;
    line << format_timestamp(record.timestamp_ms) << " " << level_color(record.level) << std::left
         << std::setw(5) << level_name(record.level) << "\033[0m [" << record.module << "] "
         << record.message << "\n";
    std::cerr << line.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : out_(path, std::ios::out | (append ? std::ios::app : std::ios::trunc)) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    if (!out_.is_open())
        return;
    out_ << format_record(record, format_);
    // Errors usually precede an exit; keep them on disk.
    if (record.level >= LogLevel::Error)
        out_.flush();
}

void FileSink::flush() {
    if (out_.is_open())
        out_.flush();
}

// ============================================================================
// LogFilter
// ============================================================================

static std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

void LogFilter::parse(std::string_view text) {
    thresholds_.clear();

    while (!text.empty()) {
        auto comma = text.find(',');
        auto entry = trim(text.substr(0, comma));
        text = comma == std::string_view::npos ? std::string_view() : text.substr(comma + 1);
        if (entry.empty())
            continue;

        auto eq = entry.find('=');
        auto module = trim(entry.substr(0, eq));
        auto level = eq == std::string_view::npos ? LogLevel::Trace
                                                  : parse_level(trim(entry.substr(eq + 1)));
        if (module == "*") {
            fallback_ = level;
        } else if (!module.empty()) {
            thresholds_.insert_or_assign(std::string(module), level);
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto found = thresholds_.find(module);
    return level >= (found != thresholds_.end() ? found->second : fallback_);
}

LogLevel LogFilter::min_level() const {
    auto lowest = fallback_;
    for (const auto& entry : thresholds_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

std::vector<std::unique_ptr<LogSink>> Logger::make_sinks(const LogConfig& config) {
    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        sinks.push_back(std::move(console));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (!file->is_open()) {
            std::cerr << "warning: cannot open log file " << config.log_file << "\n";
        } else {
            file->set_format(config.format);
            sinks.push_back(std::move(file));
        }
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_unique<NullSink>());
    }
    return sinks;
}

void Logger::init(const LogConfig& config) {
    LogFilter filter;
    filter.parse(config.filter_spec);
    // An explicit level below the filter's "*" entry lowers it.
    if (config.filter_spec.empty() || config.level < filter.default_level()) {
        filter.set_default_level(config.level);
    }
    auto sinks = make_sinks(config);

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.filter_ = std::move(filter);
    logger.level_ = logger.filter_.min_level();
    logger.sinks_ = std::move(sinks);
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    level_ = filter_.min_level();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace just::log
