//! # just-ext Logging
//!
//! Leveled, module-tagged logging shared by the extension manager and the
//! `just-ext` command line:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering (`install=debug,*=warn`)
//! - Console (stderr) and file sinks, text or JSON lines
//! - Mutex-protected dispatch
//! - Compile-time level elision via JUST_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! JUST_LOG_DEBUG("install", "Clone " << url << " into " << repo_path);
//! JUST_LOG_WARN("ext", "Skipping unreadable entry " << path);
//! ```

#ifndef JUST_LOG_HPP
#define JUST_LOG_HPP

#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace just::log {

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
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
const char* level_name(LogLevel level);

/// Parses a level name, ignoring case. Unknown names map to LogLevel::Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "install", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

/// Renders a record as a single line (newline included) in the given format.
std::string format_record(const LogRecord& record, LogFormat format);

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

/// A sink that renders records through format_record().
class FormattedSink : public LogSink {
public:
    void set_format(LogFormat format) {
        format_ = format;
    }
    LogFormat format() const {
        return format_;
    }

protected:
    LogFormat format_ = LogFormat::Text;
};

/// Writes to stderr, coloring the level when stderr is a color terminal.
class ConsoleSink : public FormattedSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_;
};

/// Appends log lines to a file. Flushes after Error and Fatal records.
class FileSink : public FormattedSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return out_.is_open();
    }

private:
    std::ofstream out_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level thresholds with a fallback for unlisted modules.
///
/// Filter strings look like "install=debug,process=trace,*=warn". Whitespace
/// around entries is ignored; a module named without "=level" logs
/// everything.
class LogFilter {
public:
    void parse(std::string_view text);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        fallback_ = level;
    }
    LogLevel default_level() const {
        return fallback_;
    }

    /// Lowest threshold across all modules.
    LogLevel min_level() const;

private:
    LogLevel fallback_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> thresholds_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for Logger::init().
struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< e.g. "install=debug,*=warn"
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;     ///< Log to stderr
    bool colors = true;      ///< ANSI colors on the console
};

/// Process-wide logger. Before init() it logs Info and above to stderr.
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void set_level(LogLevel level);
    void set_filter(std::string_view spec);

    LogLevel level() const {
        return level_;
    }

    void flush();

private:
    Logger();

    static std::vector<std::unique_ptr<LogSink>> make_sinks(const LogConfig& config);

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns milliseconds since epoch.
int64_t epoch_ms();

/// Parses the logging flags out of argv:
/// --log-level=, --log-filter=, --log-file=, --log-format=, -q, -v/-vv/-vvv.
/// Falls back to the JUST_LOG environment variable. Default level is Warn.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the flags consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace ... 5=Fatal, 6=Off. Calls below this level compile to nothing.
#ifndef JUST_MIN_LOG_LEVEL
#define JUST_MIN_LOG_LEVEL 0
#endif

#define JUST_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= JUST_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::just::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define JUST_LOG_TRACE(module, msg) JUST_LOG_IMPL(::just::log::LogLevel::Trace, module, msg)
#define JUST_LOG_DEBUG(module, msg) JUST_LOG_IMPL(::just::log::LogLevel::Debug, module, msg)
#define JUST_LOG_INFO(module, msg) JUST_LOG_IMPL(::just::log::LogLevel::Info, module, msg)
#define JUST_LOG_WARN(module, msg) JUST_LOG_IMPL(::just::log::LogLevel::Warn, module, msg)
#define JUST_LOG_ERROR(module, msg) JUST_LOG_IMPL(::just::log::LogLevel::Error, module, msg)
#define JUST_LOG_FATAL(module, msg) JUST_LOG_IMPL(::just::log::LogLevel::Fatal, module, msg)

} // namespace just::log

#endif // JUST_LOG_HPP
