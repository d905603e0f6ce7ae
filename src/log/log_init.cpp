//! # Log Initialization from CLI
//!
//! Turns the logging flags and the JUST_LOG environment variable into a
//! LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace just::log {

/// Returns the number of 'v' in "-v", "-vv", "-vvv"; 0 for anything else.
static int count_verbose_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return 0;
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || count_verbose_flag(arg) > 0;
}

static std::string read_env(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn;

    bool has_level = false;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_level = true;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, count_verbose_flag(arg));
        }
    }

    if (!has_level && verbosity > 0) {
        if (verbosity >= 3) {
            config.level = LogLevel::Trace;
        } else if (verbosity == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_level = true;
    }

    if (!has_level && !has_filter) {
        std::string env = read_env("JUST_LOG");
        if (!env.empty()) {
            if (env.find('=') != std::string::npos || env.find(',') != std::string::npos) {
                config.filter_spec = env;
            } else {
                config.level = parse_level(env);
            }
        }
    }

    return config;
}

} // namespace just::log
