#include "utils.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <iostream>

namespace just::cli {

CliArgs parse_cli_args(int argc, char* argv[]) {
    CliArgs args;
    args.log_argc = argc;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }

        args.positional.push_back(arg);
        if (args.positional.size() == 2 && args.positional[0] == "run") {
            for (int j = i + 1; j < argc; ++j) {
                args.passthrough.emplace_back(argv[j]);
            }
            args.log_argc = i + 1;
            break;
        }
    }

    return args;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

void print_usage() {
    std::cout << "just-ext " << VERSION << "\n\n";
    std::cout << "Usage: just-ext <command> [options] [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  install <url>          Fetch, build and install an extension from github.com\n";
    std::cout << "  uninstall <name>       Remove an installed extension\n";
    std::cout << "  list                   List installed extensions\n";
    std::cout << "  which <name>           Print the path of an installed extension\n";
    std::cout << "  run <name> [args...]   Run an installed extension\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h             Show this help\n";
    std::cout << "  --version, -V          Show version\n";
    std::cout << "  -v, -vv, -vvv          Log info, debug or trace messages\n";
    std::cout << "  -q, --quiet            Log errors only\n";
    std::cout << "  --log-level=<level>    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>    Per-module levels, e.g. install=debug,*=warn\n";
    std::cout << "  --log-file=<path>      Also write log messages to a file\n";
    std::cout << "  --log-format=json      Log as JSON lines\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  JUST_HOME              Layout root (default ~/.just)\n";
    std::cout << "  JUST_LOG               Log level or filter spec\n";
    std::cout << "  JUST_GIT, JUST_CARGO   Programs used to fetch and build extensions\n";
}

void print_version() {
    std::cout << "just-ext " << VERSION << "\n";
}

} // namespace just::cli
