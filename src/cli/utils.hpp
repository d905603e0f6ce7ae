//! # CLI Utilities Interface
//!
//! | Function           | Description                                   |
//! |--------------------|-----------------------------------------------|
//! | `parse_cli_args()` | Split argv into command words and passthrough |
//! | `env_or()`         | Read an environment variable with a default   |
//! | `print_usage()`    | Print CLI help text                           |
//! | `print_version()`  | Print tool version                            |

#pragma once

#include <string>
#include <vector>

namespace just::cli {

/// argv split for dispatch.
///
/// Logging flags are dropped from `positional`. For `run <name> ...` every
/// argument after the name is forwarded untouched in `passthrough`, and
/// `log_argc` stops before them so the extension's own flags (like -v) are not
/// read as logging flags.
struct CliArgs {
    std::vector<std::string> positional;
    std::vector<std::string> passthrough;
    int log_argc = 0;
};

CliArgs parse_cli_args(int argc, char* argv[]);

std::string env_or(const char* name, const std::string& fallback);

void print_usage();
void print_version();

} // namespace just::cli
