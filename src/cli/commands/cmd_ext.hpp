//! # Extension Commands Interface
//!
//! | Function          | Command                        | Description                  |
//! |-------------------|--------------------------------|------------------------------|
//! | `run_install()`   | `just-ext install <url>`       | Fetch, build, install        |
//! | `run_uninstall()` | `just-ext uninstall <name>`    | Remove an installed binary   |
//! | `run_list()`      | `just-ext list`                | Sorted installed extensions  |
//! | `run_which()`     | `just-ext which <name>`        | Path of an installed binary  |
//! | `run_extension()` | `just-ext run <name> [args]`   | Execute an extension         |
//!
//! Each handler returns the process exit code. Results go to stdout, errors
//! are logged under the "cli" module.

#ifndef JUST_CLI_CMD_EXT_HPP
#define JUST_CLI_CMD_EXT_HPP

#include "ext/command_runner.hpp"
#include "ext/extension_manager.hpp"

#include <string>
#include <vector>

namespace just::cli {

int run_install(ext::ExtensionManager& manager, const std::string& url);

int run_uninstall(ext::ExtensionManager& manager, const std::string& name);

int run_list(const ext::ExtensionManager& manager);

/// Exit code 1 when the extension is not installed.
int run_which(const ext::ExtensionManager& manager, const std::string& name);

/// Runs the installed extension and returns its exit status.
int run_extension(const ext::ExtensionManager& manager, ext::CommandRunner& runner,
                  const std::string& name, const std::vector<std::string>& args);

} // namespace just::cli

#endif // JUST_CLI_CMD_EXT_HPP
