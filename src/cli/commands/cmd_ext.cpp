//! # Extension Commands
//!
//! ```text
//! $ just-ext install https://github.com/owner/fmt
//! Installed /home/me/.just/bin/just-fmt
//!
//! $ just-ext list
//! just-fmt
//! just-lint
//!
//! $ just-ext run fmt --check
//! ```

#include "cmd_ext.hpp"

#include "ext/name_resolver.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <iostream>

namespace just::cli {

static void report(const ext::ExtensionError& error) {
    JUST_LOG_ERROR("cli", error.to_string());
}

int run_install(ext::ExtensionManager& manager, const std::string& url) {
    auto result = manager.install(url);
    if (is_err(result)) {
        report(unwrap_err(result));
        return 1;
    }
    std::cout << "Installed " << unwrap(result).string() << "\n";
    return 0;
}

int run_uninstall(ext::ExtensionManager& manager, const std::string& name) {
    auto result = manager.uninstall(name);
    if (is_err(result)) {
        report(unwrap_err(result));
        return 1;
    }
    if (unwrap(result)) {
        std::cout << "Uninstalled " << ext::canonicalize(name) << "\n";
    } else {
        std::cout << ext::canonicalize(name) << " is not installed\n";
    }
    return 0;
}

int run_list(const ext::ExtensionManager& manager) {
    auto names = manager.list();
    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        std::cout << name << "\n";
    }
    return 0;
}

int run_which(const ext::ExtensionManager& manager, const std::string& name) {
    auto path = manager.locate(name);
    if (!path) {
        JUST_LOG_ERROR("cli", ext::canonicalize(name) << " is not installed");
        return 1;
    }
    std::cout << path->string() << "\n";
    return 0;
}

int run_extension(const ext::ExtensionManager& manager, ext::CommandRunner& runner,
                  const std::string& name, const std::vector<std::string>& args) {
    auto path = manager.locate(name);
    if (!path) {
        JUST_LOG_ERROR("cli", ext::canonicalize(name)
                                  << " is not installed. Install it with 'just-ext install <url>'");
        return 1;
    }

    auto result = runner.run(path->string(), args);
    if (is_err(result)) {
        JUST_LOG_ERROR("cli", "Cannot run " << path->string() << ": " << unwrap_err(result).message);
        return 1;
    }
    return unwrap(result);
}

} // namespace just::cli
