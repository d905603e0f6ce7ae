//! # CLI Command Dispatcher
//!
//! ```text
//! just_ext_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ install        → run_install()
//!   ├─ uninstall      → run_uninstall()
//!   ├─ list           → run_list()
//!   ├─ which          → run_which()
//!   └─ run            → run_extension()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                  |
//! |------|------------------------------------------|
//! | 0    | Success                                  |
//! | 1    | Operation failed                         |
//! | 2    | Bad usage                                |
//!
//! `run` forwards the extension's own exit status.

#include "commands/cmd_ext.hpp"
#include "driver.hpp"
#include "ext/command_runner.hpp"
#include "ext/extension_manager.hpp"
#include "ext/filesystem.hpp"
#include "ext/folder.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace just::cli {

static int usage_error(const std::string& usage) {
    std::cerr << "Usage: just-ext " << usage << "\n";
    return 2;
}

static int dispatch(const CliArgs& args) {
    const auto& words = args.positional;
    if (words.empty() || words[0] == "--help" || words[0] == "-h" || words[0] == "help") {
        print_usage();
        return 0;
    }
    if (words[0] == "--version" || words[0] == "-V") {
        print_version();
        return 0;
    }

    const std::string& command = words[0];
    if (command != "install" && command != "uninstall" && command != "list" &&
        command != "which" && command != "run") {
        std::cerr << "error: unknown command '" << command << "'\n\n";
        print_usage();
        return 2;
    }

    if (command == "list") {
        if (words.size() != 1)
            return usage_error("list");
    } else if (words.size() != 2) {
        return usage_error(command + (command == "install" ? " <url>" : " <name>") +
                           (command == "run" ? " [args...]" : ""));
    }

    auto folder_result = ext::Folder::from_env();
    if (is_err(folder_result)) {
        JUST_LOG_ERROR("cli", unwrap_err(folder_result).to_string());
        return 1;
    }
    const ext::Folder& folder = unwrap(folder_result);

    ext::InstallOptions options;
    options.git = env_or("JUST_GIT", "git");
    options.cargo = env_or("JUST_CARGO", "cargo");

    ext::LocalFileSystem files;
    ext::ProcessCommandRunner runner;
    ext::ExtensionManager manager(folder, files, runner, options);

    if (command == "install")
        return run_install(manager, words[1]);
    if (command == "uninstall")
        return run_uninstall(manager, words[1]);
    if (command == "list")
        return run_list(manager);
    if (command == "which")
        return run_which(manager, words[1]);
    return run_extension(manager, runner, words[1], args.passthrough);
}

} // namespace just::cli

int just_ext_main(int argc, char* argv[]) {
    auto args = just::cli::parse_cli_args(argc, argv);
    just::log::Logger::init(just::log::parse_log_options(args.log_argc, argv));

    int code = just::cli::dispatch(args);
    just::log::Logger::instance().flush();
    return code;
}
