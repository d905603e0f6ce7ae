//! # Extension Manager
//!
//! Looks up, installs, uninstalls and lists the extension binaries kept in
//! the Folder's binary directory.
//!
//! ## Install Pipeline
//!
//! ```text
//! install("https://github.com/owner/tool")
//!   1. repository name      "tool"                        (errors from parse_repository_name)
//!   2. clean workspace      rm -rf <work_dir>/tool        (IoError)
//!   3. fetch                git clone <url> <work_dir>/tool  (FetchFailed)
//!   4. build                cargo build --release --manifest-path <work_dir>/tool/Cargo.toml
//!                                                         (BuildFailed, workspace kept)
//!   5. copy                 <work_dir>/tool/target/release/tool -> <bin>/just-tool  (IoError)
//!   6. cleanup              rm -rf <work_dir>/tool        (IoError)
//! ```
//!
//! Each step runs only if the previous one succeeded. Nothing is retried and
//! nothing is rolled back.

#ifndef JUST_EXT_EXTENSION_MANAGER_HPP
#define JUST_EXT_EXTENSION_MANAGER_HPP

#include "ext/command_runner.hpp"
#include "ext/error.hpp"
#include "ext/filesystem.hpp"
#include "ext/folder.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace just::ext {

/// Toolchain settings for install().
struct InstallOptions {
    std::string git = "git";
    std::string cargo = "cargo";
    /// Parent of the temporary checkout. Empty means the current directory.
    fs::path work_dir;
};

class ExtensionManager {
public:
    /// `folder`, `files` and `runner` must outlive the manager.
    ExtensionManager(const Folder& folder, FileSystem& files, CommandRunner& runner,
                     InstallOptions options = {});

    /// `<bin_path>/just-<name><EXE_SUFFIX>`. Does not touch the disk.
    fs::path resolve_path(std::string_view name) const;

    /// resolve_path(name) if that file exists right now.
    std::optional<fs::path> locate(std::string_view name) const;

    bool is_installed(std::string_view name) const;

    /// File names of all extension binaries below the binary directory, in
    /// traversal order.
    std::vector<std::string> list() const;

    /// Fetches, builds and installs the extension at `url`. Returns the
    /// installed binary's path.
    ExtResult<fs::path> install(std::string_view url);

    /// Deletes the extension's binary. Returns false if it was not installed.
    ExtResult<bool> uninstall(std::string_view name);

    const InstallOptions& options() const {
        return options_;
    }

private:
    ExtResult<fs::path> working_directory(const std::string& repo) const;
    std::optional<ExtensionError> run_step(ErrorKind kind, const std::string& program,
                                           const std::vector<std::string>& args);

    const Folder& folder_;
    FileSystem& files_;
    CommandRunner& runner_;
    InstallOptions options_;
};

} // namespace just::ext

#endif // JUST_EXT_EXTENSION_MANAGER_HPP
