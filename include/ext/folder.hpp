//! # Folder Layout
//!
//! Where `just` keeps its files. Only the binary directory matters to the
//! extension manager:
//!
//! ```text
//! $JUST_HOME/bin/          (when JUST_HOME is set)
//! ~/.just/bin/             (otherwise)
//! ```

#ifndef JUST_EXT_FOLDER_HPP
#define JUST_EXT_FOLDER_HPP

#include "ext/error.hpp"

#include <filesystem>

namespace just::ext {

struct Folder {
    std::filesystem::path root;
    std::filesystem::path bin_path;

    /// Layout rooted at `root`, with binaries in `root/bin`. Touches nothing.
    static Folder at(const std::filesystem::path& root);

    /// Resolves the layout from JUST_HOME or the user's home directory and
    /// creates the binary directory if it is missing.
    static ExtResult<Folder> from_env();
};

/// The user's home directory, or an empty path if it cannot be determined.
std::filesystem::path home_dir();

} // namespace just::ext

#endif // JUST_EXT_FOLDER_HPP
