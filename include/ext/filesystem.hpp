//! # Filesystem Capability
//!
//! Every disk access of the extension manager goes through `FileSystem`, so
//! the install, uninstall and listing logic can run against an in-memory fake.
//! `LocalFileSystem` is the real implementation on top of `std::filesystem`.
//!
//! Operations report failures as `std::error_code` and never throw.

#ifndef JUST_EXT_FILESYSTEM_HPP
#define JUST_EXT_FILESYSTEM_HPP

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace just::ext {

namespace fs = std::filesystem;

/// One entry produced by FileSystem::walk().
struct WalkEntry {
    fs::path path;
    std::string file_name;
    bool is_directory = false;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// False when the path is missing or cannot be checked.
    virtual bool exists(const fs::path& path) = 0;

    /// Removes a directory and everything below it.
    virtual std::error_code remove_dir_all(const fs::path& path) = 0;

    virtual std::error_code remove_file(const fs::path& path) = 0;

    /// Copies a regular file, replacing `to` if it exists.
    virtual std::error_code copy_file(const fs::path& from, const fs::path& to) = 0;

    /// Recursively lists everything below `root` (not `root` itself).
    /// Entries that cannot be read are skipped; a missing root yields nothing.
    virtual std::vector<WalkEntry> walk(const fs::path& root) = 0;
};

class LocalFileSystem : public FileSystem {
public:
    bool exists(const fs::path& path) override;
    std::error_code remove_dir_all(const fs::path& path) override;
    std::error_code remove_file(const fs::path& path) override;
    std::error_code copy_file(const fs::path& from, const fs::path& to) override;
    std::vector<WalkEntry> walk(const fs::path& root) override;
};

} // namespace just::ext

#endif // JUST_EXT_FILESYSTEM_HPP
