#include "ext/filesystem.hpp"

#include "log/log.hpp"

namespace just::ext {

bool LocalFileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::error_code LocalFileSystem::remove_dir_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return ec;
}

std::error_code LocalFileSystem::remove_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::remove(path, ec) && !ec) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return ec;
}

std::error_code LocalFileSystem::copy_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    return ec;
}

/// Appends the entries below `dir`. A directory that cannot be opened or
/// read to the end is logged and skipped; its siblings are still visited.
static void walk_directory(const fs::path& dir, std::vector<WalkEntry>& entries) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        JUST_LOG_DEBUG("ext", "Skipping " << dir.string() << ": " << ec.message());
        return;
    }

    std::vector<fs::path> subdirs;
    for (const fs::directory_iterator end{}; it != end;) {
        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec) && !type_ec;
        entries.push_back({it->path(), it->path().filename().string(), is_dir});
        // Symlinked directories are listed but not entered.
        if (is_dir && !it->is_symlink(type_ec)) {
            subdirs.push_back(it->path());
        }

        it.increment(ec);
        if (ec) {
            JUST_LOG_DEBUG("ext", "Stopped reading " << dir.string() << ": " << ec.message());
            break;
        }
    }

    for (const auto& subdir : subdirs) {
        walk_directory(subdir, entries);
    }
}

std::vector<WalkEntry> LocalFileSystem::walk(const fs::path& root) {
    std::vector<WalkEntry> entries;
    walk_directory(root, entries);
    return entries;
}

} // namespace just::ext
