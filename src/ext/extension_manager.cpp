#include "ext/extension_manager.hpp"

#include "ext/name_resolver.hpp"
#include "log/log.hpp"

#include <utility>

namespace just::ext {

ExtensionManager::ExtensionManager(const Folder& folder, FileSystem& files, CommandRunner& runner,
                                   InstallOptions options)
    : folder_(folder), files_(files), runner_(runner), options_(std::move(options)) {}

// ============================================================================
// Lookup
// ============================================================================

fs::path ExtensionManager::resolve_path(std::string_view name) const {
    return folder_.bin_path / platform_executable_name(canonicalize(name));
}

std::optional<fs::path> ExtensionManager::locate(std::string_view name) const {
    auto path = resolve_path(name);
    if (files_.exists(path)) {
        return path;
    }
    return std::nullopt;
}

bool ExtensionManager::is_installed(std::string_view name) const {
    return locate(name).has_value();
}

std::vector<std::string> ExtensionManager::list() const {
    std::vector<std::string> names;
    for (const auto& entry : files_.walk(folder_.bin_path)) {
        if (!entry.is_directory && is_extension_file_name(entry.file_name)) {
            names.push_back(entry.file_name);
        }
    }
    return names;
}

// ============================================================================
// Install / Uninstall
// ============================================================================

ExtResult<fs::path> ExtensionManager::working_directory(const std::string& repo) const {
    if (!options_.work_dir.empty()) {
        return options_.work_dir / repo;
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return make_error(ErrorKind::IoError,
                          "Cannot determine the current directory: " + ec.message());
    }
    return cwd / repo;
}

std::optional<ExtensionError> ExtensionManager::run_step(ErrorKind kind,
                                                         const std::string& program,
                                                         const std::vector<std::string>& args) {
    auto result = runner_.run(program, args);
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        return make_error(kind, "Cannot run '" + format_command(program, args) + "': " +
                                    err.message);
    }
    int status = unwrap(result);
    if (status != 0) {
        return make_error(kind, "'" + format_command(program, args) + "' exited with status " +
                                    std::to_string(status));
    }
    return std::nullopt;
}

ExtResult<fs::path> ExtensionManager::install(std::string_view url) {
    auto repo_result = parse_repository_name(url);
    if (is_err(repo_result)) {
        return unwrap_err(repo_result);
    }
    const std::string& repo = unwrap(repo_result);

    auto dir_result = working_directory(repo);
    if (is_err(dir_result)) {
        return unwrap_err(dir_result);
    }
    const fs::path& repo_path = unwrap(dir_result);

    if (files_.exists(repo_path)) {
        JUST_LOG_DEBUG("install", "Remove existing " << repo_path.string());
        if (auto ec = files_.remove_dir_all(repo_path)) {
            return make_error(ErrorKind::IoError,
                              "Cannot remove " + repo_path.string() + ": " + ec.message());
        }
    }

    JUST_LOG_INFO("install", "Clone " << url << " into " << repo_path.string());
    if (auto error = run_step(ErrorKind::FetchFailed, options_.git,
                              {"clone", std::string(url), repo_path.string()})) {
        return *error;
    }

    auto manifest = repo_path / "Cargo.toml";
    JUST_LOG_INFO("install", "Build " << manifest.string() << " with " << options_.cargo);
    if (auto error = run_step(ErrorKind::BuildFailed, options_.cargo,
                              {"build", "--release", "--manifest-path", manifest.string()})) {
        JUST_LOG_WARN("install", "Build failed, leaving " << repo_path.string()
                                                          << " for inspection");
        return *error;
    }

    auto built = repo_path / "target" / "release" / platform_executable_name(repo);
    auto target = resolve_path(repo);
    JUST_LOG_DEBUG("install", "Copy " << built.string() << " into " << target.string());
    if (auto ec = files_.copy_file(built, target)) {
        return make_error(ErrorKind::IoError, "Cannot copy " + built.string() + " to " +
                                                  target.string() + ": " + ec.message());
    }

    if (auto ec = files_.remove_dir_all(repo_path)) {
        return make_error(ErrorKind::IoError, "Installed " + target.string() +
                                                  " but cannot remove " + repo_path.string() +
                                                  ": " + ec.message());
    }

    JUST_LOG_INFO("install", "Installed " << target.filename().string());
    return target;
}

ExtResult<bool> ExtensionManager::uninstall(std::string_view name) {
    auto path = locate(name);
    if (!path) {
        JUST_LOG_DEBUG("ext", "Nothing to uninstall for " << name);
        return false;
    }

    if (auto ec = files_.remove_file(*path)) {
        return make_error(ErrorKind::IoError,
                          "Cannot remove " + path->string() + ": " + ec.message());
    }
    JUST_LOG_INFO("ext", "Removed " << path->string());
    return true;
}

} // namespace just::ext
