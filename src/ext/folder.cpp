#include "ext/folder.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace just::ext {

static std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

fs::path home_dir() {
#ifdef _WIN32
    auto profile = env_or_empty("USERPROFILE");
    if (!profile.empty()) {
        return fs::path(profile);
    }
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
        return fs::path(path);
    }
    return {};
#else
    auto home = env_or_empty("HOME");
    if (!home.empty()) {
        return fs::path(home);
    }
    struct passwd* pw = getpwuid(getuid());
    return pw && pw->pw_dir ? fs::path(pw->pw_dir) : fs::path();
#endif
}

Folder Folder::at(const fs::path& root) {
    return Folder{root, root / "bin"};
}

ExtResult<Folder> Folder::from_env() {
    fs::path root;
    auto just_home = env_or_empty("JUST_HOME");
    if (!just_home.empty()) {
        root = fs::path(just_home);
    } else {
        auto home = home_dir();
        if (home.empty()) {
            return make_error(ErrorKind::IoError,
                              "Cannot determine the home directory; set JUST_HOME");
        }
        root = home / ".just";
    }

    Folder folder = Folder::at(root);

    std::error_code ec;
    fs::create_directories(folder.bin_path, ec);
    if (ec) {
        return make_error(ErrorKind::IoError, "Cannot create " + folder.bin_path.string() + ": " +
                                                  ec.message());
    }

    JUST_LOG_DEBUG("folder", "Extension binaries live in " << folder.bin_path.string());
    return folder;
}

} // namespace just::ext
