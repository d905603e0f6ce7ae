//! # Test Doubles
//!
//! In-memory FileSystem and scripted CommandRunner used by the extension
//! manager and CLI tests. Both record every call so tests can assert on the
//! exact sequence of side effects.

#pragma once

#include "ext/command_runner.hpp"
#include "ext/filesystem.hpp"

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace just::testing {

namespace fs = std::filesystem;

class FakeFileSystem : public ext::FileSystem {
public:
    std::set<fs::path> files;
    std::set<fs::path> dirs;
    std::vector<std::string> calls;

    std::error_code remove_dir_error;
    std::error_code remove_file_error;
    std::error_code copy_error;

    void add_dir(const fs::path& path) {
        for (fs::path p = path; !p.empty() && p != p.root_path(); p = p.parent_path()) {
            dirs.insert(p);
        }
    }

    void add_file(const fs::path& path) {
        add_dir(path.parent_path());
        files.insert(path);
    }

    bool exists(const fs::path& path) override {
        return files.count(path) > 0 || dirs.count(path) > 0;
    }

    std::error_code remove_dir_all(const fs::path& path) override {
        calls.push_back("remove_dir_all " + path.generic_string());
        if (remove_dir_error) {
            return remove_dir_error;
        }
        erase_below(files, path);
        erase_below(dirs, path);
        dirs.erase(path);
        return {};
    }

    std::error_code remove_file(const fs::path& path) override {
        calls.push_back("remove_file " + path.generic_string());
        if (remove_file_error) {
            return remove_file_error;
        }
        if (files.erase(path) == 0) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return {};
    }

    std::error_code copy_file(const fs::path& from, const fs::path& to) override {
        calls.push_back("copy_file " + from.generic_string() + " " + to.generic_string());
        if (copy_error) {
            return copy_error;
        }
        if (files.count(from) == 0) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        files.insert(to);
        return {};
    }

    std::vector<ext::WalkEntry> walk(const fs::path& root) override {
        std::vector<ext::WalkEntry> entries;
        for (const auto& dir : dirs) {
            if (is_below(dir, root)) {
                entries.push_back({dir, dir.filename().string(), true});
            }
        }
        for (const auto& file : files) {
            if (is_below(file, root)) {
                entries.push_back({file, file.filename().string(), false});
            }
        }
        return entries;
    }

private:
    static bool is_below(const fs::path& path, const fs::path& root) {
        auto prefix = root.generic_string() + "/";
        return path.generic_string().starts_with(prefix);
    }

    static void erase_below(std::set<fs::path>& paths, const fs::path& root) {
        for (auto it = paths.begin(); it != paths.end();) {
            if (is_below(*it, root)) {
                it = paths.erase(it);
            } else {
                ++it;
            }
        }
    }
};

class FakeCommandRunner : public ext::CommandRunner {
public:
    struct Call {
        std::string program;
        std::vector<std::string> args;
    };

    using Handler = std::function<Result<int, ext::ProcessError>(const Call&)>;

    std::vector<Call> calls;
    Handler handler;

    Result<int, ext::ProcessError> run(const std::string& program,
                                       const std::vector<std::string>& args) override {
        calls.push_back({program, args});
        if (handler) {
            return handler(calls.back());
        }
        return 0;
    }
};

} // namespace just::testing
