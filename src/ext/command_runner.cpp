//! # Process Runner
//!
//! POSIX: fork + execvp + waitpid. A close-on-exec pipe carries the errno of
//! a failed execvp back to the parent, so "program not found" is reported as
//! a ProcessError instead of being confused with an exit status of 127.
//!
//! Windows: CreateProcessA + WaitForSingleObject + GetExitCodeProcess.

#include "ext/command_runner.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace just::ext {

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::string cmd = program;
    for (const auto& arg : args) {
        cmd += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            cmd += '"' + arg + '"';
        } else {
            cmd += arg;
        }
    }
    return cmd;
}

static void append_windows_arg(std::string& cmd, const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        cmd += arg;
        return;
    }

    cmd += '"';
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            cmd.append(backslashes * 2 + 1, '\\');
        } else {
            cmd.append(backslashes, '\\');
        }
        backslashes = 0;
        cmd += c;
    }
    // The closing quote must not be escaped by trailing backslashes.
    cmd.append(backslashes * 2, '\\');
    cmd += '"';
}

std::string windows_command_line(const std::string& program,
                                 const std::vector<std::string>& args) {
    std::string cmd;
    append_windows_arg(cmd, program);
    for (const auto& arg : args) {
        cmd += ' ';
        append_windows_arg(cmd, arg);
    }
    return cmd;
}

#ifdef _WIN32

static std::string last_error_message(const char* what) {
    return std::string(what) + " failed with error " + std::to_string(GetLastError());
}

Result<int, ProcessError> ProcessCommandRunner::run(const std::string& program,
                                                    const std::vector<std::string>& args) {
    JUST_LOG_DEBUG("process", "Run " << format_command(program, args));

    std::string cmd = windows_command_line(program, args);
    std::vector<char> cmd_buf(cmd.begin(), cmd.end());
    cmd_buf.push_back('\0');

    STARTUPINFOA si = {};
    si.cb = sizeof(STARTUPINFOA);
    PROCESS_INFORMATION pi = {};
    if (!CreateProcessA(NULL, cmd_buf.data(), NULL, NULL, TRUE, 0, NULL, NULL, &si, &pi)) {
        return ProcessError{program, last_error_message("CreateProcess")};
    }
    CloseHandle(pi.hThread);

    if (WaitForSingleObject(pi.hProcess, INFINITE) != WAIT_OBJECT_0) {
        auto message = last_error_message("WaitForSingleObject");
        CloseHandle(pi.hProcess);
        return ProcessError{program, message};
    }

    DWORD exit_code = 0;
    BOOL got_code = GetExitCodeProcess(pi.hProcess, &exit_code);
    auto message = got_code ? std::string() : last_error_message("GetExitCodeProcess");
    CloseHandle(pi.hProcess);
    if (!got_code) {
        return ProcessError{program, message};
    }
    return static_cast<int>(exit_code);
}

#else

Result<int, ProcessError> ProcessCommandRunner::run(const std::string& program,
                                                    const std::vector<std::string>& args) {
    JUST_LOG_DEBUG("process", "Run " << format_command(program, args));

    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        return ProcessError{program, std::string("pipe: ") + std::strerror(errno)};
    }
    fcntl(exec_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return ProcessError{program, std::string("fork: ") + std::strerror(err)};
    }

    if (pid == 0) {
        // Child process
        close(exec_pipe[0]);
        execvp(program.c_str(), argv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(exec_pipe[1]);
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        return ProcessError{program, std::string("waitpid: ") + std::strerror(errno)};
    }
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return ProcessError{program, std::strerror(exec_errno)};
    }
    if (WIFSIGNALED(status)) {
        return ProcessError{program, "terminated by signal " + std::to_string(WTERMSIG(status))};
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    JUST_LOG_TRACE("process", program << " exited with " << exit_code);
    return exit_code;
}

#endif

} // namespace just::ext
