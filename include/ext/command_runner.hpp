//! # External Process Capability
//!
//! The install pipeline shells out to `git` and `cargo` through
//! `CommandRunner`, which tests replace with a recording fake.
//!
//! `ProcessCommandRunner` starts the program directly (no shell), inherits
//! stdio and the working directory, and blocks until the child exits. There
//! is no timeout. On Windows the arguments travel as one command line built
//! by `windows_command_line()`.

#ifndef JUST_EXT_COMMAND_RUNNER_HPP
#define JUST_EXT_COMMAND_RUNNER_HPP

#include "common.hpp"

#include <string>
#include <vector>

namespace just::ext {

/// The program could not be started, or did not exit normally.
struct ProcessError {
    std::string program;
    std::string message;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Runs `program` with `args` and returns its exit status.
    virtual Result<int, ProcessError> run(const std::string& program,
                                          const std::vector<std::string>& args) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    Result<int, ProcessError> run(const std::string& program,
                                  const std::vector<std::string>& args) override;
};

/// Renders a command line for log messages ("git clone <url> <dir>").
std::string format_command(const std::string& program, const std::vector<std::string>& args);

/// Joins program and arguments into a CreateProcess command line that the
/// Microsoft C runtime splits back into the same argv. Arguments with spaces,
/// tabs or quotes are quoted and backslashes before a quote are escaped.
std::string windows_command_line(const std::string& program,
                                 const std::vector<std::string>& args);

} // namespace just::ext

#endif // JUST_EXT_COMMAND_RUNNER_HPP
