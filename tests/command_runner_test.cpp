// ProcessCommandRunner Tests
// Spawns small POSIX utilities; skipped on Windows.

#include "ext/command_runner.hpp"

#include <gtest/gtest.h>

using namespace just;
using namespace just::ext;

TEST(FormatCommandTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(format_command("git", {"clone", "https://github.com/o/r", "/tmp/r"}),
              "git clone https://github.com/o/r /tmp/r");
    EXPECT_EQ(format_command("cargo", {"build", "--manifest-path", "/my dir/Cargo.toml"}),
              "cargo build --manifest-path \"/my dir/Cargo.toml\"");
    EXPECT_EQ(format_command("tool", {""}), "tool \"\"");
}

TEST(WindowsCommandLineTest, QuotesPathsWithSpaces) {
    EXPECT_EQ(windows_command_line("cargo", {"build", "--release", "--manifest-path",
                                             "C:\\My Work\\tool\\Cargo.toml"}),
              "cargo build --release --manifest-path \"C:\\My Work\\tool\\Cargo.toml\"");
    EXPECT_EQ(windows_command_line("git", {"clone", "https://github.com/o/r", "C:\\work\\r"}),
              "git clone https://github.com/o/r C:\\work\\r");
}

TEST(WindowsCommandLineTest, EscapesQuotesAndTrailingBackslashes) {
    EXPECT_EQ(windows_command_line("tool", {""}), "tool \"\"");
    EXPECT_EQ(windows_command_line("tool", {"say \"hi\""}), "tool \"say \\\"hi\\\"\"");
    EXPECT_EQ(windows_command_line("tool", {"C:\\dir with space\\"}),
              "tool \"C:\\dir with space\\\\\"");
    EXPECT_EQ(windows_command_line("tool", {"a\\\"b"}), "tool \"a\\\\\\\"b\"");
    EXPECT_EQ(windows_command_line("C:\\Program Files\\Git\\git.exe", {}),
              "\"C:\\Program Files\\Git\\git.exe\"");
}

#ifndef _WIN32

class ProcessCommandRunnerTest : public ::testing::Test {
protected:
    ProcessCommandRunner runner;
};

TEST_F(ProcessCommandRunnerTest, ReturnsZeroOnSuccess) {
    auto result = runner.run("true", {});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), 0);
}

TEST_F(ProcessCommandRunnerTest, ReturnsExitStatus) {
    auto result = runner.run("sh", {"-c", "exit 3"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), 3);
}

TEST_F(ProcessCommandRunnerTest, PassesArgumentsVerbatim) {
    // No shell in between: the quote and the space reach the child unchanged.
    auto result = runner.run("sh", {"-c", "test \"$1\" = \"a 'b\"", "sh", "a 'b"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), 0);
}

TEST_F(ProcessCommandRunnerTest, MissingProgramIsAnError) {
    auto result = runner.run("just-ext-no-such-program", {"x"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).program, "just-ext-no-such-program");
    EXPECT_FALSE(unwrap_err(result).message.empty());
}

TEST_F(ProcessCommandRunnerTest, SignalIsAnError) {
    auto result = runner.run("sh", {"-c", "kill -9 $$"});
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("signal 9"), std::string::npos);
}

#endif
