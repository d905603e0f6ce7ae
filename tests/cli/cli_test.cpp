// CLI Tests
// Argument splitting and the extension command handlers.

#include "commands/cmd_ext.hpp"
#include "ext/name_resolver.hpp"
#include "fakes.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace just;
using namespace just::cli;
using just::testing::FakeCommandRunner;
using just::testing::FakeFileSystem;

namespace {

CliArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(word.data());
    }
    argv.push_back(nullptr);
    return parse_cli_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

// ============================================================================
// parse_cli_args
// ============================================================================

TEST(ParseCliArgsTest, DropsLoggingFlags) {
    auto args = parse({"just-ext", "-vv", "install", "--log-format=json", "https://github.com/o/r"});
    EXPECT_EQ(args.positional, (std::vector<std::string>{"install", "https://github.com/o/r"}));
    EXPECT_TRUE(args.passthrough.empty());
    EXPECT_EQ(args.log_argc, 5);
}

TEST(ParseCliArgsTest, RunForwardsEverythingAfterTheName) {
    auto args = parse({"just-ext", "-q", "run", "fmt", "-v", "--check", "src"});
    EXPECT_EQ(args.positional, (std::vector<std::string>{"run", "fmt"}));
    EXPECT_EQ(args.passthrough, (std::vector<std::string>{"-v", "--check", "src"}));
    EXPECT_EQ(args.log_argc, 4);
}

TEST(ParseCliArgsTest, NoArguments) {
    auto args = parse({"just-ext"});
    EXPECT_TRUE(args.positional.empty());
    EXPECT_EQ(args.log_argc, 1);
}

// ============================================================================
// Command Handlers
// ============================================================================

class CliCommandTest : public ::testing::Test {
protected:
    CliCommandTest()
        : folder(ext::Folder::at(ext::fs::path("/home/user/.just"))),
          manager(folder, files, runner) {}

    ext::Folder folder;
    FakeFileSystem files;
    FakeCommandRunner runner;
    ext::ExtensionManager manager;
};

TEST_F(CliCommandTest, ListIsSorted) {
    files.add_file(manager.resolve_path("zeta"));
    files.add_file(manager.resolve_path("alpha"));
    files.add_file(folder.bin_path / "readme");

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_list(manager), 0);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, ext::platform_executable_name("just-alpha") + "\n" +
                       ext::platform_executable_name("just-zeta") + "\n");
}

TEST_F(CliCommandTest, WhichPrintsPath) {
    files.add_file(manager.resolve_path("fmt"));

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_which(manager, "fmt"), 0);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), manager.resolve_path("fmt").string() + "\n");
}

TEST_F(CliCommandTest, WhichMissingFails) {
    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_which(manager, "fmt"), 1);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

TEST_F(CliCommandTest, UninstallReportsOutcome) {
    files.add_file(manager.resolve_path("fmt"));

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_uninstall(manager, "fmt"), 0);
    EXPECT_EQ(run_uninstall(manager, "fmt"), 0);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(),
              "Uninstalled just-fmt\njust-fmt is not installed\n");
}

TEST_F(CliCommandTest, InstallFailureExitsWithOne) {
    EXPECT_EQ(run_install(manager, "https://gitlab.com/o/r"), 1);
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(CliCommandTest, RunForwardsArgumentsAndStatus) {
    files.add_file(manager.resolve_path("fmt"));
    runner.handler = [](const FakeCommandRunner::Call&) -> Result<int, ext::ProcessError> {
        return 7;
    };

    EXPECT_EQ(run_extension(manager, runner, "fmt", {"--check", "-v"}), 7);
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].program, manager.resolve_path("fmt").string());
    EXPECT_EQ(runner.calls[0].args, (std::vector<std::string>{"--check", "-v"}));
}

TEST_F(CliCommandTest, RunMissingExtensionFails) {
    EXPECT_EQ(run_extension(manager, runner, "fmt", {}), 1);
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(CliCommandTest, RunSpawnErrorFails) {
    files.add_file(manager.resolve_path("fmt"));
    runner.handler = [](const FakeCommandRunner::Call& call) -> Result<int, ext::ProcessError> {
        return ext::ProcessError{call.program, "Permission denied"};
    };

    EXPECT_EQ(run_extension(manager, runner, "fmt", {}), 1);
}
