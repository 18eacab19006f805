#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <gtest/gtest.h>
#include "core/config/host_config.hpp"
#include "process/child_process.hpp"

namespace {

using toolhub::core::config::CommandFallback;
using toolhub::core::errors::ErrorCategory;
using toolhub::core::errors::get_error;
using toolhub::core::errors::get_value;
using toolhub::core::errors::is_error;
using toolhub::process::ChildProcess;
using toolhub::process::find_executable;
using toolhub::process::LaunchSpec;
using toolhub::process::resolve_launch;
using toolhub::process::ResolvedLaunch;
using namespace std::chrono_literals;

std::string read_all(const int fd) {
    std::string out;
    char buffer[256];
    ssize_t n = 0;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<std::size_t>(n));
    }
    close(fd);
    return out;
}

ResolvedLaunch shell(const std::string& script) {
    auto sh = find_executable("sh");
    return ResolvedLaunch{sh.value_or("/bin/sh"), {"-c", script}, ""};
}

TEST(ChildProcessTest, FindsExecutablesOnPath) {
    EXPECT_TRUE(find_executable("sh").has_value());
    EXPECT_FALSE(find_executable("toolhub-definitely-not-installed").has_value());
    EXPECT_FALSE(find_executable("").has_value());
}

TEST(ChildProcessTest, MissingCommandIsLaunchError) {
    auto resolved = resolve_launch(LaunchSpec{"toolhub-definitely-not-installed", {}, {}}, {});
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).category, ErrorCategory::Launch);
    EXPECT_EQ(get_error(resolved).code, "executable_not_found");

    auto empty = resolve_launch(LaunchSpec{}, {});
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "missing_command");
}

TEST(ChildProcessTest, FallbackRewritesLeadingRun) {
    const std::vector<CommandFallback> fallbacks = {
        {"toolhub-missing-uv", "sh", CommandFallback::ArgRewrite::ReplaceLeadingRun}};
    auto resolved =
        resolve_launch(LaunchSpec{"toolhub-missing-uv", {"run", "server-pkg"}, {}}, fallbacks);
    ASSERT_FALSE(is_error(resolved));
    const auto& launch = get_value(resolved);
    EXPECT_EQ(launch.executable, *find_executable("sh"));
    ASSERT_EQ(launch.args.size(), 2u);
    EXPECT_EQ(launch.args[0], "-y");
    EXPECT_EQ(launch.args[1], "server-pkg");
    EXPECT_FALSE(launch.note.empty());
}

TEST(ChildProcessTest, FallbackPrependsYes) {
    const std::vector<CommandFallback> fallbacks = {
        {"toolhub-missing-uvx", "sh", CommandFallback::ArgRewrite::PrependYes}};
    auto resolved =
        resolve_launch(LaunchSpec{"toolhub-missing-uvx", {"server-pkg"}, {}}, fallbacks);
    ASSERT_FALSE(is_error(resolved));
    const auto& args = get_value(resolved).args;
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "-y");
    EXPECT_EQ(args[1], "server-pkg");
}

TEST(ChildProcessTest, CapturesOutputAndExitCode) {
    auto spawned = ChildProcess::spawn(shell("echo hello; echo oops 1>&2; exit 3"), {});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);
    EXPECT_GT(child->pid(), 0);

    EXPECT_EQ(read_all(child->release_stdout()), "hello\n");
    EXPECT_EQ(read_all(child->release_stderr()), "oops\n");
    ASSERT_TRUE(child->wait_for_exit(2000ms));
    EXPECT_EQ(child->exit_code().value_or(-1), 3);
    EXPECT_FALSE(child->is_running());
}

TEST(ChildProcessTest, MergesEnvironmentOverrides) {
    auto spawned =
        ChildProcess::spawn(shell("printf '%s' \"$TOOLHUB_CHILD_VALUE\""),
                            {{"TOOLHUB_CHILD_VALUE", "from-definition"}});
    ASSERT_FALSE(is_error(spawned));
    EXPECT_EQ(read_all(get_value(spawned)->release_stdout()), "from-definition");
}

TEST(ChildProcessTest, TerminateStopsCooperativeChild) {
    auto spawned = ChildProcess::spawn(shell("sleep 30"), {});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);
    EXPECT_TRUE(child->is_running());

    EXPECT_TRUE(child->terminate());
    ASSERT_TRUE(child->wait_for_exit(2000ms));
    EXPECT_FALSE(child->is_running());
}

// TERM is ignored by the shell and the sleep it execs, so only KILL works.
TEST(ChildProcessTest, KillStopsChildIgnoringTerm) {
    auto spawned = ChildProcess::spawn(shell("trap '' TERM; sleep 30"), {});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);
    std::this_thread::sleep_for(100ms);

    EXPECT_TRUE(child->terminate());
    EXPECT_FALSE(child->wait_for_exit(300ms));

    EXPECT_TRUE(child->kill());
    ASSERT_TRUE(child->wait_for_exit(2000ms));
    EXPECT_EQ(child->exit_code().value_or(-1), 128 + 9);
    EXPECT_FALSE(child->terminate());
}

TEST(ChildProcessTest, ExecFailureIsReported) {
    auto spawned = ChildProcess::spawn(ResolvedLaunch{"/nonexistent/toolhub-binary", {}, ""}, {});
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).category, ErrorCategory::Launch);
    EXPECT_EQ(get_error(spawned).code, "exec_failed");
}

}  // namespace
