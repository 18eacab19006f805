#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/config/host_config.hpp"
#include "core/errors/toolhub_errors.hpp"

namespace toolhub::process {

struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // merged over the inherited environment
};

// The command that will actually run after PATH lookup and fallbacks.
struct ResolvedLaunch {
    std::string executable;  // absolute path
    std::vector<std::string> args;
    std::string note;  // non-empty when a fallback replaced the command
};

// Searches PATH (or takes `command` as-is when it contains a slash).
std::optional<std::string> find_executable(const std::string& command);

// Applies the fallback table when the command is not on PATH. A command that
// cannot be resolved either way is a Launch error.
core::errors::Result<ResolvedLaunch> resolve_launch(
    const LaunchSpec& spec, const std::vector<core::config::CommandFallback>& fallbacks);

// A spawned provider: its own session/process group and three piped streams.
// The destructor kills and reaps a child that is still around.
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(
        const ResolvedLaunch& launch, const std::map<std::string, std::string>& env);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking; reaps the child the first time it is seen exited.
    bool is_running();

    std::optional<int> exit_code() const { return exit_code_; }

    // Signals the whole process group. False once the group is gone.
    bool terminate();
    bool kill();

    // True when the child exited within `timeout`.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    // Pipe ends are handed over once, to the transport that will own them.
    int release_stdin();
    int release_stdout();
    int release_stderr();

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool signal_group(int signal_number);
    void close_fds();

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    bool reaped_ = false;
    std::optional<int> exit_code_;
};

}  // namespace toolhub::process
