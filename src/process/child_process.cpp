#include "process/child_process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

extern char** environ;

namespace toolhub::process {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;

namespace {

bool is_executable_file(const std::string& path) {
    struct stat info {};
    if (stat(path.c_str(), &info) != 0) {
        return false;
    }
    return S_ISREG(info.st_mode) && access(path.c_str(), X_OK) == 0;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[text.substr(0, eq)] = text.substr(eq + 1);
    }
    for (const auto& item : overrides) {
        merged[item.first] = item.second;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& item : merged) {
        out.push_back(item.first + "=" + item.second);
    }
    return out;
}

std::vector<char*> to_argv(std::vector<std::string>& items) {
    std::vector<char*> argv;
    argv.reserve(items.size() + 1);
    for (auto& item : items) {
        argv.push_back(item.data());
    }
    argv.push_back(nullptr);
    return argv;
}

std::vector<std::string> rewrite_args(const std::vector<std::string>& args,
                                      const core::config::CommandFallback::ArgRewrite rewrite) {
    std::vector<std::string> out = args;
    if (rewrite == core::config::CommandFallback::ArgRewrite::ReplaceLeadingRun) {
        if (!out.empty() && out.front() == "run") {
            out.front() = "-y";
        } else {
            out.insert(out.begin(), "-y");
        }
        return out;
    }
    out.insert(out.begin(), "-y");
    return out;
}

std::string join(const std::string& command, const std::vector<std::string>& args) {
    std::string text = command;
    for (const auto& arg : args) {
        text += " " + arg;
    }
    return text;
}

}  // namespace

std::optional<std::string> find_executable(const std::string& command) {
    if (command.empty()) {
        return std::nullopt;
    }
    if (command.find('/') != std::string::npos) {
        if (is_executable_file(command)) {
            return command;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string search = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= search.size()) {
        const auto colon = search.find(':', start);
        std::string dir = search.substr(
            start, colon == std::string::npos ? std::string::npos : colon - start);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + command;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return std::nullopt;
}

core::errors::Result<ResolvedLaunch> resolve_launch(
    const LaunchSpec& spec, const std::vector<core::config::CommandFallback>& fallbacks) {
    if (spec.command.empty()) {
        return ToolhubError{ErrorCategory::Configuration, "Provider has no command to launch",
                            "missing_command"};
    }

    if (const auto found = find_executable(spec.command)) {
        return ResolvedLaunch{*found, spec.args, ""};
    }

    for (const auto& fallback : fallbacks) {
        if (fallback.primary != spec.command) {
            continue;
        }
        const auto replacement = find_executable(fallback.replacement);
        if (!replacement) {
            break;
        }
        ResolvedLaunch launch;
        launch.executable = *replacement;
        launch.args = rewrite_args(spec.args, fallback.rewrite);
        launch.note = "'" + spec.command + "' not found on PATH, running '" +
                      join(fallback.replacement, launch.args) + "' instead";
        LOG_WARN(launch.note);
        return launch;
    }

    return ToolhubError{ErrorCategory::Launch,
                        "Executable not found on PATH: " + spec.command,
                        "executable_not_found",
                        "Install '" + spec.command + "' or give an absolute command path."};
}

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const ResolvedLaunch& launch, const std::map<std::string, std::string>& env) {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ToolhubError{ErrorCategory::Launch, "Failed to create process pipes: " + reason,
                            "pipe_creation_failed"};
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_items;
    argv_items.push_back(launch.executable);
    argv_items.insert(argv_items.end(), launch.args.begin(), launch.args.end());
    std::vector<std::string> env_items = merged_environment(env);
    std::vector<char*> argv = to_argv(argv_items);
    std::vector<char*> envp = to_argv(env_items);

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ToolhubError{ErrorCategory::Launch, "Failed to fork process: " + reason,
                            "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setsid());
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execve(launch.executable.c_str(), argv.data(), envp.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe closes on a successful exec; anything read is errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    std::unique_ptr<ChildProcess> child(
        new ChildProcess(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        static_cast<void>(child->wait_for_exit(std::chrono::milliseconds(1000)));
        return ToolhubError{ErrorCategory::Launch,
                            "Failed to execute " + launch.executable + ": " +
                                std::strerror(exec_errno),
                            "exec_failed"};
    }

    LOG_DEBUG("spawned " + launch.executable + " as pid " + std::to_string(pid));
    return child;
}

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd, const int stdout_fd,
                           const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    if (!reaped_ && is_running()) {
        static_cast<void>(signal_group(SIGKILL));
    }
    if (!reaped_) {
        int status = 0;
        pid_t waited = 0;
        do {
            waited = waitpid(pid_, &status, 0);
        } while (waited < 0 && errno == EINTR);
        reaped_ = true;
    }
    close_fds();
}

bool ChildProcess::is_running() {
    if (reaped_) {
        return false;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == 0) {
        return true;
    }
    if (waited == pid_) {
        exit_code_ = decode_status(status);
    }
    // ECHILD: someone else reaped it; either way it is gone.
    reaped_ = true;
    return false;
}

bool ChildProcess::signal_group(const int signal_number) {
    if (::kill(-pid_, signal_number) == 0) {
        return true;
    }
    // Before setsid() runs in the child the group does not exist yet.
    return ::kill(pid_, signal_number) == 0;
}

bool ChildProcess::terminate() {
    if (!is_running()) {
        return false;
    }
    return signal_group(SIGTERM);
}

bool ChildProcess::kill() {
    if (!is_running()) {
        return false;
    }
    return signal_group(SIGKILL);
}

bool ChildProcess::wait_for_exit(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

int ChildProcess::release_stdin() {
    const int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::release_stdout() {
    const int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ChildProcess::release_stderr() {
    const int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

void ChildProcess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

}  // namespace toolhub::process
