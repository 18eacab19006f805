#include "transport/stdio_transport.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_rpc.hpp"

namespace toolhub::transport {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using protocol::LogStream;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Appends whatever is readable; marks the stream closed on EOF or error.
void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        return;
    }
}

// Moves every complete line out of `pending`.
template <typename Fn>
void take_lines(std::string& pending, Fn&& on_line) {
    std::size_t start = 0;
    while (true) {
        const auto newline = pending.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        on_line(pending.substr(start, newline - start));
        start = newline + 1;
    }
    pending.erase(0, start);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

}  // namespace

StdioTransport::StdioTransport(const int stdin_fd, const int stdout_fd, const int stderr_fd,
                               RequestTimeouts timeouts, LineSink sink)
    : Transport(timeouts),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      sink_(std::move(sink)) {
    // A provider that exits mid-write must surface as EPIPE, not kill us.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });

    set_nonblocking(stdout_fd_);
    if (stderr_fd_ >= 0) {
        set_nonblocking(stderr_fd_);
    }
    reader_ = std::thread(&StdioTransport::reader_loop, this);
}

StdioTransport::~StdioTransport() {
    close();
}

bool StdioTransport::is_connected() const {
    return connected_.load();
}

void StdioTransport::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    connected_ = false;
    stop_ = true;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        close_fd(stdin_fd_);
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    correlator_.close(ToolhubError{ErrorCategory::Transport, "stdio transport closed",
                                   "transport_closed"});
}

// Blocking write; the correlator enforces the reply deadline.
core::errors::Result<std::optional<nlohmann::json>> StdioTransport::send_message(
    const nlohmann::json& message, std::chrono::milliseconds /*timeout*/) {
    const std::string frame = message.dump() + "\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        return ToolhubError{ErrorCategory::Transport, "Provider stdin is closed",
                            "transport_closed"};
    }

    std::size_t written = 0;
    while (written < frame.size()) {
        const ssize_t n = write(stdin_fd_, frame.data() + written, frame.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const std::string reason = n < 0 ? std::strerror(errno) : "short write";
        return ToolhubError{ErrorCategory::Transport,
                            "Failed to write to provider stdin: " + reason,
                            "stdin_write_failed"};
    }
    return std::optional<nlohmann::json>{};
}

void StdioTransport::handle_line(const LogStream stream, std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) {
        return;
    }
    if (sink_) {
        sink_(stream, line);
    }
    if (stream == LogStream::Err) {
        return;
    }

    auto parsed = protocol::json_rpc::parse_frame(line);
    if (core::errors::is_error(parsed)) {
        LOG_DEBUG("stdio: non-protocol output: " + line);
        return;
    }
    dispatch_incoming(core::errors::get_value(parsed));
}

void StdioTransport::reader_loop() {
    bool stdout_open = stdout_fd_ >= 0;
    bool stderr_open = stderr_fd_ >= 0;
    std::string stdout_pending;
    std::string stderr_pending;

    while (!stop_.load() && (stdout_open || stderr_open)) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_fd_;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, 50));

        const bool stdout_was_open = stdout_open;
        drain_pipe(stdout_fd_, stdout_open, stdout_pending);
        drain_pipe(stderr_fd_, stderr_open, stderr_pending);

        take_lines(stdout_pending,
                   [this](std::string line) { handle_line(LogStream::Out, std::move(line)); });
        take_lines(stderr_pending,
                   [this](std::string line) { handle_line(LogStream::Err, std::move(line)); });

        if (stdout_was_open && !stdout_open) {
            handle_line(LogStream::Out, std::move(stdout_pending));
            stdout_pending.clear();
            connected_ = false;
            LOG_DEBUG("stdio: provider closed stdout");
            correlator_.close(ToolhubError{ErrorCategory::Transport,
                                           "Provider closed its output stream",
                                           "transport_closed"});
        }
    }

    if (!stderr_pending.empty()) {
        handle_line(LogStream::Err, std::move(stderr_pending));
    }
}

}  // namespace toolhub::transport
