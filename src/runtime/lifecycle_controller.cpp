#include "runtime/lifecycle_controller.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <utility>
#include "core/config/id_gen.hpp"
#include "core/logging/logger.hpp"
#include "transport/event_stream_transport.hpp"
#include "transport/http_client.hpp"
#include "transport/stdio_transport.hpp"

namespace toolhub::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using core::errors::Unit;
using protocol::LifecycleState;
using protocol::ProviderKind;

struct LifecycleController::RunningInstance {
    std::string provider_id;
    ProviderKind kind = ProviderKind::Process;
    std::unique_ptr<process::ChildProcess> child;
    std::unique_ptr<transport::Transport> transport;
    std::shared_ptr<session::LogRing> logs;
    std::optional<transport::http_client::Url> base_url;
    std::string url;
    std::chrono::system_clock::time_point started_at;
    std::chrono::steady_clock::time_point started_steady;
    protocol::ServerInfo server_info;

    // waitpid bookkeeping is not thread-safe; every child access goes here.
    std::mutex process_mutex;

    std::mutex state_mutex;
    LifecycleState state = LifecycleState::Stopped;

    std::thread monitor;
    std::mutex monitor_mutex;
    std::condition_variable monitor_cv;
    bool monitor_stop = false;

    ~RunningInstance() { stop_monitor(); }

    LifecycleState current() {
        std::lock_guard<std::mutex> lock(state_mutex);
        return state;
    }

    std::optional<pid_t> pid() const {
        if (!child) {
            return std::nullopt;
        }
        return child->pid();
    }

    void stop_monitor() {
        {
            std::lock_guard<std::mutex> lock(monitor_mutex);
            monitor_stop = true;
        }
        monitor_cv.notify_all();
        if (monitor.joinable() && monitor.get_id() != std::this_thread::get_id()) {
            monitor.join();
        }
    }
};

std::optional<std::uint16_t> find_port_arg(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string value;
        if (args[i] == "--port" && i + 1 < args.size()) {
            value = args[i + 1];
        } else if (args[i].rfind("--port=", 0) == 0) {
            value = args[i].substr(7);
        } else {
            continue;
        }

        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
        if (ec != std::errc() || ptr != value.data() + value.size() || port == 0 ||
            port > 65535) {
            LOG_WARN("ignoring invalid --port value '" + value + "'");
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(port);
    }
    return std::nullopt;
}

std::uint16_t extract_port(const std::vector<std::string>& args, const std::uint16_t fallback) {
    return find_port_arg(args).value_or(fallback);
}

LifecycleController::LifecycleController(session::ProviderRegistry& registry,
                                         core::config::HostConfig config)
    : registry_(registry), config_(std::move(config)) {
    registry_.set_in_use_check(
        [this](const std::string& provider_id) { return has_instance(provider_id); });
}

LifecycleController::~LifecycleController() {
    stop_all();
    registry_.set_in_use_check(nullptr);
}

transport::RequestTimeouts LifecycleController::request_timeouts() const {
    transport::RequestTimeouts timeouts;
    timeouts.handshake = std::chrono::milliseconds(config_.handshake_timeout_ms);
    timeouts.discovery = std::chrono::milliseconds(config_.discovery_timeout_ms);
    timeouts.tool_call = std::chrono::milliseconds(config_.tool_call_timeout_ms);
    timeouts.shutdown = std::chrono::milliseconds(config_.shutdown_timeout_ms);
    return timeouts;
}

std::shared_ptr<std::mutex> LifecycleController::operation_lock(const std::string& provider_id) {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    auto& slot = operation_locks_[provider_id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::shared_ptr<LifecycleController::RunningInstance> LifecycleController::find_instance(
    const std::string& provider_id) const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    const auto it = instances_.find(provider_id);
    if (it == instances_.end()) {
        return nullptr;
    }
    return it->second;
}

bool LifecycleController::has_instance(const std::string& provider_id) const {
    return find_instance(provider_id) != nullptr;
}

void LifecycleController::record_status(const std::string& provider_id,
                                        const LifecycleState state) {
    auto recorded = registry_.record_status(provider_id, protocol::to_string(state));
    if (core::errors::is_error(recorded)) {
        LOG_DEBUG("could not record status of " + provider_id + ": " +
                  core::errors::get_error(recorded).message);
    }
}

void LifecycleController::transition(RunningInstance& instance, const LifecycleState next) {
    LifecycleState prev;
    {
        std::lock_guard<std::mutex> lock(instance.state_mutex);
        prev = instance.state;
        if (prev == next) {
            return;
        }
        instance.state = next;
    }
    LOG_INFO("provider " + instance.provider_id + ": " + protocol::to_string(prev) + " -> " +
             protocol::to_string(next));
    record_status(instance.provider_id, next);
}

bool LifecycleController::process_alive(RunningInstance& instance) const {
    if (!instance.child) {
        return true;
    }
    std::lock_guard<std::mutex> lock(instance.process_mutex);
    return instance.child->is_running();
}

bool LifecycleController::probe(RunningInstance& instance) const {
    if (instance.kind == ProviderKind::Process) {
        if (!process_alive(instance) || !instance.transport ||
            !instance.transport->is_connected()) {
            return false;
        }
        // Stdio-only providers have nothing else to ask.
        if (!instance.base_url.has_value()) {
            return true;
        }
    } else if (!instance.base_url.has_value()) {
        return false;
    }
    auto response =
        transport::http_client::get(*instance.base_url, config_.health_path, {},
                                    std::chrono::milliseconds(config_.probe_request_timeout_ms));
    if (core::errors::is_error(response)) {
        LOG_DEBUG("probe of " + instance.provider_id + " failed: " +
                  core::errors::get_error(response).message);
        return false;
    }
    const int status = core::errors::get_value(response).status;
    return status >= 200 && status < 300;
}

core::errors::Result<Unit> LifecycleController::await_healthy(RunningInstance& instance) {
    const auto window = std::chrono::milliseconds(config_.probe_window_ms);
    const auto interval = std::chrono::milliseconds(config_.probe_interval_ms);
    const auto deadline = std::chrono::steady_clock::now() + window;

    while (true) {
        if (probe(instance)) {
            return Unit{};
        }
        if (!process_alive(instance)) {
            return ToolhubError{ErrorCategory::Launch,
                                "Provider " + instance.provider_id + " exited during startup",
                                "process_exited"};
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return ToolhubError{ErrorCategory::ProbeTimeout,
                                "Provider " + instance.provider_id +
                                    " did not become healthy within " +
                                    std::to_string(window.count()) + " ms",
                                "probe_timeout"};
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(interval, deadline - now));
    }
}

core::errors::Result<StartOutcome> LifecycleController::start(const std::string& provider_id) {
    auto op_lock = operation_lock(provider_id);
    std::lock_guard<std::mutex> op_guard(*op_lock);

    if (auto existing = find_instance(provider_id)) {
        const bool alive = existing->current() != LifecycleState::Stopped &&
                           process_alive(*existing) &&
                           (existing->kind == ProviderKind::Process || probe(*existing));
        if (alive) {
            StartOutcome outcome;
            outcome.provider_id = provider_id;
            outcome.already_running = true;
            outcome.pid = existing->pid();
            outcome.url = existing->url;
            outcome.server_info = existing->server_info;
            LOG_INFO("provider " + provider_id + " is already running");
            return outcome;
        }
        LOG_WARN("provider " + provider_id + " has a stale instance, restarting");
        teardown(existing, false);
        transition(*existing, LifecycleState::Stopped);
    }

    // Never cached: the definition may have been edited since the last start.
    auto definition = registry_.get(provider_id);
    if (core::errors::is_error(definition)) {
        return core::errors::get_error(definition);
    }
    return launch(core::errors::get_value(definition));
}

core::errors::Result<StartOutcome> LifecycleController::launch(
    const protocol::ProviderDefinition& definition) {
    const std::string& id = definition.id;
    auto instance = std::make_shared<RunningInstance>();
    instance->provider_id = id;
    instance->kind = definition.kind;
    instance->logs = std::make_shared<session::LogRing>(config_.log_capacity);
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        last_logs_[id] = instance->logs;
        last_failures_.erase(id);
    }
    transition(*instance, LifecycleState::Starting);

    transport::LineSink sink = [logs = instance->logs, id](const protocol::LogStream stream,
                                                           const std::string& line) {
        logs->append(stream, line);
        LOG_DEBUG("[" + id + "] [" + protocol::to_string(stream) + "] " + line);
    };

    auto fail = [this, &instance, &id](ToolhubError error) -> core::errors::Result<StartOutcome> {
        LOG_ERROR("provider " + id + " failed to start: " + error.message);
        teardown(instance, false);
        transition(*instance, LifecycleState::Error);
        {
            std::lock_guard<std::mutex> lock(instances_mutex_);
            last_failures_[id] = error.message;
        }
        return error;
    };

    StartOutcome outcome;
    outcome.provider_id = id;

    if (definition.kind == ProviderKind::Process) {
        auto resolved = process::resolve_launch(
            process::LaunchSpec{definition.command, definition.args, definition.env},
            config_.command_fallbacks);
        if (core::errors::is_error(resolved)) {
            return fail(core::errors::get_error(resolved));
        }
        const auto& launch = core::errors::get_value(resolved);
        outcome.launch_note = launch.note;

        auto spawned = process::ChildProcess::spawn(launch, definition.env);
        if (core::errors::is_error(spawned)) {
            return fail(core::errors::get_error(spawned));
        }
        instance->child = std::move(core::errors::get_value(spawned));
        outcome.pid = instance->child->pid();
        const auto port = find_port_arg(definition.args);
        instance->url = definition.url.value_or(
            "http://localhost:" + std::to_string(port.value_or(config_.default_port)));
        if (definition.url.has_value() || port.has_value()) {
            // The provider also serves HTTP; readiness comes from its health endpoint.
            auto health = transport::http_client::parse_url(instance->url);
            if (core::errors::is_error(health)) {
                return fail(core::errors::get_error(health));
            }
            instance->base_url = core::errors::get_value(health);
        }
        LOG_INFO("provider " + id + " launched as pid " + std::to_string(*outcome.pid));

        const int stdin_fd = instance->child->release_stdin();
        const int stdout_fd = instance->child->release_stdout();
        const int stderr_fd = instance->child->release_stderr();
        instance->transport = std::make_unique<transport::StdioTransport>(
            stdin_fd, stdout_fd, stderr_fd, request_timeouts(), sink);
    } else {
        auto parsed = transport::http_client::parse_url(definition.url.value_or(""));
        if (core::errors::is_error(parsed)) {
            return fail(core::errors::get_error(parsed));
        }
        instance->base_url = core::errors::get_value(parsed);
        instance->url = definition.url.value_or("");

        transport::EventStreamOptions options;
        options.base_url = *instance->base_url;
        options.credential = definition.credential;
        options.client_id = core::config::generate_client_id();
        options.rpc_path = config_.rpc_path;
        options.event_path = config_.event_path;
        options.reconnect_initial = std::chrono::milliseconds(config_.reconnect_initial_ms);
        options.reconnect_max = std::chrono::milliseconds(config_.reconnect_max_ms);
        instance->transport = std::make_unique<transport::EventStreamTransport>(
            std::move(options), request_timeouts(), sink);
    }

    auto handshake = instance->transport->initialize();
    if (core::errors::is_error(handshake)) {
        ToolhubError error = core::errors::get_error(handshake);
        if (instance->child) {
            std::lock_guard<std::mutex> lock(instance->process_mutex);
            if (instance->child->wait_for_exit(std::chrono::milliseconds(250))) {
                const auto code = instance->child->exit_code();
                error = ToolhubError{ErrorCategory::Launch,
                                     "Provider " + id + " exited during startup" +
                                         (code ? " with code " + std::to_string(*code) : ""),
                                     "process_exited", error.message};
            }
        }
        return fail(error);
    }
    instance->server_info = core::errors::get_value(handshake);

    auto healthy = await_healthy(*instance);
    if (core::errors::is_error(healthy)) {
        return fail(core::errors::get_error(healthy));
    }

    instance->started_at = std::chrono::system_clock::now();
    instance->started_steady = std::chrono::steady_clock::now();
    transition(*instance, LifecycleState::Running);
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        instances_[id] = instance;
    }
    instance->monitor = std::thread(&LifecycleController::monitor_loop, this, instance.get());

    outcome.url = instance->url;
    outcome.server_info = instance->server_info;
    LOG_INFO("provider " + id + " is running (" + instance->server_info.name + " " +
             instance->server_info.version + ")");
    return outcome;
}

void LifecycleController::teardown(const std::shared_ptr<RunningInstance>& instance,
                                   const bool graceful) {
    instance->stop_monitor();
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        const auto it = instances_.find(instance->provider_id);
        if (it != instances_.end() && it->second == instance) {
            instances_.erase(it);
        }
    }

    if (instance->transport) {
        if (graceful && instance->transport->is_connected() &&
            instance->transport->is_initialized()) {
            auto shutdown = instance->transport->shutdown();
            if (core::errors::is_error(shutdown)) {
                LOG_DEBUG("graceful shutdown of " + instance->provider_id + " failed: " +
                          core::errors::get_error(shutdown).message);
            }
        }
        instance->transport->close();
    }

    if (!instance->child) {
        return;
    }
    std::lock_guard<std::mutex> lock(instance->process_mutex);
    if (!instance->child->terminate()) {
        return;
    }
    const auto grace = std::chrono::milliseconds(config_.stop_grace_ms);
    if (instance->child->wait_for_exit(grace)) {
        return;
    }
    LOG_WARN("provider " + instance->provider_id + " ignored SIGTERM for " +
             std::to_string(grace.count()) + " ms, sending SIGKILL");
    static_cast<void>(instance->child->kill());
    if (!instance->child->wait_for_exit(std::chrono::milliseconds(1000))) {
        LOG_ERROR("provider " + instance->provider_id + " (pid " +
                  std::to_string(instance->child->pid()) + ") survived SIGKILL");
    }
}

core::errors::Result<Unit> LifecycleController::stop(const std::string& provider_id) {
    auto op_lock = operation_lock(provider_id);
    std::lock_guard<std::mutex> op_guard(*op_lock);
    return stop_locked(provider_id);
}

core::errors::Result<Unit> LifecycleController::stop_locked(const std::string& provider_id) {
    auto instance = find_instance(provider_id);
    if (!instance) {
        return Unit{};
    }
    LOG_INFO("stopping provider " + provider_id);
    teardown(instance, true);
    transition(*instance, LifecycleState::Stopped);
    return Unit{};
}

core::errors::Result<ProviderStatus> LifecycleController::status(const std::string& provider_id) {
    auto op_lock = operation_lock(provider_id);
    std::lock_guard<std::mutex> op_guard(*op_lock);

    auto definition = registry_.get(provider_id);
    if (core::errors::is_error(definition)) {
        return core::errors::get_error(definition);
    }

    ProviderStatus report;
    report.provider_id = provider_id;

    auto instance = find_instance(provider_id);
    if (!instance) {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        const auto failure = last_failures_.find(provider_id);
        if (failure != last_failures_.end()) {
            report.state = LifecycleState::Error;
            report.detail = failure->second;
        }
        return report;
    }

    if (instance->current() == LifecycleState::Stopped || !process_alive(*instance)) {
        {
            std::lock_guard<std::mutex> lock(instance->process_mutex);
            report.exit_code = instance->child ? instance->child->exit_code() : std::nullopt;
        }
        LOG_WARN("provider " + provider_id + " is no longer running" +
                 (report.exit_code ? " (exit code " + std::to_string(*report.exit_code) + ")"
                                   : ""));
        teardown(instance, false);
        transition(*instance, LifecycleState::Stopped);
        report.state = LifecycleState::Stopped;
        return report;
    }

    const bool live = probe(*instance);
    const LifecycleState current = instance->current();
    if (live && current == LifecycleState::Unhealthy) {
        transition(*instance, LifecycleState::Running);
    } else if (!live && current == LifecycleState::Running) {
        transition(*instance, LifecycleState::Unhealthy);
    }

    report.state = instance->current();
    report.pid = instance->pid();
    report.url = instance->url;
    report.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - instance->started_steady);
    report.server_info = instance->server_info;
    return report;
}

core::errors::Result<std::vector<protocol::LogEntry>> LifecycleController::logs(
    const std::string& provider_id, const std::size_t limit) {
    auto definition = registry_.get(provider_id);
    if (core::errors::is_error(definition)) {
        return core::errors::get_error(definition);
    }

    std::shared_ptr<session::LogRing> ring;
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        const auto it = last_logs_.find(provider_id);
        if (it != last_logs_.end()) {
            ring = it->second;
        }
    }
    if (!ring) {
        return std::vector<protocol::LogEntry>{};
    }
    return ring->tail(limit);
}

core::errors::Result<std::vector<ProviderListing>> LifecycleController::list() {
    auto definitions = registry_.list();
    if (core::errors::is_error(definitions)) {
        return core::errors::get_error(definitions);
    }

    std::vector<ProviderListing> listings;
    for (auto& definition : core::errors::get_value(definitions)) {
        ProviderListing listing;
        auto instance = find_instance(definition.id);
        if (instance) {
            listing.state = process_alive(*instance) ? instance->current()
                                                     : LifecycleState::Stopped;
            listing.pid = instance->pid();
            listing.url = instance->url;
        } else {
            std::lock_guard<std::mutex> lock(instances_mutex_);
            if (last_failures_.count(definition.id) > 0) {
                listing.state = LifecycleState::Error;
            }
        }
        listing.definition = std::move(definition);
        listings.push_back(std::move(listing));
    }
    return listings;
}

core::errors::Result<protocol::ProviderDefinition> LifecycleController::install(
    protocol::ProviderDefinition definition) {
    return registry_.create(std::move(definition));
}

core::errors::Result<protocol::ProviderDefinition> LifecycleController::update(
    const std::string& provider_id, const session::ProviderUpdate& patch) {
    // Held across the registry's in-use check and its write, so no start of
    // this provider can slip in between.
    auto op_lock = operation_lock(provider_id);
    std::lock_guard<std::mutex> op_guard(*op_lock);
    return registry_.update(provider_id, patch);
}

core::errors::Result<Unit> LifecycleController::uninstall(const std::string& provider_id) {
    auto op_lock = operation_lock(provider_id);
    std::lock_guard<std::mutex> op_guard(*op_lock);

    auto stopped = stop_locked(provider_id);
    if (core::errors::is_error(stopped)) {
        return core::errors::get_error(stopped);
    }
    auto removed = registry_.remove(provider_id);
    if (core::errors::is_error(removed)) {
        return core::errors::get_error(removed);
    }
    std::lock_guard<std::mutex> lock(instances_mutex_);
    last_logs_.erase(provider_id);
    last_failures_.erase(provider_id);
    return Unit{};
}

core::errors::Result<Unit> LifecycleController::with_transport(const std::string& provider_id,
                                                               const TransportFn& fn) {
    auto instance = find_instance(provider_id);
    if (!instance || instance->current() != LifecycleState::Running) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Provider " + provider_id + " is not running",
                            "provider_not_running", "Start the provider first."};
    }
    const InstanceView view{provider_id, instance->started_at, instance->server_info};
    fn(*instance->transport, view);
    return Unit{};
}

void LifecycleController::stop_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        for (const auto& item : instances_) {
            ids.push_back(item.first);
        }
    }
    for (const auto& id : ids) {
        auto stopped = stop(id);
        if (core::errors::is_error(stopped)) {
            LOG_ERROR("failed to stop provider " + id + ": " +
                      core::errors::get_error(stopped).message);
        }
    }
}

void LifecycleController::monitor_loop(RunningInstance* instance) {
    const auto interval = std::chrono::milliseconds(config_.probe_interval_ms);
    while (true) {
        {
            std::unique_lock<std::mutex> lock(instance->monitor_mutex);
            if (instance->monitor_cv.wait_for(lock, interval,
                                              [instance]() { return instance->monitor_stop; })) {
                return;
            }
        }

        if (!process_alive(*instance)) {
            LOG_WARN("provider " + instance->provider_id + " exited unexpectedly");
            instance->transport->close();
            transition(*instance, LifecycleState::Stopped);
            return;
        }

        const bool live = probe(*instance);
        const LifecycleState current = instance->current();
        if (current == LifecycleState::Running && !live) {
            transition(*instance, LifecycleState::Unhealthy);
        } else if (current == LifecycleState::Unhealthy && live) {
            transition(*instance, LifecycleState::Running);
        }
    }
}

}  // namespace toolhub::runtime
