#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "core/config/host_config.hpp"
#include "core/errors/toolhub_errors.hpp"
#include "process/child_process.hpp"
#include "protocol/provider_contract.hpp"
#include "session/log_ring.hpp"
#include "session/provider_registry.hpp"
#include "transport/transport.hpp"

namespace toolhub::runtime {

struct StartOutcome {
    std::string provider_id;
    bool already_running = false;
    std::optional<pid_t> pid;  // absent for network providers
    std::string url;
    std::string launch_note;  // set when a command fallback was used
    protocol::ServerInfo server_info;
};

struct ProviderStatus {
    std::string provider_id;
    protocol::LifecycleState state = protocol::LifecycleState::Stopped;
    std::optional<pid_t> pid;
    std::string url;
    std::optional<std::chrono::seconds> uptime;
    std::optional<protocol::ServerInfo> server_info;
    std::optional<int> exit_code;  // when the process was found exited
    std::string detail;            // last start failure, if any
};

struct ProviderListing {
    protocol::ProviderDefinition definition;
    protocol::LifecycleState state = protocol::LifecycleState::Stopped;
    std::optional<pid_t> pid;
    std::string url;
};

// What a borrower of the live transport may know about the instance.
struct InstanceView {
    std::string provider_id;
    std::chrono::system_clock::time_point started_at;
    protocol::ServerInfo server_info;
};

// Owns every running provider: the child process, its transport, its log
// ring and its health monitor. Only the controller mutates lifecycle state.
class LifecycleController {
public:
    using TransportFn = std::function<void(transport::Transport&, const InstanceView&)>;

    LifecycleController(session::ProviderRegistry& registry, core::config::HostConfig config);

    // Stops every instance.
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Idempotent: a live instance is reported with already_running set.
    core::errors::Result<StartOutcome> start(const std::string& provider_id);

    // No-op success when nothing is running.
    core::errors::Result<core::errors::Unit> stop(const std::string& provider_id);

    // Reconciles with the process and the probe before reporting.
    core::errors::Result<ProviderStatus> status(const std::string& provider_id);

    // Newest `limit` lines of the current (or last) instance, oldest first.
    core::errors::Result<std::vector<protocol::LogEntry>> logs(const std::string& provider_id,
                                                               std::size_t limit);

    core::errors::Result<std::vector<ProviderListing>> list();

    core::errors::Result<protocol::ProviderDefinition> install(
        protocol::ProviderDefinition definition);

    // Registry update serialized with start/stop of the same provider.
    // Launch fields are refused while an instance exists.
    core::errors::Result<protocol::ProviderDefinition> update(
        const std::string& provider_id, const session::ProviderUpdate& patch);

    // Stops the provider first, then removes its definition.
    core::errors::Result<core::errors::Unit> uninstall(const std::string& provider_id);

    // Runs `fn` against the live transport. Fails with provider_not_running
    // (and does no I/O) unless the instance is Running.
    core::errors::Result<core::errors::Unit> with_transport(const std::string& provider_id,
                                                            const TransportFn& fn);

    bool has_instance(const std::string& provider_id) const;

    void stop_all();

    const core::config::HostConfig& config() const { return config_; }

private:
    struct RunningInstance;

    std::shared_ptr<std::mutex> operation_lock(const std::string& provider_id);
    std::shared_ptr<RunningInstance> find_instance(const std::string& provider_id) const;

    core::errors::Result<StartOutcome> launch(const protocol::ProviderDefinition& definition);
    core::errors::Result<core::errors::Unit> await_healthy(RunningInstance& instance);
    // stop() body; the caller holds the provider's operation lock.
    core::errors::Result<core::errors::Unit> stop_locked(const std::string& provider_id);

    bool probe(RunningInstance& instance) const;
    bool process_alive(RunningInstance& instance) const;

    // Closes the transport, reaps the child and removes the instance.
    void teardown(const std::shared_ptr<RunningInstance>& instance, bool graceful);

    void transition(RunningInstance& instance, protocol::LifecycleState next);
    void record_status(const std::string& provider_id, protocol::LifecycleState state);
    void monitor_loop(RunningInstance* instance);
    transport::RequestTimeouts request_timeouts() const;

    session::ProviderRegistry& registry_;
    const core::config::HostConfig config_;

    mutable std::mutex instances_mutex_;
    std::map<std::string, std::shared_ptr<RunningInstance>> instances_;
    std::map<std::string, std::shared_ptr<std::mutex>> operation_locks_;
    std::map<std::string, std::shared_ptr<session::LogRing>> last_logs_;
    std::map<std::string, std::string> last_failures_;
};

// Port from a "--port N" or "--port=N" launch argument.
std::optional<std::uint16_t> find_port_arg(const std::vector<std::string>& args);

// find_port_arg(), or `fallback`.
std::uint16_t extract_port(const std::vector<std::string>& args, std::uint16_t fallback);

}  // namespace toolhub::runtime
