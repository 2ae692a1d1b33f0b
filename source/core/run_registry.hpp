#ifndef DEVBRIDGE_RUN_REGISTRY_HPP
#define DEVBRIDGE_RUN_REGISTRY_HPP

// Registry of independently tracked process runs.
// Each run owns a bounded output buffer (with its own lock) and the handle of
// its process. Entries are removed only by prune (terminated and old enough),
// reset, or a launch that failed.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/bridge_config.hpp"
#include "core/bounded_output_buffer.hpp"
#include "core/bridge_errors.hpp"
#include "core/completion_bridge.hpp"
#include "host/host_abi.hpp"

namespace bridge_core {

struct RunSummary {
    std::string run_id;
    std::string configuration_name;
    std::string project_name;
    // Milliseconds since the Unix epoch.
    long long start_time = 0;
    bool running = false;
    std::optional<int> exit_code;
};

class RunRecord {
public:
    RunRecord(const std::string &id, uint64_t sequence, const std::string &configuration_name,
              const std::string &project_name, size_t output_capacity);

    RunRecord(const RunRecord &) = delete;
    RunRecord &operator=(const RunRecord &) = delete;

    const std::string &id() const { return id_; }
    uint64_t sequence() const { return sequence_; }
    const std::string &configuration_name() const { return configuration_name_; }
    const std::string &project_name() const { return project_name_; }

    BoundedOutputBuffer &output() { return output_; }

    // Stores the handle; terminates at once if stop() came first.
    void attach_process(const std::shared_ptr<host::ProcessHandle> &process);

    // First call wins. Resolves termination().
    void mark_terminated(int exit_code);
    void mark_launch_failed(const std::string &message);

    // Returns false when the run has already terminated.
    bool request_stop();

    bool is_running() const;
    bool launch_failed() const;
    std::optional<int> exit_code() const;
    // Not running and started before threshold.
    bool is_prunable(std::chrono::steady_clock::time_point threshold) const;
    RunSummary summary() const;

    // Resolved with the exit code when the process terminates (or -1 when the
    // launch failed).
    const CompletionSignal<int> &termination() const { return termination_; }

private:
    const std::string id_;
    const uint64_t sequence_;
    const std::string configuration_name_;
    const std::string project_name_;
    const long long start_time_;
    const std::chrono::steady_clock::time_point started_at_;

    BoundedOutputBuffer output_;
    CompletionSignal<int> termination_;

    mutable std::mutex state_mutex_;
    bool running_ = true;
    bool launch_failed_ = false;
    bool stop_requested_ = false;
    std::optional<int> exit_code_;
    std::shared_ptr<host::ProcessHandle> process_;
};

struct RunStartResult {
    bool success = false;
    std::string run_id;
    std::string configuration_name;
    std::string project_name;
    BridgeError error;
};

struct RunOutputResult {
    bool success = false;
    std::string output;
    bool running = false;
    bool truncated = false;
    std::optional<int> exit_code;
    BridgeError error;
};

enum class StopOutcome {
    Stopped,
    AlreadyTerminated,
    NotFound,
};

struct RunStopResult {
    StopOutcome outcome = StopOutcome::NotFound;
    std::string message;
};

class RunRegistry {
public:
    RunRegistry(host::Host &host, const bridge_config::BridgeConfig &config);

    RunRegistry(const RunRegistry &) = delete;
    RunRegistry &operator=(const RunRegistry &) = delete;

    // Prunes with the configured retention, resolves project and
    // configuration, then launches. Returns once the process has started.
    RunStartResult start(const std::string &configuration_name, const std::string &project_reference);

    // Registers and launches an already resolved configuration under
    // display_name. extra_listener receives the same events; its
    // on_terminated runs before the run is marked terminated, so whoever
    // waits on termination() sees its effects.
    RunStartResult start_execution(const host::ProjectInfo &project,
                                   const host::RunConfiguration &configuration,
                                   const std::string &display_name,
                                   const host::ProcessListener &extra_listener = {},
                                   std::optional<std::chrono::milliseconds> start_timeout = std::nullopt);

    RunOutputResult get_output(const std::string &run_id, bool clear);
    RunStopResult stop(const std::string &run_id);

    // Ordered by start sequence.
    std::vector<RunSummary> list() const;

    // Removes terminated runs that started more than max_age ago. Returns the
    // number removed.
    size_t prune(std::chrono::milliseconds max_age);

    std::shared_ptr<RunRecord> find(const std::string &run_id) const;

    // Requests termination of every running process and forgets all runs.
    // Returns the number of runs forgotten.
    size_t reset();

private:
    std::shared_ptr<RunRecord> register_run(const std::string &display_name, const std::string &project_name);
    void remove(const std::string &run_id);

    host::Host &host_;
    const bridge_config::BridgeConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<RunRecord>> runs_;
    std::atomic<uint64_t> next_sequence_{1};
};

} // namespace bridge_core

#endif // DEVBRIDGE_RUN_REGISTRY_HPP
