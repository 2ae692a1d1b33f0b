#include "core/run_registry.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace bridge_core {

// --- RunRecord ---

static long long epoch_milliseconds() {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

RunRecord::RunRecord(const std::string &id, uint64_t sequence, const std::string &configuration_name,
                     const std::string &project_name, size_t output_capacity)
    : id_(id),
      sequence_(sequence),
      configuration_name_(configuration_name),
      project_name_(project_name),
      start_time_(epoch_milliseconds()),
      started_at_(std::chrono::steady_clock::now()),
      output_(output_capacity) {}

void RunRecord::attach_process(const std::shared_ptr<host::ProcessHandle> &process) {
    bool stop_now = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process_ = process;
        stop_now = stop_requested_ && running_;
    }
    if (stop_now && process) {
        debug_log::log("Run " + id_ + ": stop was requested during launch, terminating");
        process->terminate();
    }
}

void RunRecord::mark_terminated(int exit_code) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        exit_code_ = exit_code;
    }
    debug_log::log("Run " + id_ + " terminated with exit code " + std::to_string(exit_code));
    termination_.complete(exit_code);
}

void RunRecord::mark_launch_failed(const std::string &message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        launch_failed_ = true;
    }
    debug_log::log("Run " + id_ + " failed to launch: " + message);
    termination_.complete(-1);
}

bool RunRecord::request_stop() {
    std::shared_ptr<host::ProcessHandle> process;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) {
            return false;
        }
        stop_requested_ = true;
        process = process_;
    }
    // Without a handle the launch is still in flight; attach_process() stops it.
    if (process) {
        process->terminate();
    }
    return true;
}

bool RunRecord::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

bool RunRecord::launch_failed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return launch_failed_;
}

std::optional<int> RunRecord::exit_code() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

bool RunRecord::is_prunable(std::chrono::steady_clock::time_point threshold) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return !running_ && started_at_ < threshold;
}

RunSummary RunRecord::summary() const {
    RunSummary result;
    result.run_id = id_;
    result.configuration_name = configuration_name_;
    result.project_name = project_name_;
    result.start_time = start_time_;

    std::lock_guard<std::mutex> lock(state_mutex_);
    result.running = running_;
    result.exit_code = exit_code_;
    return result;
}

// --- RunRegistry ---

RunRegistry::RunRegistry(host::Host &host, const bridge_config::BridgeConfig &config)
    : host_(host), config_(config) {}

std::shared_ptr<RunRecord> RunRegistry::register_run(const std::string &display_name,
                                                     const std::string &project_name) {
    uint64_t sequence = next_sequence_.fetch_add(1);
    std::string run_id = "run-" + std::to_string(sequence);
    auto record = std::make_shared<RunRecord>(run_id, sequence, display_name, project_name,
                                              config_.run_output_capacity);

    std::lock_guard<std::mutex> lock(mutex_);
    runs_[run_id] = record;
    return record;
}

void RunRegistry::remove(const std::string &run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    runs_.erase(run_id);
}

std::shared_ptr<RunRecord> RunRegistry::find(const std::string &run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iterator = runs_.find(run_id);
    if (iterator == runs_.end()) {
        return nullptr;
    }
    return iterator->second;
}

RunStartResult RunRegistry::start(const std::string &configuration_name, const std::string &project_reference) {
    prune(config_.run_retention);

    RunStartResult result;
    result.configuration_name = configuration_name;

    std::optional<host::ProjectInfo> project = host_.find_project(project_reference);
    if (!project) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }
    result.project_name = project->name;

    std::vector<host::RunConfiguration> configurations = host_.list_run_configurations(*project);
    auto match = std::find_if(configurations.begin(), configurations.end(),
                              [&configuration_name](const host::RunConfiguration &configuration) {
                                  return configuration.name == configuration_name;
                              });
    if (match == configurations.end()) {
        std::string available;
        for (const auto &configuration : configurations) {
            if (!available.empty()) {
                available += ", ";
            }
            available += configuration.name;
        }
        result.error = make_error(ErrorKind::ConfigurationNotFound,
                                  "Run configuration '" + configuration_name + "' not found. Available: [" +
                                      available + "]");
        return result;
    }

    return start_execution(*project, *match, configuration_name);
}

RunStartResult RunRegistry::start_execution(const host::ProjectInfo &project,
                                            const host::RunConfiguration &configuration,
                                            const std::string &display_name,
                                            const host::ProcessListener &extra_listener,
                                            std::optional<std::chrono::milliseconds> start_timeout) {
    RunStartResult result;
    result.configuration_name = display_name;
    result.project_name = project.name;

    std::shared_ptr<RunRecord> record = register_run(display_name, project.name);
    result.run_id = record->id();

    // Weak: the process handle owns the listener and the record owns the handle.
    std::weak_ptr<RunRecord> weak_record = record;
    host::ProcessListener listener;
    listener.on_text = [weak_record, extra_listener](const std::string &text) {
        if (auto locked_record = weak_record.lock()) {
            locked_record->output().append(text);
        }
        if (extra_listener.on_text) {
            extra_listener.on_text(text);
        }
    };
    listener.on_terminated = [weak_record, extra_listener](int exit_code) {
        if (extra_listener.on_terminated) {
            extra_listener.on_terminated(exit_code);
        }
        if (auto locked_record = weak_record.lock()) {
            locked_record->mark_terminated(exit_code);
        }
    };

    host::Host *host_pointer = &host_;
    TimeoutPolicy policy;
    policy.timeout = start_timeout ? std::min(*start_timeout, config_.run_start_timeout) : config_.run_start_timeout;
    policy.operation_name = "run_start " + display_name;

    BridgeOutcome<host::LaunchResult> outcome = run_on_application_context<host::LaunchResult>(
        host_.application_context(),
        [host_pointer, project, configuration, listener, record](const CompletionSignal<host::LaunchResult> &signal) {
            host::LaunchResult launched = host_pointer->launch(project, configuration, listener);
            if (launched.success) {
                record->attach_process(launched.process);
            } else {
                record->mark_launch_failed(launched.error_message);
            }
            signal.complete(launched);
        },
        policy);

    switch (outcome.status) {
    case BridgeStatus::Completed:
        if (outcome.value.success) {
            result.success = true;
            debug_log::log("Started " + result.run_id + " (" + display_name + ") in project " + project.name);
            return result;
        }
        remove(result.run_id);
        result.error = make_error(ErrorKind::LaunchFailed,
                                  "Failed to start run configuration '" + display_name + "': " +
                                      outcome.value.error_message);
        return result;

    case BridgeStatus::TimedOut:
        // The launch may still complete; the entry stays so the run can be stopped later.
        result.error = make_error(ErrorKind::OperationTimeout,
                                  "Timeout starting run configuration '" + display_name + "'");
        return result;

    case BridgeStatus::Rejected:
        record->mark_launch_failed(outcome.fault_message);
        remove(result.run_id);
        result.error = make_error(host_.application_context().is_running() ? ErrorKind::InternalFault
                                                                           : ErrorKind::ServiceShutDown,
                                  outcome.fault_message);
        return result;

    case BridgeStatus::Faulted:
        record->mark_launch_failed(outcome.fault_message);
        remove(result.run_id);
        result.error = make_error(ErrorKind::InternalFault,
                                  "Failed to start run configuration '" + display_name + "': " +
                                      outcome.fault_message);
        return result;
    }

    result.error = make_error(ErrorKind::InternalFault, "Unexpected launch state");
    return result;
}

RunOutputResult RunRegistry::get_output(const std::string &run_id, bool clear) {
    RunOutputResult result;
    std::shared_ptr<RunRecord> record = find(run_id);
    if (!record) {
        result.error = make_error(ErrorKind::RunNotFound, "Run '" + run_id + "' not found");
        return result;
    }

    // State first: a run reported as running may already have more output,
    // never the other way round.
    result.running = record->is_running();
    result.exit_code = record->exit_code();

    BoundedOutputBuffer::Snapshot snapshot = record->output().read(clear);
    result.output = std::move(snapshot.text);
    result.truncated = snapshot.truncated;
    result.success = true;
    return result;
}

RunStopResult RunRegistry::stop(const std::string &run_id) {
    RunStopResult result;
    std::shared_ptr<RunRecord> record = find(run_id);
    if (!record) {
        result.outcome = StopOutcome::NotFound;
        result.message = "Run '" + run_id + "' not found";
        return result;
    }

    if (!record->request_stop()) {
        result.outcome = StopOutcome::AlreadyTerminated;
        result.message = "Process already terminated";
        return result;
    }

    debug_log::log("Stop requested for " + run_id);
    result.outcome = StopOutcome::Stopped;
    result.message = "Stop signal sent";
    return result;
}

std::vector<RunSummary> RunRegistry::list() const {
    std::vector<std::shared_ptr<RunRecord>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(runs_.size());
        for (const auto &entry : runs_) {
            records.push_back(entry.second);
        }
    }

    std::sort(records.begin(), records.end(),
              [](const std::shared_ptr<RunRecord> &left, const std::shared_ptr<RunRecord> &right) {
                  return left->sequence() < right->sequence();
              });

    std::vector<RunSummary> summaries;
    summaries.reserve(records.size());
    for (const auto &record : records) {
        summaries.push_back(record->summary());
    }
    return summaries;
}

size_t RunRegistry::prune(std::chrono::milliseconds max_age) {
    auto threshold = std::chrono::steady_clock::now() - max_age;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto iterator = runs_.begin(); iterator != runs_.end();) {
        if (iterator->second->is_prunable(threshold)) {
            iterator = runs_.erase(iterator);
            removed++;
        } else {
            ++iterator;
        }
    }
    if (removed > 0) {
        debug_log::log("Pruned " + std::to_string(removed) + " terminated run(s)");
    }
    return removed;
}

size_t RunRegistry::reset() {
    std::map<std::string, std::shared_ptr<RunRecord>> forgotten;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forgotten.swap(runs_);
    }

    for (const auto &entry : forgotten) {
        entry.second->request_stop();
    }
    debug_log::log("Run registry reset, " + std::to_string(forgotten.size()) + " run(s) forgotten");
    return forgotten.size();
}

} // namespace bridge_core
