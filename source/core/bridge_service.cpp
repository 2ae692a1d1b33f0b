#include "core/bridge_service.hpp"
#include "core/completion_bridge.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace bridge_core {

static long elapsed_milliseconds(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

static std::string seconds_text(std::chrono::milliseconds duration) {
    long long milliseconds = static_cast<long long>(duration.count());
    if (milliseconds % 1000 == 0) {
        return std::to_string(milliseconds / 1000) + "s";
    }
    return std::to_string(milliseconds) + "ms";
}

static std::string holder_text(const LockStatus &status) {
    if (!status.locked) {
        return "";
    }
    return " (held by " + status.holder_description + " for " + std::to_string(status.held_for_milliseconds) +
           " ms)";
}

std::optional<host::OperationClass> parse_operation_class(const std::string &name) {
    if (name == "build") {
        return host::OperationClass::Build;
    }
    if (name == "test") {
        return host::OperationClass::Test;
    }
    return std::nullopt;
}

const char *operation_class_name(host::OperationClass operation_class) {
    switch (operation_class) {
    case host::OperationClass::Build:
        return "build";
    case host::OperationClass::Test:
        return "test";
    }
    return "unknown";
}

static DebugTimeouts debug_timeouts_from(const bridge_config::BridgeConfig &config) {
    DebugTimeouts timeouts;
    timeouts.call = config.debug_timeout;
    timeouts.evaluate = config.debug_evaluate_timeout;
    return timeouts;
}

BridgeService::BridgeService(host::Host &host, const bridge_config::BridgeConfig &config)
    : host_(host),
      config_(config),
      build_lock_("build"),
      test_lock_("test"),
      registry_(host, config_),
      debug_facade_(host, debug_timeouts_from(config)),
      build_cache_(std::make_shared<ResultCache<BuildRunResult>>()),
      test_cache_(std::make_shared<ResultCache<TestRunResult>>()) {}

BridgeService::~BridgeService() {
    shutdown();
}

OperationLock &BridgeService::lock_for(host::OperationClass operation_class) {
    return operation_class == host::OperationClass::Build ? build_lock_ : test_lock_;
}

// --- Build ---

static BuildRunResult build_result_from(const host::BuildOutcome &outcome, const std::string &project_name,
                                        std::chrono::steady_clock::time_point started_at) {
    BuildRunResult result;
    result.project_name = project_name;
    result.aborted = outcome.aborted;
    result.errors = outcome.errors;
    result.warnings = outcome.warnings;
    result.time_milliseconds = elapsed_milliseconds(started_at);
    result.success = !outcome.aborted && outcome.errors.empty();
    return result;
}

BuildRunResult BridgeService::build(bool incremental, std::optional<std::chrono::milliseconds> timeout,
                                    const std::string &project_reference) {
    BuildRunResult result;
    auto started_at = std::chrono::steady_clock::now();

    if (shut_down_.load()) {
        result.error = make_error(ErrorKind::ServiceShutDown, "Service is shut down");
        return result;
    }

    std::optional<host::ProjectInfo> project = host_.find_project(project_reference);
    if (!project) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }
    result.project_name = project->name;

    // Activity while our own lock is held is ours; the lock wait below covers it.
    host::Host *host_pointer = &host_;
    OperationLock *lock_pointer = &build_lock_;
    host::ProjectInfo probed_project = *project;
    ExternalActivityOutcome activity = OperationLock::wait_for_external_activity(
        [host_pointer, lock_pointer, probed_project]() {
            return !lock_pointer->is_locked() &&
                   host_pointer->is_activity_in_progress(probed_project, host::OperationClass::Build);
        },
        config_.upstream_wait, config_.upstream_poll_interval);
    if (activity == ExternalActivityOutcome::TimedOut) {
        result.error = make_error(ErrorKind::UpstreamActivityTimeout,
                                  "A build started outside the bridge is still running after " +
                                      seconds_text(config_.upstream_wait));
        return result;
    }

    OperationGuard guard(build_lock_, config_.lock_acquire_timeout,
                         std::string(incremental ? "incremental build" : "rebuild") + " of " + project->name);
    if (!guard.acquired()) {
        result.error = make_error(ErrorKind::LockAcquisitionTimeout,
                                  "Another build is in progress" + holder_text(build_lock_.status()) +
                                      ". Retry later or call lock_reset.");
        return result;
    }

    uint64_t generation = build_cache_->begin_operation();
    std::shared_ptr<ResultCache<BuildRunResult>> cache = build_cache_;
    std::string project_name = project->name;
    host::ProjectInfo build_project = *project;

    TimeoutPolicy policy;
    policy.timeout = timeout ? *timeout : config_.build_timeout;
    policy.operation_name = "build " + project->name;

    BridgeOutcome<BuildRunResult> outcome = run_on_application_context<BuildRunResult>(
        host_.application_context(),
        [host_pointer, build_project, incremental, cache, generation, project_name,
         started_at](const CompletionSignal<BuildRunResult> &signal) {
            host_pointer->build(build_project, incremental,
                                [signal, cache, generation, project_name, started_at](const host::BuildOutcome &done) {
                                    BuildRunResult finished = build_result_from(done, project_name, started_at);
                                    // Stored even when the waiting request already timed out.
                                    cache->store_for(generation, finished);
                                    signal.complete(finished);
                                });
        },
        policy);

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(),
                                      "Build timed out after " + seconds_text(policy.timeout));
        result.time_milliseconds = elapsed_milliseconds(started_at);
        return result;
    }

    debug_log::log("Build of " + project->name + " finished: " + std::to_string(outcome.value.errors.size()) +
                   " error(s), " + std::to_string(outcome.value.warnings.size()) + " warning(s)");
    return outcome.value;
}

std::optional<BuildRunResult> BridgeService::last_build() const {
    return build_cache_->latest();
}

BuildDiagnostics BridgeService::build_diagnostics() const {
    BuildDiagnostics diagnostics;
    std::optional<BuildRunResult> latest = build_cache_->latest();
    if (!latest) {
        return diagnostics;
    }
    diagnostics.available = true;
    diagnostics.project_name = latest->project_name;
    diagnostics.errors = latest->errors;
    diagnostics.warnings = latest->warnings;
    return diagnostics;
}

// --- Test ---

TestRunResult BridgeService::test(const std::string &pattern, std::optional<std::chrono::milliseconds> timeout,
                                  const std::string &project_reference, bool debug) {
    TestRunResult result;
    auto started_at = std::chrono::steady_clock::now();
    std::chrono::milliseconds budget = timeout ? *timeout : config_.test_timeout;
    auto deadline = started_at + budget;
    auto remaining = [deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    };

    if (shut_down_.load()) {
        result.error = make_error(ErrorKind::ServiceShutDown, "Service is shut down");
        return result;
    }

    std::optional<host::ProjectInfo> project = host_.find_project(project_reference);
    if (!project) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }

    host::Host *host_pointer = &host_;
    OperationLock *build_lock_pointer = &build_lock_;
    OperationLock *test_lock_pointer = &test_lock_;
    host::ProjectInfo probed_project = *project;

    // Every wait below is charged against the caller's deadline.
    // Tests run against build output: any build, ours or not, finishes first.
    std::chrono::milliseconds build_wait = std::min(config_.upstream_wait, remaining());
    ExternalActivityOutcome build_activity = OperationLock::wait_for_external_activity(
        [host_pointer, build_lock_pointer, probed_project]() {
            return build_lock_pointer->is_locked() ||
                   host_pointer->is_activity_in_progress(probed_project, host::OperationClass::Build);
        },
        build_wait, config_.upstream_poll_interval);
    if (build_activity == ExternalActivityOutcome::TimedOut) {
        result.error = make_error(ErrorKind::UpstreamActivityTimeout,
                                  "A build is still running after " + seconds_text(build_wait));
        return result;
    }

    std::chrono::milliseconds test_wait = std::min(config_.upstream_wait, remaining());
    ExternalActivityOutcome test_activity = OperationLock::wait_for_external_activity(
        [host_pointer, test_lock_pointer, probed_project]() {
            return !test_lock_pointer->is_locked() &&
                   host_pointer->is_activity_in_progress(probed_project, host::OperationClass::Test);
        },
        test_wait, config_.upstream_poll_interval);
    if (test_activity == ExternalActivityOutcome::TimedOut) {
        result.error = make_error(ErrorKind::UpstreamActivityTimeout,
                                  "A test run started outside the bridge is still running after " +
                                      seconds_text(test_wait));
        return result;
    }

    OperationGuard guard(test_lock_, std::min(config_.lock_acquire_timeout, remaining()),
                         "test " + pattern + " in " + project->name);
    if (!guard.acquired()) {
        result.error = make_error(ErrorKind::LockAcquisitionTimeout,
                                  "Another test run is in progress" + holder_text(test_lock_.status()) +
                                      ". Retry later or call lock_reset.");
        return result;
    }

    TimeoutPolicy prepare_policy;
    prepare_policy.timeout = std::min(remaining(), config_.run_start_timeout);
    prepare_policy.operation_name = "prepare tests " + pattern;
    host::ProjectInfo test_project = *project;
    BridgeOutcome<host::TestLaunch> prepared = run_on_application_context<host::TestLaunch>(
        host_.application_context(),
        [host_pointer, test_project, pattern](const CompletionSignal<host::TestLaunch> &signal) {
            signal.complete(host_pointer->prepare_tests(test_project, pattern));
        },
        prepare_policy);
    if (!prepared.completed()) {
        result.error = bridge_failure(prepared, host_.application_context(),
                                      "Timeout preparing tests for pattern '" + pattern + "'");
        return result;
    }
    if (!prepared.value.success || (!debug && !prepared.value.results)) {
        result.error = make_error(ErrorKind::LaunchFailed, "Failed to create test configuration for pattern '" +
                                                               pattern + "': " + prepared.value.error_message);
        return result;
    }

    if (debug) {
        DebugStartResult session =
            debug_facade_.start_configuration(*project, prepared.value.configuration, remaining());
        result.time_milliseconds = elapsed_milliseconds(started_at);
        if (!session.success) {
            result.error = session.error;
            return result;
        }
        result.success = true;
        result.debug_session_id = session.session_id;
        result.message = "Tests started in debug mode. Use the debug operations to interact with session " +
                         session.session_name + ".";
        debug_log::log("Tests '" + pattern + "' started under the debugger");
        return result;
    }

    uint64_t generation = test_cache_->begin_operation();

    std::shared_ptr<host::TestResultSource> results = prepared.value.results;
    host::ProcessListener feed;
    feed.on_text = [results](const std::string &text) { results->on_process_text(text); };
    feed.on_terminated = [results](int exit_code) { results->on_process_terminated(exit_code); };

    RunStartResult started = registry_.start_execution(*project, prepared.value.configuration, "test: " + pattern,
                                                       feed, remaining());
    result.run_id = started.run_id;
    if (!started.success) {
        result.error = started.error;
        return result;
    }

    std::shared_ptr<RunRecord> record = registry_.find(started.run_id);
    if (!record) {
        result.error = make_error(ErrorKind::ServiceShutDown, "Test run " + started.run_id + " was discarded");
        return result;
    }

    BridgeOutcome<int> terminated = record->termination().wait_for(remaining());
    if (!terminated.completed()) {
        // The process keeps running; it can be inspected and stopped by run id.
        result.error = make_error(ErrorKind::OperationTimeout,
                                  "Test execution timed out after " + seconds_text(budget) + " (run " +
                                      started.run_id + ")");
        result.time_milliseconds = elapsed_milliseconds(started_at);
        return result;
    }

    RetryPolicy retry;
    retry.max_attempts = config_.extraction_max_attempts;
    retry.delay = config_.extraction_retry_delay;
    retry.read_timeout = config_.debug_timeout;

    TestRunResult extracted = extract_test_results(
        host_.application_context(), [results]() { return results->read_tree(); }, terminated.value, started_at,
        retry);
    extracted.run_id = started.run_id;
    test_cache_->store_for(generation, extracted);

    debug_log::log("Tests '" + pattern + "' finished: " + std::to_string(extracted.passed) + " passed, " +
                   std::to_string(extracted.failed) + " failed, " + std::to_string(extracted.skipped) +
                   " skipped");
    return extracted;
}

std::optional<TestRunResult> BridgeService::last_test() const {
    return test_cache_->latest();
}

// --- Service ---

std::vector<host::ProjectInfo> BridgeService::projects() {
    return host_.list_projects();
}

std::vector<LockStatus> BridgeService::lock_status() const {
    return {build_lock_.status(), test_lock_.status()};
}

ResetReport BridgeService::reset_lock(host::OperationClass operation_class) {
    return lock_for(operation_class).reset();
}

ServiceResetReport BridgeService::reset() {
    ServiceResetReport report;
    report.runs_forgotten = registry_.reset();
    build_cache_->clear();
    test_cache_->clear();
    report.build_lock = build_lock_.reset();
    report.test_lock = test_lock_.reset();
    debug_log::log("Service reset: " + std::to_string(report.runs_forgotten) + " run(s) forgotten");
    return report;
}

void BridgeService::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    size_t stopped = registry_.reset();
    debug_log::log("Service shut down, " + std::to_string(stopped) + " run(s) terminated");
}

} // namespace bridge_core
