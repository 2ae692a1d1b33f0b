// Tests for the run registry: ids, output capture and drains, stop, prune,
// launch failures and reset, against the fake host.

#include "core/run_registry.hpp"
#include "fake_host.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace test_run_registry {

using namespace std::chrono_literals;

static bridge_config::BridgeConfig test_config() {
    bridge_config::BridgeConfig config;
    config.run_start_timeout = 2000ms;
    config.run_output_capacity = 4096;
    return config;
}

static long long id_number(const std::string &run_id) {
    return std::stoll(run_id.substr(4));
}

// Test: A started run is listed as running under a "run-N" id.
static bool test_start_registers_run() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult started = registry.start("server", "");
    std::vector<bridge_core::RunSummary> runs = registry.list();
    bool success = started.success && started.run_id.rfind("run-", 0) == 0 && started.project_name == "demo" &&
                   runs.size() == 1 && runs[0].running && runs[0].configuration_name == "server" &&
                   !runs[0].exit_code.has_value() && runs[0].start_time > 0;

    if (success) {
        std::cout << "  OK: Started run is registered as running (" << started.run_id << ")" << std::endl;
    } else {
        std::cout << "  FAIL: Start result: " << started.error.message << std::endl;
    }
    return success;
}

// Test: Unknown configuration and missing project are typed errors.
static bool test_start_errors() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());
    bridge_core::RunStartResult unknown = registry.start("missing", "");

    fake_host::FakeHost empty_host;
    bridge_core::RunRegistry empty_registry(empty_host, test_config());
    bridge_core::RunStartResult no_project = empty_registry.start("server", "");

    bool success = !unknown.success && unknown.error.kind == bridge_core::ErrorKind::ConfigurationNotFound &&
                   unknown.error.message.find("server, tool") != std::string::npos &&
                   !no_project.success && no_project.error.kind == bridge_core::ErrorKind::NoProjectOpen &&
                   registry.list().empty();

    if (success) {
        std::cout << "  OK: Unknown configuration and missing project are reported" << std::endl;
    } else {
        std::cout << "  FAIL: Errors were: " << unknown.error.message << " / " << no_project.error.message
                  << std::endl;
    }
    return success;
}

// Test: Run ids are unique and strictly increasing, also under concurrent starts.
static bool test_unique_increasing_ids() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());

    std::mutex ids_mutex;
    std::vector<std::string> ids;
    std::vector<std::thread> starters;
    for (int index = 0; index < 6; index++) {
        starters.emplace_back([&]() {
            bridge_core::RunStartResult started = registry.start("tool", "");
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.push_back(started.run_id);
        });
    }
    for (auto &thread : starters) {
        thread.join();
    }
    std::string later = registry.start("tool", "").run_id;

    std::set<std::string> unique(ids.begin(), ids.end());
    long long highest = 0;
    for (const auto &run_id : ids) {
        highest = std::max(highest, id_number(run_id));
    }

    std::vector<bridge_core::RunSummary> runs = registry.list();
    bool ordered = true;
    for (size_t index = 1; index < runs.size(); index++) {
        ordered &= id_number(runs[index - 1].run_id) < id_number(runs[index].run_id);
    }
    bool success = unique.size() == 6 && id_number(later) > highest && runs.size() == 7 && ordered;

    if (success) {
        std::cout << "  OK: Run ids are unique and strictly increasing" << std::endl;
    } else {
        std::cout << "  FAIL: " << unique.size() << " unique ids, list ordered: " << ordered << std::endl;
    }
    return success;
}

// Test: clear drains atomically; the next read only sees newer text.
static bool test_output_clear_semantics() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host.on_launch = [](fake_host::FakeProcess &process) { process.emit("first\n"); };
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult started = registry.start("server", "");
    bridge_core::RunOutputResult peek = registry.get_output(started.run_id, false);
    bridge_core::RunOutputResult first = registry.get_output(started.run_id, true);
    host.process(0)->emit("second\n");
    bridge_core::RunOutputResult second = registry.get_output(started.run_id, true);
    bridge_core::RunOutputResult empty = registry.get_output(started.run_id, true);

    bool success = peek.output == "first\n" && first.output == "first\n" && second.output == "second\n" &&
                   empty.output.empty() && empty.running;

    if (success) {
        std::cout << "  OK: Cleared reads return disjoint output" << std::endl;
    } else {
        std::cout << "  FAIL: Second read returned: " << second.output << std::endl;
    }
    return success;
}

// Test: Output of an unknown run is RunNotFound.
static bool test_output_unknown_run() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());
    bridge_core::RunOutputResult result = registry.get_output("run-999", false);
    bool success = !result.success && result.error.kind == bridge_core::ErrorKind::RunNotFound;

    if (success) {
        std::cout << "  OK: Unknown run id is RunNotFound" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown run id was not reported" << std::endl;
    }
    return success;
}

// Test: A natural exit sets the exit code and clears running.
static bool test_natural_exit() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult started = registry.start("tool", "");
    host.process(0)->emit("done\n");
    host.process(0)->finish(3);
    bridge_core::RunOutputResult output = registry.get_output(started.run_id, false);
    bool success = !output.running && output.exit_code.has_value() && output.exit_code.value() == 3 &&
                   output.output == "done\n";

    if (success) {
        std::cout << "  OK: Natural exit records the exit code" << std::endl;
    } else {
        std::cout << "  FAIL: Run still running or wrong exit code" << std::endl;
    }
    return success;
}

// Test: stop terminates once; later stops report the terminated state.
static bool test_stop_is_idempotent() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult started = registry.start("server", "");
    bridge_core::RunStopResult first = registry.stop(started.run_id);
    bridge_core::RunStopResult second = registry.stop(started.run_id);
    bridge_core::RunStopResult unknown = registry.stop("run-424242");
    bridge_core::RunOutputResult output = registry.get_output(started.run_id, false);

    bool success = first.outcome == bridge_core::StopOutcome::Stopped &&
                   second.outcome == bridge_core::StopOutcome::AlreadyTerminated &&
                   unknown.outcome == bridge_core::StopOutcome::NotFound && !output.running &&
                   output.exit_code.has_value() && host.process(0)->terminate_requests() == 1;

    if (success) {
        std::cout << "  OK: Stop terminates once and is idempotent" << std::endl;
    } else {
        std::cout << "  FAIL: Stop outcomes: " << first.message << " / " << second.message << std::endl;
    }
    return success;
}

// Test: A stop racing a natural exit ends in the same terminal state.
static bool test_stop_races_exit() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host.processes_exit_on_terminate = false;
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult started = registry.start("server", "");
    std::thread exiter([&host]() { host.process(0)->finish(0); });
    bridge_core::RunStopResult stop = registry.stop(started.run_id);
    exiter.join();
    bridge_core::RunOutputResult output = registry.get_output(started.run_id, false);

    bool success = (stop.outcome == bridge_core::StopOutcome::Stopped ||
                    stop.outcome == bridge_core::StopOutcome::AlreadyTerminated) &&
                   !output.running && output.exit_code.has_value() && output.exit_code.value() == 0;

    if (success) {
        std::cout << "  OK: Stop racing exit ends terminated with an exit code" << std::endl;
    } else {
        std::cout << "  FAIL: Terminal state after race is inconsistent" << std::endl;
    }
    return success;
}

// Test: prune removes only terminated runs older than max age.
static bool test_prune_keeps_running() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult finished = registry.start("tool", "");
    bridge_core::RunStartResult running = registry.start("server", "");
    host.process(0)->finish(0);
    std::this_thread::sleep_for(20ms);

    size_t kept_by_age = registry.prune(1h);
    size_t removed = registry.prune(5ms);
    std::vector<bridge_core::RunSummary> runs = registry.list();

    bool success = kept_by_age == 0 && removed == 1 && runs.size() == 1 && runs[0].run_id == running.run_id &&
                   !registry.find(finished.run_id);

    if (success) {
        std::cout << "  OK: Prune removes only old terminated runs" << std::endl;
    } else {
        std::cout << "  FAIL: Prune removed " << removed << ", " << runs.size() << " left" << std::endl;
    }
    return success;
}

// Test: A failed launch is LaunchFailed and leaves no entry.
static bool test_launch_failure() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host.launch_error = "No such file or directory";
    bridge_core::RunRegistry registry(host, test_config());

    bridge_core::RunStartResult started = registry.start("server", "");
    bool success = !started.success && started.error.kind == bridge_core::ErrorKind::LaunchFailed &&
                   started.error.message.find("No such file") != std::string::npos && registry.list().empty();

    if (success) {
        std::cout << "  OK: Launch failure is reported and not registered" << std::endl;
    } else {
        std::cout << "  FAIL: Launch failure result: " << started.error.message << std::endl;
    }
    return success;
}

// Test: Output beyond capacity is truncated in the run buffer.
static bool test_output_capacity() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_config::BridgeConfig config = test_config();
    config.run_output_capacity = 100;
    bridge_core::RunRegistry registry(host, config);

    bridge_core::RunStartResult started = registry.start("server", "");
    for (int index = 0; index < 20; index++) {
        host.process(0)->emit("0123456789");
    }
    bridge_core::RunOutputResult output = registry.get_output(started.run_id, false);
    bool success = output.output.size() <= 100 && output.truncated;

    if (success) {
        std::cout << "  OK: Run output stays within capacity" << std::endl;
    } else {
        std::cout << "  FAIL: Run output size " << output.output.size() << std::endl;
    }
    return success;
}

// Test: reset terminates running processes and forgets every run.
static bool test_reset() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::RunRegistry registry(host, test_config());

    registry.start("server", "");
    registry.start("tool", "");
    size_t forgotten = registry.reset();
    bool success = forgotten == 2 && registry.list().empty() && host.process(0)->terminate_requests() == 1 &&
                   host.process(1)->terminate_requests() == 1;

    if (success) {
        std::cout << "  OK: Reset terminates and forgets all runs" << std::endl;
    } else {
        std::cout << "  FAIL: Reset forgot " << forgotten << " runs" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_start_registers_run();
    all_passed &= test_start_errors();
    all_passed &= test_unique_increasing_ids();
    all_passed &= test_output_clear_semantics();
    all_passed &= test_output_unknown_run();
    all_passed &= test_natural_exit();
    all_passed &= test_stop_is_idempotent();
    all_passed &= test_stop_races_exit();
    all_passed &= test_prune_keeps_running();
    all_passed &= test_launch_failure();
    all_passed &= test_output_capacity();
    all_passed &= test_reset();
    return all_passed;
}

} // namespace test_run_registry
