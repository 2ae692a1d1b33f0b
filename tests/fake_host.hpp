#ifndef DEVBRIDGE_TESTS_FAKE_HOST_HPP
#define DEVBRIDGE_TESTS_FAKE_HOST_HPP

// In-process host::Host double. Processes, builds, test result trees and
// debug sessions are scripted by the tests; nothing is spawned.

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "host/host_abi.hpp"

namespace fake_host {

class FakeProcess : public host::ProcessHandle {
public:
    FakeProcess(int process_id, const host::ProcessListener &listener, bool exits_on_terminate);

    int process_id() const override { return process_id_; }
    bool is_terminated() const override { return terminated_.load(); }
    // Exits with 143 when exits_on_terminate was set, otherwise only counts.
    void terminate() override;

    void emit(const std::string &text);
    // First call wins.
    void finish(int exit_code);

    int terminate_requests() const { return terminate_requests_.load(); }

private:
    const int process_id_;
    const host::ProcessListener listener_;
    const bool exits_on_terminate_;
    std::mutex mutex_;
    std::atomic<bool> terminated_{false};
    std::atomic<int> terminate_requests_{0};
};

class FakeTestResultSource : public host::TestResultSource {
public:
    // tree is published when the process terminates, after empty_reads
    // further reads of an empty root.
    FakeTestResultSource(const host::TestTreeNode &tree, int empty_reads);

    void on_process_text(const std::string &text) override;
    void on_process_terminated(int exit_code) override;
    host::TestTreeNode read_tree() override;

    int read_count() const { return read_count_.load(); }
    std::string received_text();

private:
    std::mutex mutex_;
    const host::TestTreeNode tree_;
    int empty_reads_left_;
    bool terminated_ = false;
    std::string text_;
    std::atomic<int> read_count_{0};
};

class FakeDebugSession : public host::DebugSession {
public:
    FakeDebugSession(const std::string &id, const std::string &name);

    std::string name() const override { return name_; }
    std::string id() const override { return id_; }
    bool is_active() const override { return active.load(); }
    bool is_suspended() const override { return suspended.load(); }
    host::SourcePosition current_position() const override;

    void pause() override;
    void resume() override;
    void step_over() override;
    void step_into() override;
    void step_out() override;
    void stop() override;

    bool has_evaluator() const override { return evaluator_available.load(); }

    void evaluate(const std::string &expression, const host::EvaluationCallback &callback) override;
    // Delivered in chunks of two, the last one flagged.
    void compute_stack_frames(const host::StackFrameSink &sink) override;
    void compute_variables(int frame_index, const host::VariableSink &sink) override;

    std::atomic<bool> active{true};
    std::atomic<bool> suspended{false};
    std::atomic<bool> evaluator_available{true};
    // Children enumeration never sends last = true.
    std::atomic<bool> withhold_last_chunk{false};
    std::atomic<int> step_count{0};

    std::vector<host::StackFrameInfo> frames;
    std::vector<host::VariableInfo> variables;
    // Expression -> value; anything else is an evaluation error.
    std::map<std::string, host::VariableInfo> values;
    host::SourcePosition position;

private:
    const std::string id_;
    const std::string name_;
};

class FakeDebugger : public host::Debugger {
public:
    std::shared_ptr<host::DebugSession> current_session() override;
    std::vector<std::shared_ptr<host::DebugSession>> sessions() override;

    void start_session(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                       std::function<void(const host::SessionStart &start)> on_started) override;

    std::vector<host::LineBreakpoint> breakpoints() override;
    host::BreakpointChange set_breakpoint(const std::string &file, int line, const std::string &condition) override;
    host::BreakpointChange remove_breakpoint(const std::string &file, int line) override;

    // Adds a session that is already suspended at file:line.
    std::shared_ptr<FakeDebugSession> add_suspended_session(const std::string &name, const std::string &file,
                                                            int line);

    // Non-empty: start_session fails with this message.
    std::string start_error;

private:
    std::mutex mutex_;
    std::vector<std::shared_ptr<FakeDebugSession>> sessions_;
    std::vector<host::LineBreakpoint> breakpoints_;
    int next_session_ = 1;
    int next_breakpoint_ = 1;
};

class FakeHost : public host::Host {
public:
    FakeHost();
    ~FakeHost() override;

    host::ApplicationContext &application_context() override { return context_; }

    std::optional<host::ProjectInfo> find_project(const std::string &project_reference) override;
    std::vector<host::ProjectInfo> list_projects() override;
    std::vector<host::RunConfiguration> list_run_configurations(const host::ProjectInfo &project) override;

    host::LaunchResult launch(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                              const host::ProcessListener &listener) override;
    void build(const host::ProjectInfo &project, bool incremental,
               std::function<void(const host::BuildOutcome &outcome)> on_finished) override;
    host::TestLaunch prepare_tests(const host::ProjectInfo &project, const std::string &pattern) override;
    bool is_activity_in_progress(const host::ProjectInfo &project, host::OperationClass operation_class) override;

    host::Debugger *debugger() override { return debugger_enabled ? &fake_debugger : nullptr; }

    std::shared_ptr<FakeProcess> process(size_t index);
    size_t process_count();
    std::shared_ptr<FakeTestResultSource> last_results();
    std::string last_pattern();

    // Scripting. Set before the operations that use them.
    std::vector<host::ProjectInfo> projects;
    std::vector<host::RunConfiguration> configurations;
    // Non-empty: launch fails with this message.
    std::string launch_error;
    // Called on the application context right after a process was created.
    std::function<void(FakeProcess &process)> on_launch;
    bool processes_exit_on_terminate = true;

    std::chrono::milliseconds build_duration{0};
    // The build callback is never called.
    bool build_hangs = false;
    host::BuildOutcome build_outcome;
    std::atomic<int> builds_started{0};
    std::atomic<int> max_concurrent_builds{0};

    std::string prepare_error;
    // prepare_tests blocks the application context this long.
    std::chrono::milliseconds prepare_duration{0};
    host::TestTreeNode test_tree;
    int empty_tree_reads = 0;

    std::atomic<bool> external_build_active{false};
    std::atomic<bool> external_test_active{false};

    bool debugger_enabled = true;
    FakeDebugger fake_debugger;

private:
    host::ApplicationContext context_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<FakeProcess>> processes_;
    std::vector<std::thread> build_threads_;
    std::atomic<int> running_builds_{0};
    std::shared_ptr<FakeTestResultSource> last_results_;
    std::string last_pattern_;
    int next_process_id_ = 1000;
};

// Project "demo" at /work/demo with run configurations "server" and "tool".
void add_demo_project(FakeHost &host);

// Leaf of a result tree.
host::TestTreeNode make_leaf(const std::string &name, host::TestOutcome outcome,
                             const std::string &diagnostic_text = "");

// Suite node named suite_name holding leaves.
host::TestTreeNode make_suite(const std::string &suite_name, const std::vector<host::TestTreeNode> &leaves);

// Polls condition every 10 ms until it holds or timeout elapses.
bool wait_until(const std::function<bool()> &condition, std::chrono::milliseconds timeout);

} // namespace fake_host

#endif // DEVBRIDGE_TESTS_FAKE_HOST_HPP
