#ifndef DEVBRIDGE_HOST_ABI_HPP
#define DEVBRIDGE_HOST_ABI_HPP

// Host environment abstraction interface.
// A host (the local process host, or a test double) implements these classes.
// This keeps the bridge core decoupled from how projects are built, tested,
// run and debugged.
//
// Threading: methods marked "application context only" must be called from a
// task running on application_context(). Callbacks may arrive on any thread.

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "host/application_context.hpp"

namespace host {

enum class OperationClass {
    Build,
    Test,
};

struct ProjectInfo {
    std::string name;
    std::string base_path;
};

// A named, launchable process definition.
struct RunConfiguration {
    std::string name;
    // Executable followed by its arguments.
    std::vector<std::string> command;
    std::string working_directory;
    std::map<std::string, std::string> environment;
};

// Output and termination of a launched process. Text arrives as valid UTF-8
// in production order; on_terminated is delivered once, after the last text.
struct ProcessListener {
    std::function<void(const std::string &text)> on_text;
    std::function<void(int exit_code)> on_terminated;
};

class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int process_id() const = 0;
    virtual bool is_terminated() const = 0;

    // Requests termination. Idempotent; returns without waiting.
    virtual void terminate() = 0;
};

struct LaunchResult {
    bool success = false;
    std::shared_ptr<ProcessHandle> process;
    std::string error_message;
};

struct BuildMessage {
    std::string file;
    int line = 0;
    int column = 0;
    std::string message;
};

struct BuildOutcome {
    bool aborted = false;
    std::vector<BuildMessage> errors;
    std::vector<BuildMessage> warnings;
};

enum class TestOutcome {
    Passed,
    Ignored,
    Defect,
    // Started but no outcome reported (yet).
    Running,
};

// Node of the result tree. Leaves are individual test cases; other nodes are
// suites. Leaf names are either "method(Class)" or the bare method name with
// the class as the parent suite.
struct TestTreeNode {
    std::string name;
    bool is_leaf = false;
    TestOutcome outcome = TestOutcome::Running;
    std::string error_message;
    // Stack trace or other captured diagnostics of a defect.
    std::string diagnostic_text;
    long duration_milliseconds = 0;
    std::vector<TestTreeNode> children;
};

// The host's own test reporting for one launch. It is fed with the test
// process output and populates its tree asynchronously.
class TestResultSource {
public:
    virtual ~TestResultSource() = default;

    virtual void on_process_text(const std::string &text) = 0;
    virtual void on_process_terminated(int exit_code) = 0;

    // Application context only. Returns an empty root while nothing has been
    // reported.
    virtual TestTreeNode read_tree() = 0;
};

struct TestLaunch {
    bool success = false;
    RunConfiguration configuration;
    std::shared_ptr<TestResultSource> results;
    std::string error_message;
};

// --- Debugger ---

struct SourcePosition {
    std::string file;
    // 1-based; 0 = unknown.
    int line = 0;
};

struct StackFrameInfo {
    int index = 0;
    std::string function_name;
    std::string file;
    int line = 0;
};

struct VariableInfo {
    std::string name;
    std::string value;
    std::string type;
    bool has_children = false;
};

// Multi-part children callbacks: add_* may be called several times, the last
// call with last = true. error_occurred ends the enumeration instead.
struct StackFrameSink {
    std::function<void(const std::vector<StackFrameInfo> &frames, bool last)> add_frames;
    std::function<void(const std::string &message)> error_occurred;
};

struct VariableSink {
    std::function<void(const std::vector<VariableInfo> &variables, bool last)> add_variables;
    std::function<void(const std::string &message)> error_occurred;
};

struct EvaluationCallback {
    std::function<void(const VariableInfo &value)> evaluated;
    std::function<void(const std::string &message)> error_occurred;
};

class DebugSession {
public:
    virtual ~DebugSession() = default;

    virtual std::string name() const = 0;
    virtual std::string id() const = 0;
    virtual bool is_active() const = 0;
    virtual bool is_suspended() const = 0;
    virtual SourcePosition current_position() const = 0;

    // Application context only. Requests; completion of the step itself is
    // observed through is_suspended().
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void step_over() = 0;
    virtual void step_into() = 0;
    virtual void step_out() = 0;
    virtual void stop() = 0;

    virtual bool has_evaluator() const = 0;

    // Application context only. Results arrive through the callbacks.
    virtual void evaluate(const std::string &expression, const EvaluationCallback &callback) = 0;
    virtual void compute_stack_frames(const StackFrameSink &sink) = 0;
    virtual void compute_variables(int frame_index, const VariableSink &sink) = 0;
};

struct LineBreakpoint {
    std::string id;
    std::string file;
    // 1-based.
    int line = 0;
    bool enabled = true;
    std::string condition;
};

struct BreakpointChange {
    bool success = false;
    // Set when removal found nothing at the location.
    bool not_found = false;
    LineBreakpoint breakpoint;
    std::string error_message;
};

struct SessionStart {
    bool success = false;
    std::shared_ptr<DebugSession> session;
    std::string error_message;
};

class Debugger {
public:
    virtual ~Debugger() = default;

    // Most recently started session that is still active, or null.
    virtual std::shared_ptr<DebugSession> current_session() = 0;
    virtual std::vector<std::shared_ptr<DebugSession>> sessions() = 0;

    // Application context only. on_started is called exactly once, from any thread.
    virtual void start_session(const ProjectInfo &project, const RunConfiguration &configuration,
                               std::function<void(const SessionStart &start)> on_started) = 0;

    virtual std::vector<LineBreakpoint> breakpoints() = 0;

    // Application context only. Also applied to live sessions.
    virtual BreakpointChange set_breakpoint(const std::string &file, int line, const std::string &condition) = 0;
    virtual BreakpointChange remove_breakpoint(const std::string &file, int line) = 0;
};

// --- Host ---

class Host {
public:
    virtual ~Host() = default;

    virtual ApplicationContext &application_context() = 0;

    // Matches base path, base path suffix or name (case-insensitive); an empty
    // or unmatched reference falls back to the first open project. Any thread.
    virtual std::optional<ProjectInfo> find_project(const std::string &project_reference) = 0;
    virtual std::vector<ProjectInfo> list_projects() = 0;

    virtual std::vector<RunConfiguration> list_run_configurations(const ProjectInfo &project) = 0;

    // Application context only. The listener is attached before the process
    // starts, so no early output or termination is missed.
    virtual LaunchResult launch(const ProjectInfo &project, const RunConfiguration &configuration,
                                const ProcessListener &listener) = 0;

    // Application context only. on_finished is called exactly once, from any thread.
    virtual void build(const ProjectInfo &project, bool incremental,
                       std::function<void(const BuildOutcome &outcome)> on_finished) = 0;

    // Application context only. Builds the test configuration for a pattern
    // ("Class#method", "Class", "prefix*") and its result source.
    virtual TestLaunch prepare_tests(const ProjectInfo &project, const std::string &pattern) = 0;

    // True while an instance of the class is active, including ones started
    // outside the bridge. Any thread.
    virtual bool is_activity_in_progress(const ProjectInfo &project, OperationClass operation_class) = 0;

    // Null when the host has no debugger.
    virtual Debugger *debugger() = 0;
};

} // namespace host

#endif // DEVBRIDGE_HOST_ABI_HPP
