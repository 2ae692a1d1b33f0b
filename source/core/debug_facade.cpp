#include "core/debug_facade.hpp"
#include "core/completion_bridge.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <mutex>

namespace bridge_core {

namespace {

const char NOT_SUSPENDED_MESSAGE[] = "Session is not suspended";
const char NOT_PAUSED_AT_BREAKPOINT_MESSAGE[] =
    "Debug session is not suspended. The program must be paused at a breakpoint.";

// Items delivered by a multi-part children callback.
template <typename Item>
struct ChildrenCollector {
    std::mutex mutex;
    std::vector<Item> items;

    void add(const std::vector<Item> &more) {
        std::lock_guard<std::mutex> lock(mutex);
        items.insert(items.end(), more.begin(), more.end());
    }

    std::vector<Item> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return items;
    }
};

// How a children enumeration or an evaluation ended.
struct CallbackEnd {
    bool error = false;
    std::string message;
    host::VariableInfo value;
};

CallbackEnd error_end(const std::string &message) {
    CallbackEnd end;
    end.error = true;
    end.message = message;
    return end;
}

} // namespace

DebugFacade::DebugFacade(host::Host &host, const DebugTimeouts &timeouts) : host_(host), timeouts_(timeouts) {}

std::shared_ptr<host::DebugSession> DebugFacade::require_session(bool require_suspended,
                                                                 const std::string &not_suspended_message,
                                                                 BridgeError &error) {
    host::Debugger *debugger = host_.debugger();
    std::shared_ptr<host::DebugSession> session = debugger ? debugger->current_session() : nullptr;
    if (!session) {
        error = make_error(ErrorKind::NoActiveDebugSession, "No active debug session");
        return nullptr;
    }
    if (require_suspended && !session->is_suspended()) {
        error = make_error(ErrorKind::SessionNotSuspended, not_suspended_message);
        return nullptr;
    }
    return session;
}

DebugSessionsResult DebugFacade::sessions() {
    DebugSessionsResult result;
    std::optional<host::ProjectInfo> project = host_.find_project("");
    if (!project) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }

    host::Debugger *debugger = host_.debugger();
    if (debugger != nullptr) {
        for (const auto &session : debugger->sessions()) {
            DebugSessionSummary summary;
            summary.session_id = session->id();
            summary.session_name = session->name();
            summary.suspended = session->is_suspended();
            host::SourcePosition position = session->current_position();
            summary.current_file = position.file;
            summary.current_line = position.line;
            summary.project_name = project->name;
            result.sessions.push_back(summary);
        }
    }
    result.success = true;
    return result;
}

DebugStartResult DebugFacade::start(const std::string &configuration_name, const std::string &project_reference) {
    DebugStartResult result;

    std::optional<host::ProjectInfo> project = host_.find_project(project_reference);
    if (!project) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }

    if (host_.debugger() == nullptr) {
        result.error = make_error(ErrorKind::SessionStartFailed, "Debugging is not available for this host");
        return result;
    }

    std::vector<host::RunConfiguration> configurations = host_.list_run_configurations(*project);
    auto match = std::find_if(configurations.begin(), configurations.end(),
                              [&configuration_name](const host::RunConfiguration &configuration) {
                                  return configuration.name == configuration_name;
                              });
    if (match == configurations.end()) {
        result.error = make_error(ErrorKind::ConfigurationNotFound,
                                  "Run configuration '" + configuration_name + "' not found");
        return result;
    }

    return start_configuration(*project, *match, timeouts_.evaluate);
}

DebugStartResult DebugFacade::start_configuration(const host::ProjectInfo &project,
                                                  const host::RunConfiguration &configuration,
                                                  std::chrono::milliseconds timeout) {
    DebugStartResult result;
    host::Debugger *debugger = host_.debugger();
    if (debugger == nullptr) {
        result.error = make_error(ErrorKind::SessionStartFailed, "Debugging is not available for this host");
        return result;
    }

    host::ProjectInfo project_info = project;
    TimeoutPolicy policy;
    policy.timeout = std::min(timeout, timeouts_.evaluate);
    policy.operation_name = "debug_start " + configuration.name;

    BridgeOutcome<host::SessionStart> outcome = run_on_application_context<host::SessionStart>(
        host_.application_context(),
        [debugger, project_info, configuration](const CompletionSignal<host::SessionStart> &signal) {
            debugger->start_session(project_info, configuration,
                                    [signal](const host::SessionStart &start) { signal.complete(start); });
        },
        policy);

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Timed out starting debug session");
        return result;
    }
    if (!outcome.value.success || !outcome.value.session) {
        result.error = make_error(ErrorKind::SessionStartFailed, outcome.value.error_message);
        return result;
    }

    result.success = true;
    result.session_id = outcome.value.session->id();
    result.session_name = outcome.value.session->name();
    debug_log::log("Debug session started: " + result.session_name);
    return result;
}

DebugStepResult DebugFacade::run_step(const std::string &action, bool require_suspended,
                                      const std::function<void(host::DebugSession &)> &call,
                                      const std::string &success_message) {
    DebugStepResult result;
    result.action = action;

    std::shared_ptr<host::DebugSession> session =
        require_session(require_suspended, NOT_SUSPENDED_MESSAGE, result.error);
    if (!session) {
        return result;
    }

    TimeoutPolicy policy;
    policy.timeout = timeouts_.call;
    policy.operation_name = "debug_" + action;

    BridgeOutcome<bool> outcome = run_on_application_context<bool>(
        host_.application_context(),
        [session, call](const CompletionSignal<bool> &signal) {
            call(*session);
            signal.complete(true);
        },
        policy);

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Timed out requesting " + action);
        return result;
    }

    result.success = true;
    result.message = success_message;
    return result;
}

DebugStepResult DebugFacade::pause() {
    return run_step("pause", false, [](host::DebugSession &session) { session.pause(); }, "Pause requested");
}

DebugStepResult DebugFacade::resume() {
    return run_step("resume", true, [](host::DebugSession &session) { session.resume(); }, "Execution resumed");
}

DebugStepResult DebugFacade::step_over() {
    return run_step("step_over", true, [](host::DebugSession &session) { session.step_over(); }, "Stepped over");
}

DebugStepResult DebugFacade::step_into() {
    return run_step("step_into", true, [](host::DebugSession &session) { session.step_into(); }, "Stepped into");
}

DebugStepResult DebugFacade::step_out() {
    return run_step("step_out", true, [](host::DebugSession &session) { session.step_out(); }, "Stepped out");
}

DebugEvaluateResult DebugFacade::evaluate(const std::string &expression) {
    DebugEvaluateResult result;
    result.expression = expression;

    std::shared_ptr<host::DebugSession> session = require_session(true, NOT_SUSPENDED_MESSAGE, result.error);
    if (!session) {
        return result;
    }
    if (!session->has_evaluator()) {
        result.error = make_error(ErrorKind::EvaluatorUnavailable, "Evaluator not available for current frame");
        return result;
    }

    TimeoutPolicy policy;
    policy.timeout = timeouts_.evaluate;
    policy.operation_name = "debug_evaluate";

    BridgeOutcome<CallbackEnd> outcome = run_on_application_context<CallbackEnd>(
        host_.application_context(),
        [session, expression](const CompletionSignal<CallbackEnd> &signal) {
            host::EvaluationCallback callback;
            callback.evaluated = [signal](const host::VariableInfo &value) {
                CallbackEnd end;
                end.value = value;
                signal.complete(end);
            };
            callback.error_occurred = [signal](const std::string &message) { signal.complete(error_end(message)); };
            session->evaluate(expression, callback);
        },
        policy);

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Evaluation timed out");
        return result;
    }
    if (outcome.value.error) {
        result.error = make_error(ErrorKind::DebuggerError, outcome.value.message);
        return result;
    }

    result.success = true;
    result.value = outcome.value.value;
    return result;
}

DebugStackResult DebugFacade::stack() {
    DebugStackResult result;

    std::shared_ptr<host::DebugSession> session =
        require_session(true, NOT_PAUSED_AT_BREAKPOINT_MESSAGE, result.error);
    if (!session) {
        host::Debugger *debugger = host_.debugger();
        std::shared_ptr<host::DebugSession> current = debugger ? debugger->current_session() : nullptr;
        if (current) {
            result.session_name = current->name();
        }
        return result;
    }
    result.session_name = session->name();
    result.suspended = true;

    auto collector = std::make_shared<ChildrenCollector<host::StackFrameInfo>>();
    TimeoutPolicy policy;
    policy.timeout = timeouts_.call;
    policy.operation_name = "debug_stack";

    BridgeOutcome<CallbackEnd> outcome = run_on_application_context<CallbackEnd>(
        host_.application_context(),
        [session, collector](const CompletionSignal<CallbackEnd> &signal) {
            host::StackFrameSink sink;
            sink.add_frames = [collector, signal](const std::vector<host::StackFrameInfo> &frames, bool last) {
                collector->add(frames);
                if (last) {
                    signal.complete(CallbackEnd());
                }
            };
            sink.error_occurred = [signal](const std::string &message) { signal.complete(error_end(message)); };
            session->compute_stack_frames(sink);
        },
        policy);

    // Partial frames are still reported alongside a timeout or debugger error.
    result.frames = collector->snapshot();

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Timed out waiting for stack frames");
        return result;
    }
    if (outcome.value.error) {
        result.error = make_error(ErrorKind::DebuggerError, outcome.value.message);
        return result;
    }
    result.success = true;
    return result;
}

DebugVariablesResult DebugFacade::variables(int frame_index) {
    DebugVariablesResult result;
    result.frame_index = frame_index;

    std::shared_ptr<host::DebugSession> session = require_session(true, NOT_SUSPENDED_MESSAGE, result.error);
    if (!session) {
        return result;
    }
    result.session_name = session->name();

    auto collector = std::make_shared<ChildrenCollector<host::VariableInfo>>();
    TimeoutPolicy policy;
    policy.timeout = timeouts_.evaluate;
    policy.operation_name = "debug_variables";

    BridgeOutcome<CallbackEnd> outcome = run_on_application_context<CallbackEnd>(
        host_.application_context(),
        [session, collector, frame_index](const CompletionSignal<CallbackEnd> &signal) {
            host::VariableSink sink;
            sink.add_variables = [collector, signal](const std::vector<host::VariableInfo> &variables, bool last) {
                collector->add(variables);
                if (last) {
                    signal.complete(CallbackEnd());
                }
            };
            sink.error_occurred = [signal](const std::string &message) { signal.complete(error_end(message)); };
            session->compute_variables(frame_index, sink);
        },
        policy);

    result.variables = collector->snapshot();

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Timed out waiting for variables");
        return result;
    }
    if (outcome.value.error) {
        result.error = make_error(ErrorKind::DebuggerError, outcome.value.message);
        return result;
    }
    result.success = true;
    return result;
}

BreakpointListResult DebugFacade::list_breakpoints() {
    BreakpointListResult result;
    if (!host_.find_project("")) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }
    host::Debugger *debugger = host_.debugger();
    if (debugger != nullptr) {
        result.breakpoints = debugger->breakpoints();
    }
    result.success = true;
    return result;
}

BreakpointChangeResult DebugFacade::set_breakpoint(const std::string &file, int line, const std::string &condition) {
    BreakpointChangeResult result;
    result.breakpoint.file = file;
    result.breakpoint.line = line;
    result.breakpoint.condition = condition;

    if (!host_.find_project("")) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }
    host::Debugger *debugger = host_.debugger();
    if (debugger == nullptr) {
        result.error = make_error(ErrorKind::DebuggerError, "Debugging is not available for this host");
        return result;
    }

    TimeoutPolicy policy;
    policy.timeout = timeouts_.evaluate;
    policy.operation_name = "breakpoint_set";

    BridgeOutcome<host::BreakpointChange> outcome = run_on_application_context<host::BreakpointChange>(
        host_.application_context(),
        [debugger, file, line, condition](const CompletionSignal<host::BreakpointChange> &signal) {
            signal.complete(debugger->set_breakpoint(file, line, condition));
        },
        policy);

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Timeout setting breakpoint");
        return result;
    }
    if (!outcome.value.success) {
        result.error = make_error(ErrorKind::DebuggerError, outcome.value.error_message);
        return result;
    }

    result.success = true;
    result.breakpoint = outcome.value.breakpoint;
    result.message = "Breakpoint set at " + file + ":" + std::to_string(line);
    return result;
}

BreakpointChangeResult DebugFacade::remove_breakpoint(const std::string &file, int line) {
    BreakpointChangeResult result;
    result.breakpoint.file = file;
    result.breakpoint.line = line;

    if (!host_.find_project("")) {
        result.error = make_error(ErrorKind::NoProjectOpen, "No project open");
        return result;
    }
    host::Debugger *debugger = host_.debugger();
    if (debugger == nullptr) {
        result.error = make_error(ErrorKind::DebuggerError, "Debugging is not available for this host");
        return result;
    }

    TimeoutPolicy policy;
    policy.timeout = timeouts_.evaluate;
    policy.operation_name = "breakpoint_remove";

    BridgeOutcome<host::BreakpointChange> outcome = run_on_application_context<host::BreakpointChange>(
        host_.application_context(),
        [debugger, file, line](const CompletionSignal<host::BreakpointChange> &signal) {
            signal.complete(debugger->remove_breakpoint(file, line));
        },
        policy);

    if (!outcome.completed()) {
        result.error = bridge_failure(outcome, host_.application_context(), "Timeout removing breakpoint");
        return result;
    }
    if (outcome.value.not_found) {
        result.error = make_error(ErrorKind::BreakpointNotFound,
                                  "No breakpoint found at " + file + ":" + std::to_string(line));
        return result;
    }
    if (!outcome.value.success) {
        result.error = make_error(ErrorKind::DebuggerError, outcome.value.error_message);
        return result;
    }

    result.success = true;
    result.breakpoint = outcome.value.breakpoint;
    result.message = "Breakpoint removed at " + file + ":" + std::to_string(line);
    return result;
}

} // namespace bridge_core
