#ifndef DEVBRIDGE_DEBUG_FACADE_HPP
#define DEVBRIDGE_DEBUG_FACADE_HPP

// Synchronous wrappers around the host debugger.
// Preconditions (session exists, session suspended) are checked on the caller
// thread and fail without dispatching anything; the calls themselves run on
// the application context, each bounded by a short timeout.

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/bridge_errors.hpp"
#include "host/host_abi.hpp"

namespace bridge_core {

struct DebugTimeouts {
    // pause, resume, steps, stack frames
    std::chrono::milliseconds call{5000};
    // evaluate, variables, breakpoint changes, session start
    std::chrono::milliseconds evaluate{10000};
};

struct DebugSessionSummary {
    std::string session_id;
    std::string session_name;
    bool suspended = false;
    std::string current_file;
    int current_line = 0;
    std::string project_name;
};

struct DebugSessionsResult {
    bool success = false;
    std::vector<DebugSessionSummary> sessions;
    BridgeError error;
};

struct DebugStartResult {
    bool success = false;
    std::string session_id;
    std::string session_name;
    BridgeError error;
};

struct DebugStepResult {
    bool success = false;
    std::string action;
    std::string message;
    BridgeError error;
};

struct DebugStackResult {
    bool success = false;
    std::string session_name;
    bool suspended = false;
    std::vector<host::StackFrameInfo> frames;
    BridgeError error;
};

struct DebugVariablesResult {
    bool success = false;
    std::string session_name;
    int frame_index = 0;
    std::vector<host::VariableInfo> variables;
    BridgeError error;
};

struct DebugEvaluateResult {
    bool success = false;
    std::string expression;
    host::VariableInfo value;
    BridgeError error;
};

struct BreakpointListResult {
    bool success = false;
    std::vector<host::LineBreakpoint> breakpoints;
    BridgeError error;
};

struct BreakpointChangeResult {
    bool success = false;
    host::LineBreakpoint breakpoint;
    std::string message;
    BridgeError error;
};

class DebugFacade {
public:
    DebugFacade(host::Host &host, const DebugTimeouts &timeouts);

    DebugSessionsResult sessions();
    DebugStartResult start(const std::string &configuration_name, const std::string &project_reference);
    // Starts a configuration the caller already resolved, such as a prepared
    // test configuration. The wait is bounded by timeout and the evaluate timeout.
    DebugStartResult start_configuration(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                                         std::chrono::milliseconds timeout);

    // Requires a session only.
    DebugStepResult pause();
    // Require a suspended session.
    DebugStepResult resume();
    DebugStepResult step_over();
    DebugStepResult step_into();
    DebugStepResult step_out();

    DebugEvaluateResult evaluate(const std::string &expression);
    DebugStackResult stack();
    DebugVariablesResult variables(int frame_index);

    BreakpointListResult list_breakpoints();
    BreakpointChangeResult set_breakpoint(const std::string &file, int line, const std::string &condition);
    BreakpointChangeResult remove_breakpoint(const std::string &file, int line);

private:
    // Null with error set when the precondition fails.
    std::shared_ptr<host::DebugSession> require_session(bool require_suspended,
                                                        const std::string &not_suspended_message,
                                                        BridgeError &error);

    DebugStepResult run_step(const std::string &action, bool require_suspended,
                             const std::function<void(host::DebugSession &)> &call,
                             const std::string &success_message);

    host::Host &host_;
    const DebugTimeouts timeouts_;
};

} // namespace bridge_core

#endif // DEVBRIDGE_DEBUG_FACADE_HPP
