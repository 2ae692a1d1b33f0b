// Tests for the synchronous debug facade: preconditions, multi-part
// children callbacks, evaluation and breakpoints against the fake debugger.

#include "core/debug_facade.hpp"
#include "fake_host.hpp"

#include <iostream>
#include <string>

namespace test_debug_facade {

using namespace std::chrono_literals;

static bridge_core::DebugTimeouts short_timeouts() {
    bridge_core::DebugTimeouts timeouts;
    timeouts.call = 300ms;
    timeouts.evaluate = 300ms;
    return timeouts;
}

static std::shared_ptr<fake_host::FakeDebugSession> suspended_session(fake_host::FakeHost &host) {
    auto session = host.fake_debugger.add_suspended_session("server", "/work/demo/main.cpp", 12);
    for (int index = 0; index < 3; index++) {
        host::StackFrameInfo frame;
        frame.index = index;
        frame.function_name = "frame" + std::to_string(index);
        frame.file = "/work/demo/main.cpp";
        frame.line = 12 + index;
        session->frames.push_back(frame);
    }
    for (int index = 0; index < 5; index++) {
        host::VariableInfo variable;
        variable.name = "v" + std::to_string(index);
        variable.value = std::to_string(index * 10);
        variable.type = "int";
        session->variables.push_back(variable);
    }
    host::VariableInfo sum;
    sum.name = "a + b";
    sum.value = "7";
    sum.type = "int";
    session->values["a + b"] = sum;
    return session;
}

// Test: Without a session every call fails fast with NoActiveDebugSession.
static bool test_no_session() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());

    bool success = facade.pause().error.kind == bridge_core::ErrorKind::NoActiveDebugSession &&
                   facade.resume().error.kind == bridge_core::ErrorKind::NoActiveDebugSession &&
                   facade.evaluate("x").error.kind == bridge_core::ErrorKind::NoActiveDebugSession &&
                   facade.stack().error.kind == bridge_core::ErrorKind::NoActiveDebugSession &&
                   facade.variables(0).error.kind == bridge_core::ErrorKind::NoActiveDebugSession;

    if (success) {
        std::cout << "  OK: Calls without a session fail with NoActiveDebugSession" << std::endl;
    } else {
        std::cout << "  FAIL: Missing session not reported" << std::endl;
    }
    return success;
}

// Test: A running session rejects suspended-only calls without dispatching.
static bool test_not_suspended() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    auto session = suspended_session(host);
    session->suspended = false;

    bridge_core::DebugStepResult step = facade.step_over();
    bridge_core::DebugStackResult stack = facade.stack();
    bool success = step.error.kind == bridge_core::ErrorKind::SessionNotSuspended &&
                   stack.error.kind == bridge_core::ErrorKind::SessionNotSuspended &&
                   stack.session_name == "server" && session->step_count.load() == 0 &&
                   facade.evaluate("a + b").error.kind == bridge_core::ErrorKind::SessionNotSuspended;

    if (success) {
        std::cout << "  OK: Running session rejects steps, stack and evaluate" << std::endl;
    } else {
        std::cout << "  FAIL: Step error " << bridge_core::error_kind_name(step.error.kind) << std::endl;
    }
    return success;
}

// Test: pause, steps and resume reach the session.
static bool test_stepping() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    auto session = suspended_session(host);

    bridge_core::DebugStepResult over = facade.step_over();
    bridge_core::DebugStepResult into = facade.step_into();
    bridge_core::DebugStepResult resumed = facade.resume();
    bool running_after_resume = !session->suspended.load();
    bridge_core::DebugStepResult paused = facade.pause();

    bool success = over.success && over.action == "step_over" && into.success && resumed.success &&
                   running_after_resume && paused.success && session->suspended.load() &&
                   session->step_count.load() == 2 && session->position.line == 13;

    if (success) {
        std::cout << "  OK: Steps, resume and pause are dispatched" << std::endl;
    } else {
        std::cout << "  FAIL: Step count " << session->step_count.load() << std::endl;
    }
    return success;
}

// Test: Chunked stack frames and variables are collected until last.
static bool test_children_collected() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    suspended_session(host);

    bridge_core::DebugStackResult stack = facade.stack();
    bridge_core::DebugVariablesResult variables = facade.variables(0);
    bool success = stack.success && stack.frames.size() == 3 && stack.frames[2].function_name == "frame2" &&
                   variables.success && variables.variables.size() == 5 && variables.variables[4].value == "40";

    if (success) {
        std::cout << "  OK: Chunked frames and variables are collected" << std::endl;
    } else {
        std::cout << "  FAIL: " << stack.frames.size() << " frames, " << variables.variables.size()
                  << " variables" << std::endl;
    }
    return success;
}

// Test: A children enumeration that never finishes times out with partial data.
static bool test_children_timeout() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    auto session = suspended_session(host);
    session->withhold_last_chunk = true;

    auto started = std::chrono::steady_clock::now();
    bridge_core::DebugStackResult stack = facade.stack();
    auto elapsed = std::chrono::steady_clock::now() - started;
    bool success = !stack.success && stack.error.kind == bridge_core::ErrorKind::OperationTimeout &&
                   stack.frames.size() == 3 && elapsed < 2000ms;

    if (success) {
        std::cout << "  OK: Unfinished enumeration times out with partial frames" << std::endl;
    } else {
        std::cout << "  FAIL: Stack error " << bridge_core::error_kind_name(stack.error.kind) << std::endl;
    }
    return success;
}

// Test: Variables of a missing frame report the debugger error.
static bool test_variables_error() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    suspended_session(host);

    bridge_core::DebugVariablesResult result = facade.variables(9);
    bool success = !result.success && result.error.kind == bridge_core::ErrorKind::DebuggerError &&
                   result.error.message.find("out of range") != std::string::npos;

    if (success) {
        std::cout << "  OK: Debugger errors during enumeration are reported" << std::endl;
    } else {
        std::cout << "  FAIL: Variables error " << result.error.message << std::endl;
    }
    return success;
}

// Test: Evaluation results, evaluation errors and a missing evaluator.
static bool test_evaluate() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    auto session = suspended_session(host);

    bridge_core::DebugEvaluateResult value = facade.evaluate("a + b");
    bridge_core::DebugEvaluateResult unknown = facade.evaluate("nope");
    session->evaluator_available = false;
    bridge_core::DebugEvaluateResult unavailable = facade.evaluate("a + b");

    bool success = value.success && value.value.value == "7" && value.value.type == "int" &&
                   unknown.error.kind == bridge_core::ErrorKind::DebuggerError &&
                   unavailable.error.kind == bridge_core::ErrorKind::EvaluatorUnavailable;

    if (success) {
        std::cout << "  OK: Evaluate returns values and typed errors" << std::endl;
    } else {
        std::cout << "  FAIL: Evaluate returned " << value.value.value << std::endl;
    }
    return success;
}

// Test: Sessions are listed with their position; start goes through the debugger.
static bool test_sessions_and_start() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());
    suspended_session(host);

    bridge_core::DebugStartResult started = facade.start("tool", "");
    bridge_core::DebugStartResult unknown = facade.start("missing", "");
    bridge_core::DebugSessionsResult sessions = facade.sessions();

    bool success = started.success && started.session_name == "tool" &&
                   unknown.error.kind == bridge_core::ErrorKind::ConfigurationNotFound && sessions.success &&
                   sessions.sessions.size() == 2 && sessions.sessions[0].suspended &&
                   sessions.sessions[0].current_line == 12 && sessions.sessions[0].project_name == "demo";

    if (success) {
        std::cout << "  OK: Sessions are listed and started" << std::endl;
    } else {
        std::cout << "  FAIL: " << sessions.sessions.size() << " sessions listed" << std::endl;
    }
    return success;
}

// Test: A failed session start is SessionStartFailed.
static bool test_start_failure() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host.fake_debugger.start_error = "gdb not found";
    bridge_core::DebugFacade facade(host, short_timeouts());

    bridge_core::DebugStartResult started = facade.start("tool", "");
    bool success = !started.success && started.error.kind == bridge_core::ErrorKind::SessionStartFailed &&
                   started.error.message == "gdb not found";

    if (success) {
        std::cout << "  OK: Failed start is SessionStartFailed" << std::endl;
    } else {
        std::cout << "  FAIL: Start error " << started.error.message << std::endl;
    }
    return success;
}

// Test: Breakpoints are set, updated, listed and removed.
static bool test_breakpoints() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::DebugFacade facade(host, short_timeouts());

    bridge_core::BreakpointChangeResult first = facade.set_breakpoint("main.cpp", 10, "");
    bridge_core::BreakpointChangeResult updated = facade.set_breakpoint("main.cpp", 10, "i > 3");
    bridge_core::BreakpointListResult listed = facade.list_breakpoints();
    bridge_core::BreakpointChangeResult removed = facade.remove_breakpoint("main.cpp", 10);
    bridge_core::BreakpointChangeResult missing = facade.remove_breakpoint("main.cpp", 10);

    bool success = first.success && updated.success && updated.breakpoint.id == first.breakpoint.id &&
                   listed.breakpoints.size() == 1 && listed.breakpoints[0].condition == "i > 3" && removed.success &&
                   missing.error.kind == bridge_core::ErrorKind::BreakpointNotFound;

    if (success) {
        std::cout << "  OK: Breakpoints are set, updated, listed and removed" << std::endl;
    } else {
        std::cout << "  FAIL: Breakpoint flow: " << missing.error.message << std::endl;
    }
    return success;
}

// Test: A host without debugger reports it instead of failing obscurely.
static bool test_no_debugger() {
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host.debugger_enabled = false;
    bridge_core::DebugFacade facade(host, short_timeouts());

    bridge_core::DebugStartResult started = facade.start("tool", "");
    bridge_core::BreakpointChangeResult breakpoint = facade.set_breakpoint("main.cpp", 1, "");
    bridge_core::DebugSessionsResult sessions = facade.sessions();
    bool success = started.error.kind == bridge_core::ErrorKind::SessionStartFailed &&
                   breakpoint.error.kind == bridge_core::ErrorKind::DebuggerError && sessions.success &&
                   sessions.sessions.empty();

    if (success) {
        std::cout << "  OK: Missing debugger is reported" << std::endl;
    } else {
        std::cout << "  FAIL: Missing debugger not reported" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_no_session();
    all_passed &= test_not_suspended();
    all_passed &= test_stepping();
    all_passed &= test_children_collected();
    all_passed &= test_children_timeout();
    all_passed &= test_variables_error();
    all_passed &= test_evaluate();
    all_passed &= test_sessions_and_start();
    all_passed &= test_start_failure();
    all_passed &= test_breakpoints();
    all_passed &= test_no_debugger();
    return all_passed;
}

} // namespace test_debug_facade
