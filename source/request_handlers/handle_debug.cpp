#include "request/request_arguments.hpp"
#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/result_json.hpp"

#include <functional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Handlers for the synchronous debug facade.
// Sessions, start, pause/resume/steps, evaluate, stack and variables.

static json handle_debug_sessions(bridge_core::BridgeService &service, const json &) {
    bridge_core::DebugSessionsResult result = service.debugger().sessions();
    json sessions = json::array();
    for (const auto &session : result.sessions) {
        json entry;
        entry["sessionId"] = session.session_id;
        entry["sessionName"] = session.session_name;
        entry["isSuspended"] = session.suspended;
        if (!session.current_file.empty()) {
            entry["currentFile"] = session.current_file;
        }
        if (session.current_line > 0) {
            entry["currentLine"] = session.current_line;
        }
        entry["projectName"] = session.project_name;
        sessions.push_back(entry);
    }
    json payload;
    payload["sessions"] = sessions;
    return result_json::respond(result.success, result.error, payload);
}

static json handle_debug_start(bridge_core::BridgeService &service, const json &arguments) {
    std::string configuration_name;
    std::string project_reference;
    std::string error;
    if (!request_arguments::read_string(arguments, "configName", true, configuration_name, error) ||
        !request_arguments::read_string(arguments, "projectRef", false, project_reference, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::DebugStartResult result = service.debugger().start(configuration_name, project_reference);
    json payload;
    if (result.success) {
        payload["sessionId"] = result.session_id;
        payload["sessionName"] = result.session_name;
    }
    return result_json::respond(result.success, result.error, payload);
}

static json step_response(const bridge_core::DebugStepResult &result) {
    json payload;
    payload["action"] = result.action;
    if (!result.message.empty()) {
        payload["message"] = result.message;
    }
    return result_json::respond(result.success, result.error, payload);
}

static json handle_debug_pause(bridge_core::BridgeService &service, const json &) {
    return step_response(service.debugger().pause());
}

static json handle_debug_resume(bridge_core::BridgeService &service, const json &) {
    return step_response(service.debugger().resume());
}

static json handle_debug_step_over(bridge_core::BridgeService &service, const json &) {
    return step_response(service.debugger().step_over());
}

static json handle_debug_step_into(bridge_core::BridgeService &service, const json &) {
    return step_response(service.debugger().step_into());
}

static json handle_debug_step_out(bridge_core::BridgeService &service, const json &) {
    return step_response(service.debugger().step_out());
}

static json handle_debug_evaluate(bridge_core::BridgeService &service, const json &arguments) {
    std::string expression;
    std::string error;
    if (!request_arguments::read_string(arguments, "expression", true, expression, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::DebugEvaluateResult result = service.debugger().evaluate(expression);
    json payload;
    payload["expression"] = expression;
    if (result.success) {
        payload["result"] = result.value.value;
        if (!result.value.type.empty()) {
            payload["type"] = result.value.type;
        }
        payload["hasChildren"] = result.value.has_children;
    }
    return result_json::respond(result.success, result.error, payload);
}

static json handle_debug_stack(bridge_core::BridgeService &service, const json &) {
    bridge_core::DebugStackResult result = service.debugger().stack();
    json frames = json::array();
    for (const auto &frame : result.frames) {
        frames.push_back(result_json::stack_frame(frame));
    }
    json payload;
    if (!result.session_name.empty()) {
        payload["sessionName"] = result.session_name;
    }
    payload["isSuspended"] = result.suspended;
    payload["frames"] = frames;
    return result_json::respond(result.success, result.error, payload);
}

static json handle_debug_variables(bridge_core::BridgeService &service, const json &arguments) {
    int frame_index = 0;
    std::string error;
    if (!request_arguments::read_int(arguments, "frameIndex", false, 0, frame_index, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::DebugVariablesResult result = service.debugger().variables(frame_index);
    json variables = json::array();
    for (const auto &variable : result.variables) {
        variables.push_back(result_json::variable(variable));
    }
    json payload;
    if (!result.session_name.empty()) {
        payload["sessionName"] = result.session_name;
    }
    payload["frameIndex"] = frame_index;
    payload["variables"] = variables;
    return result_json::respond(result.success, result.error, payload);
}

static void register_step_operation(const char *name, const char *description,
                                    json (*handler)(bridge_core::BridgeService &, const json &)) {
    request_registry::register_operation({name, description, result_json::schema_object(), handler});
}

namespace handle_debug {

void register_operations() {
    request_registry::register_operation({
        "debug_sessions",
        "Active debug sessions with their suspended state and current position.",
        result_json::schema_object(),
        handle_debug_sessions
    });

    json start_schema = result_json::schema_object();
    result_json::add_property(start_schema, "configName", "string",
                              "Run configuration whose executable is debugged.");
    result_json::add_property(start_schema, "projectRef", "string",
                              "Project base path, path suffix or name. Defaults to the first project.");
    start_schema["required"] = json::array({"configName"});

    request_registry::register_operation({
        "debug_start",
        "Start a debug session for a run configuration with the current breakpoints installed.",
        start_schema,
        handle_debug_start
    });

    register_step_operation("debug_pause", "Suspend the current debug session.", handle_debug_pause);
    register_step_operation("debug_resume", "Resume the suspended current debug session.",
                            handle_debug_resume);
    register_step_operation("debug_step_over", "Step over the current line.", handle_debug_step_over);
    register_step_operation("debug_step_into", "Step into the call on the current line.",
                            handle_debug_step_into);
    register_step_operation("debug_step_out", "Run until the current function returns.",
                            handle_debug_step_out);

    json evaluate_schema = result_json::schema_object();
    result_json::add_property(evaluate_schema, "expression", "string",
                              "Expression evaluated in the current frame.");
    evaluate_schema["required"] = json::array({"expression"});

    request_registry::register_operation({
        "debug_evaluate",
        "Evaluate an expression in the suspended session.",
        evaluate_schema,
        handle_debug_evaluate
    });

    request_registry::register_operation({
        "debug_stack",
        "Stack frames of the suspended session, top frame first.",
        result_json::schema_object(),
        handle_debug_stack
    });

    json variables_schema = result_json::schema_object();
    result_json::add_property(variables_schema, "frameIndex", "integer", "Stack frame index (default 0).");

    request_registry::register_operation({
        "debug_variables",
        "Variables visible in a stack frame of the suspended session.",
        variables_schema,
        handle_debug_variables
    });
}

} // namespace handle_debug
