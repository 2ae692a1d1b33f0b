#include "request_handlers/result_json.hpp"
#include "request/response_builder.hpp"

namespace result_json {

json build_message(const host::BuildMessage &message, const char *severity) {
    json entry;
    entry["message"] = message.message;
    if (!message.file.empty()) {
        entry["file"] = message.file;
    }
    if (message.line > 0) {
        entry["line"] = message.line;
    }
    if (message.column > 0) {
        entry["column"] = message.column;
    }
    entry["severity"] = severity;
    return entry;
}

json build_messages(const std::vector<host::BuildMessage> &messages, const char *severity) {
    json entries = json::array();
    for (const auto &message : messages) {
        entries.push_back(build_message(message, severity));
    }
    return entries;
}

json build_result(const bridge_core::BuildRunResult &result) {
    json payload;
    payload["projectName"] = result.project_name;
    payload["errors"] = build_messages(result.errors, "ERROR");
    payload["warnings"] = build_messages(result.warnings, "WARNING");
    payload["timeMs"] = result.time_milliseconds;
    payload["aborted"] = result.aborted;
    return payload;
}

static json test_case(const bridge_core::TestCaseResult &test) {
    json entry;
    entry["name"] = test.name;
    entry["className"] = test.class_name;
    entry["methodName"] = test.method_name;
    entry["status"] = bridge_core::test_status_name(test.status);
    entry["timeMs"] = test.time_milliseconds;
    if (!test.message.empty()) {
        entry["message"] = test.message;
    }
    if (!test.stack_trace.empty()) {
        entry["stackTrace"] = test.stack_trace;
    }
    return entry;
}

json test_result(const bridge_core::TestRunResult &result) {
    json payload;
    payload["passed"] = result.passed;
    payload["failed"] = result.failed;
    payload["skipped"] = result.skipped;
    payload["timeMs"] = result.time_milliseconds;
    json tests = json::array();
    for (const auto &test : result.tests) {
        tests.push_back(test_case(test));
    }
    payload["tests"] = tests;
    if (!result.run_id.empty()) {
        payload["runId"] = result.run_id;
    }
    if (!result.message.empty()) {
        payload["message"] = result.message;
    }
    if (!result.debug_session_id.empty()) {
        payload["debugSessionId"] = result.debug_session_id;
    }
    return payload;
}

json run_summary(const bridge_core::RunSummary &summary) {
    json entry;
    entry["runId"] = summary.run_id;
    entry["configName"] = summary.configuration_name;
    entry["projectName"] = summary.project_name;
    entry["startTime"] = summary.start_time;
    entry["running"] = summary.running;
    if (summary.exit_code.has_value()) {
        entry["exitCode"] = summary.exit_code.value();
    }
    return entry;
}

json breakpoint(const host::LineBreakpoint &breakpoint) {
    json entry;
    entry["id"] = breakpoint.id;
    entry["file"] = breakpoint.file;
    entry["line"] = breakpoint.line;
    entry["enabled"] = breakpoint.enabled;
    if (!breakpoint.condition.empty()) {
        entry["condition"] = breakpoint.condition;
    }
    return entry;
}

json stack_frame(const host::StackFrameInfo &frame) {
    json entry;
    entry["index"] = frame.index;
    if (!frame.function_name.empty()) {
        entry["functionName"] = frame.function_name;
    }
    if (!frame.file.empty()) {
        entry["file"] = frame.file;
    }
    if (frame.line > 0) {
        entry["line"] = frame.line;
    }
    entry["isTopFrame"] = frame.index == 0;
    return entry;
}

json variable(const host::VariableInfo &variable) {
    json entry;
    entry["name"] = variable.name;
    entry["value"] = variable.value;
    if (!variable.type.empty()) {
        entry["type"] = variable.type;
    }
    entry["hasChildren"] = variable.has_children;
    return entry;
}

json lock_status(const bridge_core::LockStatus &status) {
    json entry;
    entry["operationClass"] = status.operation_class;
    entry["locked"] = status.locked;
    if (status.locked) {
        entry["holder"] = status.holder_description;
        entry["heldForMs"] = status.held_for_milliseconds;
    }
    return entry;
}

const char *reset_outcome_name(bridge_core::ResetOutcome outcome) {
    switch (outcome) {
    case bridge_core::ResetOutcome::Released:
        return "released";
    case bridge_core::ResetOutcome::WasAvailable:
        return "was_available";
    case bridge_core::ResetOutcome::HeldElsewhere:
        return "held_elsewhere";
    }
    return "unknown";
}

json reset_report(const bridge_core::ResetReport &report) {
    json entry;
    entry["outcome"] = reset_outcome_name(report.outcome);
    if (report.outcome == bridge_core::ResetOutcome::HeldElsewhere) {
        entry["holder"] = report.holder_description;
        entry["heldForMs"] = report.held_for_milliseconds;
    }
    return entry;
}

json respond(bool success, const bridge_core::BridgeError &error, const json &payload) {
    if (success) {
        return response_builder::build_success(payload);
    }
    if (error.kind == bridge_core::ErrorKind::None) {
        json response = response_builder::build_success(payload);
        response["success"] = false;
        return response;
    }
    return response_builder::build_failure(error, payload);
}

json schema_object() {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    return schema;
}

void add_property(json &schema, const char *name, const char *type, const char *description) {
    schema["properties"][name] = {
        {"type", type},
        {"description", description}
    };
}

} // namespace result_json
