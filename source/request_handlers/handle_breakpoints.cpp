#include "request/request_arguments.hpp"
#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/result_json.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Handlers for "breakpoint_list", "breakpoint_set" and "breakpoint_remove".

static json handle_breakpoint_list(bridge_core::BridgeService &service, const json &) {
    bridge_core::BreakpointListResult result = service.debugger().list_breakpoints();
    json breakpoints = json::array();
    for (const auto &breakpoint : result.breakpoints) {
        breakpoints.push_back(result_json::breakpoint(breakpoint));
    }
    json payload;
    payload["breakpoints"] = breakpoints;
    return result_json::respond(result.success, result.error, payload);
}

static bool read_location(const json &arguments, std::string &file, int &line, std::string &error) {
    return request_arguments::read_string(arguments, "file", true, file, error) &&
           request_arguments::read_int(arguments, "line", true, 1, line, error);
}

static json handle_breakpoint_set(bridge_core::BridgeService &service, const json &arguments) {
    std::string file;
    int line = 0;
    std::string condition;
    std::string error;
    if (!read_location(arguments, file, line, error) ||
        !request_arguments::read_string(arguments, "condition", false, condition, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::BreakpointChangeResult result = service.debugger().set_breakpoint(file, line, condition);
    json payload;
    if (result.success) {
        payload["breakpointId"] = result.breakpoint.id;
        payload["file"] = result.breakpoint.file;
        payload["line"] = result.breakpoint.line;
        payload["message"] = result.message;
    }
    return result_json::respond(result.success, result.error, payload);
}

static json handle_breakpoint_remove(bridge_core::BridgeService &service, const json &arguments) {
    std::string file;
    int line = 0;
    std::string error;
    if (!read_location(arguments, file, line, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::BreakpointChangeResult result = service.debugger().remove_breakpoint(file, line);
    json payload;
    if (result.success) {
        payload["message"] = result.message;
    }
    return result_json::respond(result.success, result.error, payload);
}

namespace handle_breakpoints {

void register_operations() {
    request_registry::register_operation({
        "breakpoint_list",
        "All line breakpoints known to the debugger.",
        result_json::schema_object(),
        handle_breakpoint_list
    });

    json set_schema = result_json::schema_object();
    result_json::add_property(set_schema, "file", "string", "Source file path.");
    result_json::add_property(set_schema, "line", "integer", "1-based line number.");
    result_json::add_property(set_schema, "condition", "string", "Optional break condition.");
    set_schema["required"] = json::array({"file", "line"});

    request_registry::register_operation({
        "breakpoint_set",
        "Add a line breakpoint, or replace the condition of an existing one. Applied to live "
        "sessions too.",
        set_schema,
        handle_breakpoint_set
    });

    json remove_schema = result_json::schema_object();
    result_json::add_property(remove_schema, "file", "string", "Source file path.");
    result_json::add_property(remove_schema, "line", "integer", "1-based line number.");
    remove_schema["required"] = json::array({"file", "line"});

    request_registry::register_operation({
        "breakpoint_remove",
        "Remove the line breakpoint at a location.",
        remove_schema,
        handle_breakpoint_remove
    });
}

} // namespace handle_breakpoints
