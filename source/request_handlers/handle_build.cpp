#include "request/request_arguments.hpp"
#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/result_json.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Handlers for "build", "build_status" and "build_diagnostics".

static json handle_build_request(bridge_core::BridgeService &service, const json &arguments) {
    bool incremental = true;
    std::optional<std::chrono::milliseconds> timeout;
    std::string project_reference;
    std::string error;
    if (!request_arguments::read_bool(arguments, "incremental", incremental, error) ||
        !request_arguments::read_seconds(arguments, "timeoutSeconds", timeout, error) ||
        !request_arguments::read_string(arguments, "projectRef", false, project_reference, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::BuildRunResult result = service.build(incremental, timeout, project_reference);
    debug_log::log(std::string("build finished: ") + (result.success ? "success" : "failure") + ", " +
                   std::to_string(result.errors.size()) + " errors");
    return result_json::respond(result.success, result.error, result_json::build_result(result));
}

static json handle_build_status(bridge_core::BridgeService &service, const json &) {
    std::optional<bridge_core::BuildRunResult> last = service.last_build();
    json payload;
    payload["available"] = last.has_value();
    if (last.has_value()) {
        json result = result_json::build_result(last.value());
        result["success"] = last->success;
        if (last->error.kind != bridge_core::ErrorKind::None) {
            result["error"]["kind"] = bridge_core::error_kind_name(last->error.kind);
            result["error"]["message"] = last->error.message;
        }
        payload["result"] = result;
    }
    return response_builder::build_success(payload);
}

static json handle_build_diagnostics(bridge_core::BridgeService &service, const json &) {
    bridge_core::BuildDiagnostics diagnostics = service.build_diagnostics();
    json payload;
    payload["available"] = diagnostics.available;
    if (diagnostics.available) {
        payload["projectName"] = diagnostics.project_name;
    }
    payload["errors"] = result_json::build_messages(diagnostics.errors, "ERROR");
    payload["warnings"] = result_json::build_messages(diagnostics.warnings, "WARNING");
    return response_builder::build_success(payload);
}

namespace handle_build {

void register_operations() {
    json build_schema = result_json::schema_object();
    result_json::add_property(build_schema, "incremental", "boolean",
                              "Incremental build (default true); false rebuilds the project.");
    result_json::add_property(build_schema, "timeoutSeconds", "number",
                              "Overrides the configured build timeout.");
    result_json::add_property(build_schema, "projectRef", "string",
                              "Project base path, path suffix or name. Defaults to the first project.");

    request_registry::register_operation({
        "build",
        "Build the project and wait for the result. Fails fast with LockAcquisitionTimeout "
        "while another build holds the build lock.",
        build_schema,
        handle_build_request
    });

    request_registry::register_operation({
        "build_status",
        "Result of the most recent completed build, if any.",
        result_json::schema_object(),
        handle_build_status
    });

    request_registry::register_operation({
        "build_diagnostics",
        "Errors and warnings reported by the most recent build.",
        result_json::schema_object(),
        handle_build_diagnostics
    });
}

} // namespace handle_build
