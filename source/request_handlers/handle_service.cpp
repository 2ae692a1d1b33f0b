#include "request/request_arguments.hpp"
#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/result_json.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Handlers for service diagnostics and recovery: lock status and reset,
// service reset, health.

static const std::string SERVICE_NAME = "devbridge";
static const std::string SERVICE_VERSION = "0.1.0";

static json handle_lock_status(bridge_core::BridgeService &service, const json &) {
    json locks = json::array();
    for (const auto &status : service.lock_status()) {
        locks.push_back(result_json::lock_status(status));
    }
    json payload;
    payload["locks"] = locks;
    return response_builder::build_success(payload);
}

static json handle_lock_reset(bridge_core::BridgeService &service, const json &arguments) {
    std::string class_name;
    std::string error;
    if (!request_arguments::read_string(arguments, "operationClass", false, class_name, error)) {
        return response_builder::build_invalid_request(error);
    }

    std::vector<host::OperationClass> classes;
    if (class_name.empty()) {
        classes = {host::OperationClass::Build, host::OperationClass::Test};
    } else {
        std::optional<host::OperationClass> parsed = bridge_core::parse_operation_class(class_name);
        if (!parsed.has_value()) {
            return response_builder::build_invalid_request("Parameter 'operationClass' must be \"build\" or "
                                                           "\"test\", got '" + class_name + "'.");
        }
        classes.push_back(parsed.value());
    }

    json results = json::object();
    for (host::OperationClass operation_class : classes) {
        results[bridge_core::operation_class_name(operation_class)] =
            result_json::reset_report(service.reset_lock(operation_class));
    }
    json payload;
    payload["locks"] = results;
    return response_builder::build_success(payload);
}

static json handle_service_reset(bridge_core::BridgeService &service, const json &) {
    bridge_core::ServiceResetReport report = service.reset();
    json payload;
    payload["runsForgotten"] = report.runs_forgotten;
    payload["locks"]["build"] = result_json::reset_report(report.build_lock);
    payload["locks"]["test"] = result_json::reset_report(report.test_lock);
    return response_builder::build_success(payload);
}

static json handle_health(bridge_core::BridgeService &service, const json &) {
    json payload;
    payload["service"] = SERVICE_NAME;
    payload["version"] = SERVICE_VERSION;
    payload["state"] = service.is_shut_down() ? "shut_down" : "running";
    payload["projects"] = service.projects().size();
    payload["debuggerAvailable"] = service.host().debugger() != nullptr;
    json names = json::array();
    for (const auto &operation : request_registry::get_registered_operations()) {
        names.push_back(operation.name);
    }
    payload["operations"] = names;
    return response_builder::build_success(payload);
}

namespace handle_service {

void register_operations() {
    request_registry::register_operation({
        "lock_status",
        "State of the build and test operation locks, with holder and hold time.",
        result_json::schema_object(),
        handle_lock_status
    });

    json reset_schema = result_json::schema_object();
    result_json::add_property(reset_schema, "operationClass", "string",
                              "\"build\" or \"test\". Both when omitted.");

    request_registry::register_operation({
        "lock_reset",
        "Recovery escape hatch. Releases a lock only when this request's thread holds it; a lock "
        "held by an in-flight operation is reported, never forced.",
        reset_schema,
        handle_lock_reset
    });

    request_registry::register_operation({
        "service_reset",
        "Terminate and forget all runs, clear cached build and test results, reset the locks.",
        result_json::schema_object(),
        handle_service_reset
    });

    request_registry::register_operation({
        "health",
        "Service state, version and the available operations.",
        result_json::schema_object(),
        handle_health
    });
}

} // namespace handle_service
