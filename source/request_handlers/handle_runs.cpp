#include "request/request_arguments.hpp"
#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/result_json.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Handlers for the run registry: start, output, stop, list, prune, projects.

static json handle_run_start(bridge_core::BridgeService &service, const json &arguments) {
    std::string configuration_name;
    std::string project_reference;
    std::string error;
    if (!request_arguments::read_string(arguments, "configName", true, configuration_name, error) ||
        !request_arguments::read_string(arguments, "projectRef", false, project_reference, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::RunStartResult result = service.runs().start(configuration_name, project_reference);
    json payload;
    if (!result.run_id.empty()) {
        payload["runId"] = result.run_id;
    }
    if (result.success) {
        payload["configName"] = result.configuration_name;
        payload["projectName"] = result.project_name;
    }
    return result_json::respond(result.success, result.error, payload);
}

static json handle_run_output(bridge_core::BridgeService &service, const json &arguments) {
    std::string run_id;
    bool clear = false;
    std::string error;
    if (!request_arguments::read_string(arguments, "runId", true, run_id, error) ||
        !request_arguments::read_bool(arguments, "clear", clear, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::RunOutputResult result = service.runs().get_output(run_id, clear);
    if (!result.success) {
        return response_builder::build_failure(result.error);
    }
    json payload;
    payload["runId"] = run_id;
    payload["output"] = result.output;
    payload["running"] = result.running;
    payload["truncated"] = result.truncated;
    if (result.exit_code.has_value()) {
        payload["exitCode"] = result.exit_code.value();
    }
    return response_builder::build_success(payload);
}

static json handle_run_stop(bridge_core::BridgeService &service, const json &arguments) {
    std::string run_id;
    std::string error;
    if (!request_arguments::read_string(arguments, "runId", true, run_id, error)) {
        return response_builder::build_invalid_request(error);
    }

    bridge_core::RunStopResult result = service.runs().stop(run_id);
    if (result.outcome == bridge_core::StopOutcome::NotFound) {
        return response_builder::build_not_found(bridge_core::ErrorKind::RunNotFound, result.message);
    }
    json payload;
    payload["runId"] = run_id;
    payload["stopped"] = result.outcome == bridge_core::StopOutcome::Stopped;
    payload["message"] = result.message;
    return response_builder::build_success(payload);
}

static json handle_run_list(bridge_core::BridgeService &service, const json &) {
    json runs = json::array();
    for (const auto &summary : service.runs().list()) {
        runs.push_back(result_json::run_summary(summary));
    }
    json payload;
    payload["runs"] = runs;
    return response_builder::build_success(payload);
}

static json handle_run_prune(bridge_core::BridgeService &service, const json &arguments) {
    std::optional<std::chrono::milliseconds> max_age;
    std::string error;
    if (!request_arguments::read_seconds(arguments, "maxAgeSeconds", max_age, error)) {
        return response_builder::build_invalid_request(error);
    }

    size_t removed = service.runs().prune(max_age.value_or(service.config().run_retention));
    json payload;
    payload["removed"] = removed;
    return response_builder::build_success(payload);
}

static json handle_run_projects(bridge_core::BridgeService &service, const json &) {
    json projects = json::array();
    for (const auto &project : service.projects()) {
        json entry;
        entry["name"] = project.name;
        entry["basePath"] = project.base_path;
        projects.push_back(entry);
    }
    json payload;
    payload["projects"] = projects;
    return response_builder::build_success(payload);
}

namespace handle_runs {

void register_operations() {
    json start_schema = result_json::schema_object();
    result_json::add_property(start_schema, "configName", "string", "Name of the run configuration.");
    result_json::add_property(start_schema, "projectRef", "string",
                              "Project base path, path suffix or name. Defaults to the first project.");
    start_schema["required"] = json::array({"configName"});

    request_registry::register_operation({
        "run_start",
        "Launch a run configuration and return its runId once the process has started.",
        start_schema,
        handle_run_start
    });

    json output_schema = result_json::schema_object();
    result_json::add_property(output_schema, "runId", "string", "Run id returned by run_start or test.");
    result_json::add_property(output_schema, "clear", "boolean",
                              "Drain the captured output, so the next read only returns newer text.");
    output_schema["required"] = json::array({"runId"});

    request_registry::register_operation({
        "run_output",
        "Captured output, running flag and exit code of a run.",
        output_schema,
        handle_run_output
    });

    json stop_schema = result_json::schema_object();
    result_json::add_property(stop_schema, "runId", "string", "Run id to stop.");
    stop_schema["required"] = json::array({"runId"});

    request_registry::register_operation({
        "run_stop",
        "Terminate the process of a run. Stopping a terminated run succeeds without effect.",
        stop_schema,
        handle_run_stop
    });

    request_registry::register_operation({
        "run_list",
        "All tracked runs in start order.",
        result_json::schema_object(),
        handle_run_list
    });

    json prune_schema = result_json::schema_object();
    result_json::add_property(prune_schema, "maxAgeSeconds", "number",
                              "Remove terminated runs started longer ago than this. Defaults to the "
                              "configured retention.");

    request_registry::register_operation({
        "run_prune",
        "Forget terminated runs older than a maximum age. Running processes are never removed.",
        prune_schema,
        handle_run_prune
    });

    request_registry::register_operation({
        "run_projects",
        "Open projects with their base paths.",
        result_json::schema_object(),
        handle_run_projects
    });
}

} // namespace handle_runs
