// Tests for the request surface: envelope validation, dispatch, argument
// checking, response shapes of the handlers and stdio framing.

#include "fake_host.hpp"
#include "request/request_envelope.hpp"
#include "request/request_registry.hpp"
#include "request/request_stdio.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/request_handlers.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace test_request_handlers {

using namespace std::chrono_literals;

static bridge_config::BridgeConfig handler_config() {
    bridge_config::BridgeConfig config;
    config.lock_acquire_timeout = 50ms;
    config.upstream_poll_interval = 20ms;
    config.extraction_retry_delay = 10ms;
    config.run_start_timeout = 1000ms;
    config.debug_timeout = 500ms;
    config.debug_evaluate_timeout = 500ms;
    return config;
}

static std::string error_kind_of(const json &response) {
    if (!response.contains("error") || !response["error"].contains("kind")) {
        return "";
    }
    return response["error"]["kind"].get<std::string>();
}

// Test: Envelopes without an operation or that are not objects are invalid_request.
static bool test_envelope_validation() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    bridge_core::BridgeService service(host, handler_config());

    json not_object = request_envelope::handle_message(service, json::array({1, 2}));
    json missing = request_envelope::handle_message(service, {{"arguments", json::object()}, {"id", 4}});
    json unparseable = request_envelope::handle_text(service, "{\"operation\": ");

    bool success = not_object["status"] == response_builder::STATUS_INVALID_REQUEST &&
                   missing["status"] == response_builder::STATUS_INVALID_REQUEST && missing["id"] == 4 &&
                   unparseable["status"] == response_builder::STATUS_INVALID_REQUEST &&
                   unparseable["success"] == false;

    if (success) {
        std::cout << "  OK: Malformed envelopes are invalid_request" << std::endl;
    } else {
        std::cout << "  FAIL: Envelope response " << missing.dump() << std::endl;
    }
    return success;
}

// Test: Unknown operations are not_found with UnknownOperation; the id is echoed.
static bool test_unknown_operation() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    bridge_core::BridgeService service(host, handler_config());

    json response = request_envelope::handle_message(service, {{"operation", "deploy"}, {"id", "req-1"}});
    bool success = response["status"] == response_builder::STATUS_NOT_FOUND &&
                   error_kind_of(response) == "UnknownOperation" && response["id"] == "req-1";

    if (success) {
        std::cout << "  OK: Unknown operation is not_found and echoes the id" << std::endl;
    } else {
        std::cout << "  FAIL: Unknown operation response " << response.dump() << std::endl;
    }
    return success;
}

// Test: Wrong argument types and missing required arguments are rejected.
static bool test_argument_validation() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::BridgeService service(host, handler_config());

    json not_object = request_registry::dispatch_request(service, "run_list", json::array());
    json missing_config = request_registry::dispatch_request(service, "run_start", json::object());
    json bad_line = request_registry::dispatch_request(service, "breakpoint_set", {{"file", "a.cpp"}, {"line", 0}});
    json bad_timeout = request_registry::dispatch_request(service, "build", {{"timeoutSeconds", "soon"}});
    json bad_class = request_registry::dispatch_request(service, "lock_reset", {{"operationClass", "deploy"}});

    bool success = not_object["status"] == response_builder::STATUS_INVALID_REQUEST &&
                   missing_config["status"] == response_builder::STATUS_INVALID_REQUEST &&
                   bad_line["status"] == response_builder::STATUS_INVALID_REQUEST &&
                   bad_timeout["status"] == response_builder::STATUS_INVALID_REQUEST &&
                   bad_class["status"] == response_builder::STATUS_INVALID_REQUEST && host.builds_started == 0;

    if (success) {
        std::cout << "  OK: Invalid arguments are rejected before any work" << std::endl;
    } else {
        std::cout << "  FAIL: Argument validation " << bad_line.dump() << std::endl;
    }
    return success;
}

// Test: health reports the service and lists every registered operation.
static bool test_health() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::BridgeService service(host, handler_config());

    json response = request_registry::dispatch_request(service, "health", json());
    const json &operations = response["operations"];
    auto listed = [&operations](const std::string &name) {
        return std::find(operations.begin(), operations.end(), name) != operations.end();
    };
    bool success = response["success"] == true && response["service"] == "devbridge" &&
                   response["state"] == "running" && response["projects"] == 1 &&
                   response["debuggerAvailable"] == true && listed("build") && listed("test") &&
                   listed("run_start") && listed("debug_evaluate") && listed("breakpoint_set") &&
                   listed("lock_reset") && listed("health") &&
                   operations.size() == request_registry::get_registered_operations().size();

    if (success) {
        std::cout << "  OK: health lists " << operations.size() << " operations" << std::endl;
    } else {
        std::cout << "  FAIL: health response " << response.dump() << std::endl;
    }
    return success;
}

// Test: Runs are started, read, stopped and listed through dispatch.
static bool test_run_operations() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host.on_launch = [](fake_host::FakeProcess &process) { process.emit("listening on 8080\n"); };
    bridge_core::BridgeService service(host, handler_config());

    json started = request_registry::dispatch_request(service, "run_start", {{"configName", "server"}});
    std::string run_id = started.value("runId", "");
    json output = request_registry::dispatch_request(service, "run_output", {{"runId", run_id}, {"clear", true}});
    json drained = request_registry::dispatch_request(service, "run_output", {{"runId", run_id}});
    json stopped = request_registry::dispatch_request(service, "run_stop", {{"runId", run_id}});
    json listed = request_registry::dispatch_request(service, "run_list", json::object());
    json unknown = request_registry::dispatch_request(service, "run_stop", {{"runId", "run-missing"}});
    json missing_config = request_registry::dispatch_request(service, "run_start", {{"configName", "nope"}});

    bool success = started["success"] == true && started["projectName"] == "demo" && !run_id.empty() &&
                   output["output"] == "listening on 8080\n" && output["running"] == true &&
                   drained["output"] == "" && stopped["stopped"] == true && listed["runs"].size() == 1 &&
                   listed["runs"][0]["running"] == false && listed["runs"][0]["exitCode"] == 143 &&
                   unknown["status"] == response_builder::STATUS_NOT_FOUND &&
                   error_kind_of(unknown) == "RunNotFound" &&
                   error_kind_of(missing_config) == "ConfigurationNotFound";

    if (success) {
        std::cout << "  OK: Run operations dispatch and report" << std::endl;
    } else {
        std::cout << "  FAIL: Run operations " << output.dump() << " / " << listed.dump() << std::endl;
    }
    return success;
}

// Test: A build with compile errors is status ok with success false.
static bool test_build_response_shape() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    host::BuildMessage message;
    message.file = "src/main.cpp";
    message.line = 4;
    message.message = "'foo' was not declared in this scope";
    host.build_outcome.errors.push_back(message);
    bridge_core::BridgeService service(host, handler_config());

    json before = request_registry::dispatch_request(service, "build_status", json::object());
    json built = request_registry::dispatch_request(service, "build", {{"incremental", false}});
    json status = request_registry::dispatch_request(service, "build_status", json::object());
    json diagnostics = request_registry::dispatch_request(service, "build_diagnostics", json::object());

    bool success = before["available"] == false && built["status"] == response_builder::STATUS_OK &&
                   built["success"] == false && !built.contains("error") && built["projectName"] == "demo" &&
                   built["errors"].size() == 1 && built["errors"][0]["line"] == 4 &&
                   built["errors"][0]["severity"] == "ERROR" && status["available"] == true &&
                   !status["result"].contains("error") && diagnostics["errors"].size() == 1;

    if (success) {
        std::cout << "  OK: Build with errors reports diagnostics with status ok" << std::endl;
    } else {
        std::cout << "  FAIL: Build response " << built.dump() << std::endl;
    }
    return success;
}

// Test: Debug operations without a session fail with a typed error.
static bool test_debug_without_session() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::BridgeService service(host, handler_config());

    json sessions = request_registry::dispatch_request(service, "debug_sessions", json::object());
    json step = request_registry::dispatch_request(service, "debug_step_over", json::object());
    json evaluate = request_registry::dispatch_request(service, "debug_evaluate", {{"expression", "x"}});
    json missing_expression = request_registry::dispatch_request(service, "debug_evaluate", json::object());

    bool success = sessions["success"] == true && sessions["sessions"].empty() &&
                   error_kind_of(step) == "NoActiveDebugSession" && step["status"] == response_builder::STATUS_FAILED &&
                   error_kind_of(evaluate) == "NoActiveDebugSession" &&
                   missing_expression["status"] == response_builder::STATUS_INVALID_REQUEST;

    if (success) {
        std::cout << "  OK: Debug operations without a session are typed failures" << std::endl;
    } else {
        std::cout << "  FAIL: Debug response " << step.dump() << std::endl;
    }
    return success;
}

// Test: "test" with debug returns the debug session without results.
static bool test_test_debug_request() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::BridgeService service(host, handler_config());

    json started = request_registry::dispatch_request(service, "test", {{"pattern", "MathTest"}, {"debug", true}});
    json sessions = request_registry::dispatch_request(service, "debug_sessions", json::object());
    json bad_flag = request_registry::dispatch_request(service, "test", {{"pattern", "MathTest"}, {"debug", "yes"}});

    bool success = started["status"] == response_builder::STATUS_OK && started["success"] == true &&
                   started["debugSessionId"] == "debug-1" && started["tests"].empty() &&
                   !started.contains("runId") && sessions["sessions"].size() == 1 &&
                   bad_flag["status"] == response_builder::STATUS_INVALID_REQUEST && host.process_count() == 0;

    if (success) {
        std::cout << "  OK: Debug test request returns the session id" << std::endl;
    } else {
        std::cout << "  FAIL: Debug test response " << started.dump() << std::endl;
    }
    return success;
}

// Test: Lock status and reset report both classes.
static bool test_lock_operations() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    bridge_core::BridgeService service(host, handler_config());

    json status = request_registry::dispatch_request(service, "lock_status", json::object());
    json reset_all = request_registry::dispatch_request(service, "lock_reset", json::object());
    json reset_test = request_registry::dispatch_request(service, "lock_reset", {{"operationClass", "test"}});

    bool success = status["locks"].size() == 2 && status["locks"][0]["locked"] == false &&
                   reset_all["locks"].contains("build") && reset_all["locks"].contains("test") &&
                   reset_all["locks"]["build"]["outcome"] == "was_available" &&
                   reset_test["locks"].size() == 1 && reset_test["locks"].contains("test");

    if (success) {
        std::cout << "  OK: Lock status and reset report per class" << std::endl;
    } else {
        std::cout << "  FAIL: Lock reset " << reset_all.dump() << std::endl;
    }
    return success;
}

// Test: read_message frames compact and pretty-printed objects, braces in strings included.
static bool test_read_message_framing() {
    std::istringstream input("{\"operation\":\"health\",\"id\":1}\n"
                             "{\n  \"operation\": \"run_output\",\n  \"arguments\": {\"runId\": \"a}b\\\"{\"}\n}\n");
    std::string first = request_stdio::read_message(input);
    std::string second = request_stdio::read_message(input);
    std::string end = request_stdio::read_message(input);

    bool success = json::parse(first)["id"] == 1 && json::parse(second)["arguments"]["runId"] == "a}b\"{" &&
                   end.empty();

    if (success) {
        std::cout << "  OK: Messages are framed by balanced braces" << std::endl;
    } else {
        std::cout << "  FAIL: Framed second message: " << second << std::endl;
    }
    return success;
}

// Test: After shutdown, build requests fail with ServiceShutDown.
static bool test_after_shutdown() {
    request_handlers::register_all_operations();
    fake_host::FakeHost host;
    fake_host::add_demo_project(host);
    bridge_core::BridgeService service(host, handler_config());
    service.shutdown();

    json built = request_registry::dispatch_request(service, "build", json::object());
    json health = request_registry::dispatch_request(service, "health", json::object());
    bool success = error_kind_of(built) == "ServiceShutDown" && health["state"] == "shut_down";

    if (success) {
        std::cout << "  OK: Requests after shutdown are refused" << std::endl;
    } else {
        std::cout << "  FAIL: Build after shutdown " << built.dump() << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_envelope_validation();
    all_passed &= test_unknown_operation();
    all_passed &= test_argument_validation();
    all_passed &= test_health();
    all_passed &= test_run_operations();
    all_passed &= test_build_response_shape();
    all_passed &= test_debug_without_session();
    all_passed &= test_test_debug_request();
    all_passed &= test_lock_operations();
    all_passed &= test_read_message_framing();
    all_passed &= test_after_shutdown();
    return all_passed;
}

} // namespace test_request_handlers
