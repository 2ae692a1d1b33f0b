#include "request/request_envelope.hpp"
#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "utils/debug_log.hpp"

namespace request_envelope {

json handle_message(bridge_core::BridgeService &service, const json &message) {
    if (!message.is_object()) {
        return response_builder::build_invalid_request("Request must be a JSON object.");
    }

    json response;
    if (!message.contains("operation") || !message["operation"].is_string()) {
        response = response_builder::build_invalid_request("Missing required field 'operation' (string).");
    } else {
        json arguments = message.contains("arguments") ? message["arguments"] : json();
        response = request_registry::dispatch_request(service, message["operation"].get<std::string>(), arguments);
    }

    if (message.contains("id")) {
        response["id"] = message["id"];
    }
    return response;
}

json handle_text(bridge_core::BridgeService &service, const std::string &raw_message) {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_message);
    } catch (const json::parse_error &error) {
        debug_log::warn("Failed to parse incoming JSON: " + std::string(error.what()));
        return response_builder::build_invalid_request("Parse error: " + std::string(error.what()));
    }
    return handle_message(service, parsed_message);
}

} // namespace request_envelope
