#ifndef DEVBRIDGE_REQUEST_REGISTRY_HPP
#define DEVBRIDGE_REQUEST_REGISTRY_HPP

// Operation registry: registration, listing, and dispatch of requests.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include "core/bridge_service.hpp"

namespace request_registry {

using json = nlohmann::json;

// An operation handler: receives the service and the arguments object,
// returns the complete response (see response_builder).
using RequestHandler = std::function<json(bridge_core::BridgeService &service, const json &arguments)>;

struct OperationDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    RequestHandler handler;
};

// Register an operation. A later registration under the same name replaces
// the earlier one. Call during initialization, before any dispatch.
void register_operation(const OperationDefinition &definition);

// Names, descriptions and input schemas of all operations.
json build_operations_list();

// Dispatch one request. Never throws: unknown operations are not_found,
// a non-object arguments value is invalid_request, and exceptions escaping
// the handler become internal_error responses with a fault kind.
json dispatch_request(bridge_core::BridgeService &service, const std::string &operation, const json &arguments);

// Get all registered operation definitions (for testing or introspection).
const std::vector<OperationDefinition> &get_registered_operations();

} // namespace request_registry

#endif // DEVBRIDGE_REQUEST_REGISTRY_HPP
