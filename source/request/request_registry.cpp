#include "request/request_registry.hpp"
#include "request/response_builder.hpp"
#include "utils/debug_log.hpp"

#include <new>

namespace request_registry {

// Global operation registry (module-level, not class-based).
static std::vector<OperationDefinition> registered_operations;

void register_operation(const OperationDefinition &definition) {
    for (auto &existing : registered_operations) {
        if (existing.name == definition.name) {
            existing = definition;
            return;
        }
    }
    registered_operations.push_back(definition);
}

json build_operations_list() {
    json operations_array = json::array();
    for (const auto &operation : registered_operations) {
        json entry;
        entry["name"] = operation.name;
        entry["description"] = operation.description;
        entry["inputSchema"] = operation.input_schema;
        operations_array.push_back(entry);
    }

    json result;
    result["operations"] = operations_array;
    return result;
}

json dispatch_request(bridge_core::BridgeService &service, const std::string &operation, const json &arguments) {
    const OperationDefinition *definition = nullptr;
    for (const auto &candidate : registered_operations) {
        if (candidate.name == operation) {
            definition = &candidate;
            break;
        }
    }
    if (definition == nullptr) {
        return response_builder::build_not_found(bridge_core::ErrorKind::UnknownOperation,
                                                 "Unknown operation: " + operation);
    }

    json effective_arguments = arguments.is_null() ? json::object() : arguments;
    if (!effective_arguments.is_object()) {
        return response_builder::build_invalid_request("Arguments of '" + operation + "' must be a JSON object.");
    }

    debug_log::log(operation + " invoked");
    try {
        return definition->handler(service, effective_arguments);
    } catch (const json::exception &exception) {
        debug_log::warn(operation + " failed with a JSON error: " + exception.what());
        return response_builder::build_internal_error(response_builder::FAULT_JSON, exception.what());
    } catch (const std::bad_alloc &exception) {
        debug_log::warn(operation + " ran out of memory");
        return response_builder::build_internal_error(response_builder::FAULT_OUT_OF_MEMORY, exception.what());
    } catch (const std::exception &exception) {
        debug_log::warn(operation + " threw: " + exception.what());
        return response_builder::build_internal_error(response_builder::FAULT_EXCEPTION, exception.what());
    }
}

const std::vector<OperationDefinition> &get_registered_operations() {
    return registered_operations;
}

} // namespace request_registry
