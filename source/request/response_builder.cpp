#include "request/response_builder.hpp"

namespace response_builder {

const char *status_for(bridge_core::ErrorKind kind) {
    switch (kind) {
    case bridge_core::ErrorKind::None:
        return STATUS_OK;
    case bridge_core::ErrorKind::InvalidRequest:
        return STATUS_INVALID_REQUEST;
    case bridge_core::ErrorKind::RunNotFound:
    case bridge_core::ErrorKind::ConfigurationNotFound:
    case bridge_core::ErrorKind::BreakpointNotFound:
    case bridge_core::ErrorKind::UnknownOperation:
        return STATUS_NOT_FOUND;
    case bridge_core::ErrorKind::InternalFault:
        return STATUS_INTERNAL_ERROR;
    default:
        return STATUS_FAILED;
    }
}

json build_success(const json &payload) {
    json response = payload.is_object() ? payload : json::object();
    response["success"] = true;
    response["status"] = STATUS_OK;
    return response;
}

json build_failure(const bridge_core::BridgeError &error) {
    return build_failure(error, json::object());
}

json build_failure(const bridge_core::BridgeError &error, const json &payload) {
    json response = payload.is_object() ? payload : json::object();
    response["success"] = false;
    response["status"] = status_for(error.kind);
    response["error"]["kind"] = bridge_core::error_kind_name(error.kind);
    response["error"]["message"] = error.message;
    if (error.kind == bridge_core::ErrorKind::InternalFault) {
        response["faultKind"] = FAULT_EXCEPTION;
    }
    return response;
}

json build_invalid_request(const std::string &message) {
    return build_failure(bridge_core::make_error(bridge_core::ErrorKind::InvalidRequest, message));
}

json build_not_found(bridge_core::ErrorKind kind, const std::string &message) {
    json response = build_failure(bridge_core::make_error(kind, message));
    response["status"] = STATUS_NOT_FOUND;
    return response;
}

json build_internal_error(const std::string &fault_kind, const std::string &message) {
    json response = build_failure(bridge_core::make_error(bridge_core::ErrorKind::InternalFault, message));
    response["faultKind"] = fault_kind;
    return response;
}

bool is_success(const json &response) {
    return response.is_object() && response.contains("success") && response["success"].is_boolean() &&
           response["success"].get<bool>();
}

} // namespace response_builder
