#ifndef DEVBRIDGE_RESPONSE_BUILDER_HPP
#define DEVBRIDGE_RESPONSE_BUILDER_HPP

// Response envelopes for the request surface.
// Uses nlohmann/json for serialization.
//
// Every response carries "success" and "status". Failures add
// "error": {"kind", "message"}; internal errors also carry "faultKind".

#include <nlohmann/json.hpp>
#include <string>

#include "core/bridge_errors.hpp"

namespace response_builder {

using json = nlohmann::json;

// Status values.
constexpr char STATUS_OK[] = "ok";
constexpr char STATUS_INVALID_REQUEST[] = "invalid_request";
constexpr char STATUS_NOT_FOUND[] = "not_found";
constexpr char STATUS_FAILED[] = "failed";
constexpr char STATUS_INTERNAL_ERROR[] = "internal_error";

// Fault kinds of internal errors.
constexpr char FAULT_JSON[] = "json";
constexpr char FAULT_OUT_OF_MEMORY[] = "out_of_memory";
constexpr char FAULT_EXCEPTION[] = "exception";

// Status a typed failure is reported with.
const char *status_for(bridge_core::ErrorKind kind);

// payload must be an object (or null); its fields are kept.
json build_success(const json &payload);

json build_failure(const bridge_core::BridgeError &error);

// Failure that still reports fields of the partial result (e.g. a runId).
json build_failure(const bridge_core::BridgeError &error, const json &payload);

json build_invalid_request(const std::string &message);

json build_not_found(bridge_core::ErrorKind kind, const std::string &message);

json build_internal_error(const std::string &fault_kind, const std::string &message);

bool is_success(const json &response);

} // namespace response_builder

#endif // DEVBRIDGE_RESPONSE_BUILDER_HPP
