#ifndef DEVBRIDGE_REQUEST_ENVELOPE_HPP
#define DEVBRIDGE_REQUEST_ENVELOPE_HPP

// Request envelope of the stdio loop:
//   {"operation": "...", "arguments": {...}, "id": <any>}
// "arguments" and "id" are optional; the response echoes "id" when present.

#include <nlohmann/json.hpp>
#include <string>

#include "core/bridge_service.hpp"

namespace request_envelope {

using json = nlohmann::json;

// Validates the envelope and dispatches it through the request registry.
json handle_message(bridge_core::BridgeService &service, const json &message);

// Parses raw text first; unparseable text is an invalid_request response.
json handle_text(bridge_core::BridgeService &service, const std::string &raw_message);

} // namespace request_envelope

#endif // DEVBRIDGE_REQUEST_ENVELOPE_HPP
