#ifndef DEVBRIDGE_RESULT_JSON_HPP
#define DEVBRIDGE_RESULT_JSON_HPP

// JSON field mapping of core result types. Field names are part of the
// request surface and stay stable.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/bridge_service.hpp"

namespace result_json {

using json = nlohmann::json;

// {message, file?, line?, column?, severity}
json build_message(const host::BuildMessage &message, const char *severity);
json build_messages(const std::vector<host::BuildMessage> &messages, const char *severity);

// {success, projectName, errors, warnings, timeMs, aborted}
json build_result(const bridge_core::BuildRunResult &result);

// {success, passed, failed, skipped, timeMs, tests, runId?, message?}
json test_result(const bridge_core::TestRunResult &result);

json run_summary(const bridge_core::RunSummary &summary);

json breakpoint(const host::LineBreakpoint &breakpoint);

json stack_frame(const host::StackFrameInfo &frame);

json variable(const host::VariableInfo &variable);

json lock_status(const bridge_core::LockStatus &status);

// "released", "was_available", "held_elsewhere".
const char *reset_outcome_name(bridge_core::ResetOutcome outcome);

json reset_report(const bridge_core::ResetReport &report);

// Response for a core result: success envelope, or the typed failure that
// still carries payload's fields. A completed operation with a failed outcome
// (compile errors, failing tests) has no error: status "ok", success false.
json respond(bool success, const bridge_core::BridgeError &error, const json &payload);

// Shared input schema fragments.
json schema_object();
void add_property(json &schema, const char *name, const char *type, const char *description);

} // namespace result_json

#endif // DEVBRIDGE_RESULT_JSON_HPP
