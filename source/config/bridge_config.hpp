#ifndef DEVBRIDGE_BRIDGE_CONFIG_HPP
#define DEVBRIDGE_BRIDGE_CONFIG_HPP

// Service configuration: timeouts, capacities and retry policy.
// Sources, later ones winning: built-in defaults, a JSON file
// (--config or DEVBRIDGE_CONFIG), DEVBRIDGE_*_TIMEOUT_SECONDS variables.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace bridge_config {

using json = nlohmann::json;

struct BridgeConfig {
    std::chrono::milliseconds build_timeout{300000};
    std::chrono::milliseconds test_timeout{300000};
    std::chrono::milliseconds run_start_timeout{30000};
    // pause, resume, steps, stack frames
    std::chrono::milliseconds debug_timeout{5000};
    // evaluate, variables, breakpoint changes, session start
    std::chrono::milliseconds debug_evaluate_timeout{10000};
    std::chrono::milliseconds lock_acquire_timeout{5000};
    std::chrono::milliseconds upstream_wait{120000};
    std::chrono::milliseconds upstream_poll_interval{500};
    size_t run_output_capacity = 1000000;
    std::chrono::milliseconds run_retention{3600000};
    int extraction_max_attempts = 5;
    std::chrono::milliseconds extraction_retry_delay{200};
    // Local host: SIGTERM to SIGKILL escalation.
    std::chrono::milliseconds terminate_grace{2000};
    // Local host: path or PATH name of the debugger.
    std::string gdb_executable = "gdb";
};

struct LoadResult {
    bool success = false;
    BridgeConfig config;
    std::string error_detail;
};

// Applies the keys present in document on top of base. Unknown keys are
// ignored; a key with a wrong type or a negative value fails the load.
LoadResult apply_json(const json &document, const BridgeConfig &base);

LoadResult load_file(const std::string &file_path, const BridgeConfig &base);

// Invalid values are logged and skipped.
void apply_environment_overrides(BridgeConfig &config);

// Full load. explicit_path may be empty, in which case DEVBRIDGE_CONFIG is
// consulted; no file at all is not an error.
LoadResult load(const std::string &explicit_path);

json to_json(const BridgeConfig &config);

} // namespace bridge_config

#endif // DEVBRIDGE_BRIDGE_CONFIG_HPP
