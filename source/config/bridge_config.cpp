#include "config/bridge_config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>

namespace bridge_config {

namespace {

struct DurationKey {
    const char *key;
    std::chrono::milliseconds BridgeConfig::*field;
    // Milliseconds per unit of the JSON value.
    long long unit_milliseconds;
};

const DurationKey DURATION_KEYS[] = {
    {"buildTimeoutSeconds", &BridgeConfig::build_timeout, 1000},
    {"testTimeoutSeconds", &BridgeConfig::test_timeout, 1000},
    {"runStartTimeoutSeconds", &BridgeConfig::run_start_timeout, 1000},
    {"debugTimeoutSeconds", &BridgeConfig::debug_timeout, 1000},
    {"debugEvaluateTimeoutSeconds", &BridgeConfig::debug_evaluate_timeout, 1000},
    {"lockAcquireTimeoutMs", &BridgeConfig::lock_acquire_timeout, 1},
    {"upstreamWaitSeconds", &BridgeConfig::upstream_wait, 1000},
    {"upstreamPollIntervalMs", &BridgeConfig::upstream_poll_interval, 1},
    {"runRetentionSeconds", &BridgeConfig::run_retention, 1000},
    {"extractionRetryDelayMs", &BridgeConfig::extraction_retry_delay, 1},
    {"terminateGraceMs", &BridgeConfig::terminate_grace, 1},
};

struct EnvironmentKey {
    const char *variable;
    std::chrono::milliseconds BridgeConfig::*field;
};

const EnvironmentKey ENVIRONMENT_KEYS[] = {
    {"DEVBRIDGE_BUILD_TIMEOUT_SECONDS", &BridgeConfig::build_timeout},
    {"DEVBRIDGE_TEST_TIMEOUT_SECONDS", &BridgeConfig::test_timeout},
    {"DEVBRIDGE_RUN_START_TIMEOUT_SECONDS", &BridgeConfig::run_start_timeout},
    {"DEVBRIDGE_DEBUG_TIMEOUT_SECONDS", &BridgeConfig::debug_timeout},
    {"DEVBRIDGE_DEBUG_EVALUATE_TIMEOUT_SECONDS", &BridgeConfig::debug_evaluate_timeout},
};

bool read_non_negative(const json &document, const char *key, double &value, std::string &error_detail) {
    const json &entry = document[key];
    if (!entry.is_number()) {
        error_detail = std::string("Config key '") + key + "' must be a number";
        return false;
    }
    value = entry.get<double>();
    if (value < 0) {
        error_detail = std::string("Config key '") + key + "' must not be negative";
        return false;
    }
    return true;
}

} // namespace

LoadResult apply_json(const json &document, const BridgeConfig &base) {
    LoadResult result;
    result.config = base;

    if (!document.is_object()) {
        result.error_detail = "Config document must be a JSON object";
        return result;
    }

    for (const auto &duration_key : DURATION_KEYS) {
        if (!document.contains(duration_key.key)) {
            continue;
        }
        double value = 0;
        if (!read_non_negative(document, duration_key.key, value, result.error_detail)) {
            return result;
        }
        result.config.*duration_key.field =
            std::chrono::milliseconds(static_cast<long long>(value * duration_key.unit_milliseconds));
    }

    if (document.contains("runOutputCapacity")) {
        double value = 0;
        if (!read_non_negative(document, "runOutputCapacity", value, result.error_detail)) {
            return result;
        }
        result.config.run_output_capacity = static_cast<size_t>(value);
    }

    if (document.contains("extractionMaxAttempts")) {
        double value = 0;
        if (!read_non_negative(document, "extractionMaxAttempts", value, result.error_detail)) {
            return result;
        }
        if (value < 1) {
            result.error_detail = "Config key 'extractionMaxAttempts' must be at least 1";
            return result;
        }
        result.config.extraction_max_attempts = static_cast<int>(value);
    }

    if (document.contains("gdbPath")) {
        if (!document["gdbPath"].is_string() || document["gdbPath"].get<std::string>().empty()) {
            result.error_detail = "Config key 'gdbPath' must be a non-empty string";
            return result;
        }
        result.config.gdb_executable = document["gdbPath"].get<std::string>();
    }

    result.success = true;
    return result;
}

LoadResult load_file(const std::string &file_path, const BridgeConfig &base) {
    LoadResult result;
    result.config = base;

    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        result.error_detail = "Cannot read config file: " + file_path;
        return result;
    }

    json document;
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &parse_error) {
        result.error_detail = "Invalid JSON in config file " + file_path + ": " + parse_error.what();
        return result;
    }

    result = apply_json(document, base);
    if (result.success) {
        debug_log::log("Loaded config from " + file_path);
    }
    return result;
}

void apply_environment_overrides(BridgeConfig &config) {
    for (const auto &environment_key : ENVIRONMENT_KEYS) {
        const char *value = std::getenv(environment_key.variable);
        if (value == nullptr || value[0] == '\0') {
            continue;
        }
        char *end = nullptr;
        double seconds = std::strtod(value, &end);
        if (end == value || *end != '\0' || seconds < 0) {
            debug_log::warn(std::string("Ignoring invalid ") + environment_key.variable + "=" + value);
            continue;
        }
        config.*environment_key.field = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        debug_log::log(std::string("Config override from ") + environment_key.variable + "=" + value);
    }
}

LoadResult load(const std::string &explicit_path) {
    std::string path = explicit_path;
    if (path.empty()) {
        const char *environment_path = std::getenv("DEVBRIDGE_CONFIG");
        if (environment_path != nullptr) {
            path = environment_path;
        }
    }

    LoadResult result;
    if (path.empty()) {
        result.success = true;
    } else {
        result = load_file(path, BridgeConfig{});
        if (!result.success) {
            return result;
        }
    }

    apply_environment_overrides(result.config);
    return result;
}

json to_json(const BridgeConfig &config) {
    json document;
    for (const auto &duration_key : DURATION_KEYS) {
        long long milliseconds = (config.*duration_key.field).count();
        if (duration_key.unit_milliseconds == 1) {
            document[duration_key.key] = milliseconds;
        } else {
            document[duration_key.key] = static_cast<double>(milliseconds) / duration_key.unit_milliseconds;
        }
    }
    document["runOutputCapacity"] = config.run_output_capacity;
    document["extractionMaxAttempts"] = config.extraction_max_attempts;
    document["gdbPath"] = config.gdb_executable;
    return document;
}

} // namespace bridge_config
