#include "request/request_arguments.hpp"

#include <limits>

namespace request_arguments {

bool read_string(const json &arguments, const char *key, bool required, std::string &value, std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        if (required) {
            error = std::string("Missing required parameter '") + key + "' (string).";
            return false;
        }
        return true;
    }
    if (!arguments[key].is_string()) {
        error = std::string("Parameter '") + key + "' must be a string.";
        return false;
    }
    value = arguments[key].get<std::string>();
    if (required && value.empty()) {
        error = std::string("Parameter '") + key + "' must not be empty.";
        return false;
    }
    return true;
}

bool read_bool(const json &arguments, const char *key, bool &value, std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    if (!arguments[key].is_boolean()) {
        error = std::string("Parameter '") + key + "' must be a boolean.";
        return false;
    }
    value = arguments[key].get<bool>();
    return true;
}

bool read_int(const json &arguments, const char *key, bool required, int minimum, int &value, std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        if (required) {
            error = std::string("Missing required parameter '") + key + "' (integer).";
            return false;
        }
        return true;
    }
    const json &entry = arguments[key];
    if (!entry.is_number_integer()) {
        error = std::string("Parameter '") + key + "' must be an integer.";
        return false;
    }
    long long number = entry.get<long long>();
    if (number < minimum || number > std::numeric_limits<int>::max()) {
        error = std::string("Parameter '") + key + "' must be at least " + std::to_string(minimum) + ".";
        return false;
    }
    value = static_cast<int>(number);
    return true;
}

bool read_seconds(const json &arguments, const char *key, std::optional<std::chrono::milliseconds> &value,
                  std::string &error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return true;
    }
    const json &entry = arguments[key];
    if (!entry.is_number()) {
        error = std::string("Parameter '") + key + "' must be a number of seconds.";
        return false;
    }
    double seconds = entry.get<double>();
    if (!(seconds > 0) || seconds > 86400.0 * 365) {
        error = std::string("Parameter '") + key + "' must be a positive number of seconds.";
        return false;
    }
    value = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    return true;
}

} // namespace request_arguments
