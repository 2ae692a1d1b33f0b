#ifndef DEVBRIDGE_REQUEST_ARGUMENTS_HPP
#define DEVBRIDGE_REQUEST_ARGUMENTS_HPP

// Typed reads of request arguments. Each returns false with error set when
// a required field is missing or a present field has the wrong type; an
// absent optional field leaves value untouched.

#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace request_arguments {

using json = nlohmann::json;

bool read_string(const json &arguments, const char *key, bool required, std::string &value, std::string &error);

bool read_bool(const json &arguments, const char *key, bool &value, std::string &error);

// Integers below minimum are rejected.
bool read_int(const json &arguments, const char *key, bool required, int minimum, int &value, std::string &error);

// Positive number of seconds (fractions allowed) under key.
bool read_seconds(const json &arguments, const char *key, std::optional<std::chrono::milliseconds> &value,
                  std::string &error);

} // namespace request_arguments

#endif // DEVBRIDGE_REQUEST_ARGUMENTS_HPP
