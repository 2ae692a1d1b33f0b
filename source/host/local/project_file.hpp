#ifndef DEVBRIDGE_PROJECT_FILE_HPP
#define DEVBRIDGE_PROJECT_FILE_HPP

// Project definitions for the local host, read from JSON:
//
// {
//   "projects": [{
//     "name": "demo",
//     "basePath": ".",
//     "environment": {"CC": "gcc"},
//     "build": {"incremental": ["make"], "rebuild": ["make", "-B"]},
//     "test": {"command": ["./build/unit_tests"], "filterArgument": "--gtest_filter={filter}"},
//     "runConfigurations": [{"name": "server", "command": ["./build/server"],
//                            "workingDirectory": "build", "environment": {}}],
//     "activityMarkers": {"build": ".build-running", "test": ".test-running"}
//   }]
// }
//
// A document without "projects" is a single project. Relative paths resolve
// against the project file's directory (basePath) or the base path (the rest).

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

#include "host/host_abi.hpp"

namespace local_host {

using json = nlohmann::json;

static constexpr char DEFAULT_FILTER_ARGUMENT[] = "--gtest_filter={filter}";

struct LocalProject {
    host::ProjectInfo info;
    std::map<std::string, std::string> environment;
    std::vector<std::string> incremental_build_command;
    std::vector<std::string> rebuild_command;
    std::vector<std::string> test_command;
    // "{filter}" is replaced with the translated test pattern.
    std::string test_filter_argument = DEFAULT_FILTER_ARGUMENT;
    std::vector<host::RunConfiguration> run_configurations;
    // Absolute paths; empty = no marker.
    std::string build_activity_marker;
    std::string test_activity_marker;
};

struct ProjectFileResult {
    bool success = false;
    std::vector<LocalProject> projects;
    std::string error_detail;
};

ProjectFileResult parse_projects(const json &document, const std::string &base_directory);

ProjectFileResult load_project_file(const std::string &file_path);

// Translates a test pattern into a GoogleTest filter:
// "Suite#Name" -> "Suite.Name", "Suite" -> "Suite.*", "Prefix*" unchanged.
std::string gtest_filter_for_pattern(const std::string &pattern);

} // namespace local_host

#endif // DEVBRIDGE_PROJECT_FILE_HPP
