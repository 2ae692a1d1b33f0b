#include "host/local/project_file.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>

namespace local_host {

namespace {

std::string resolve_path(const std::string &path, const std::string &relative_to) {
    if (path.empty()) {
        return relative_to;
    }
    std::filesystem::path resolved(path);
    if (resolved.is_relative()) {
        resolved = std::filesystem::path(relative_to) / resolved;
    }
    std::string normalized = resolved.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool read_string_list(const json &object, const char *key, std::vector<std::string> &values,
                      std::string &error_detail) {
    if (!object.contains(key)) {
        return true;
    }
    const json &entry = object[key];
    if (!entry.is_array() || entry.empty()) {
        error_detail = std::string("'") + key + "' must be a non-empty array of strings";
        return false;
    }
    for (const auto &item : entry) {
        if (!item.is_string()) {
            error_detail = std::string("'") + key + "' must be a non-empty array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    return true;
}

bool read_string(const json &object, const char *key, std::string &value, std::string &error_detail) {
    if (!object.contains(key)) {
        return true;
    }
    if (!object[key].is_string()) {
        error_detail = std::string("'") + key + "' must be a string";
        return false;
    }
    value = object[key].get<std::string>();
    return true;
}

bool read_environment(const json &object, std::map<std::string, std::string> &environment,
                      std::string &error_detail) {
    if (!object.contains("environment")) {
        return true;
    }
    const json &entry = object["environment"];
    if (!entry.is_object()) {
        error_detail = "'environment' must be an object of strings";
        return false;
    }
    for (auto iterator = entry.begin(); iterator != entry.end(); ++iterator) {
        if (!iterator.value().is_string()) {
            error_detail = "environment variable '" + iterator.key() + "' must be a string";
            return false;
        }
        environment[iterator.key()] = iterator.value().get<std::string>();
    }
    return true;
}

bool parse_run_configuration(const json &entry, const LocalProject &project, host::RunConfiguration &configuration,
                             std::string &error_detail) {
    if (!entry.is_object()) {
        error_detail = "run configuration must be an object";
        return false;
    }
    if (!entry.contains("name") || !entry["name"].is_string() || entry["name"].get<std::string>().empty()) {
        error_detail = "run configuration needs a 'name'";
        return false;
    }
    configuration.name = entry["name"].get<std::string>();

    if (!entry.contains("command")) {
        error_detail = "run configuration '" + configuration.name + "' needs a 'command'";
        return false;
    }
    std::string working_directory;
    if (!read_string_list(entry, "command", configuration.command, error_detail) ||
        !read_string(entry, "workingDirectory", working_directory, error_detail)) {
        error_detail = "run configuration '" + configuration.name + "': " + error_detail;
        return false;
    }
    configuration.working_directory = resolve_path(working_directory, project.info.base_path);

    configuration.environment = project.environment;
    if (!read_environment(entry, configuration.environment, error_detail)) {
        error_detail = "run configuration '" + configuration.name + "': " + error_detail;
        return false;
    }
    return true;
}

bool parse_project(const json &entry, const std::string &base_directory, LocalProject &project,
                   std::string &error_detail) {
    if (!entry.is_object()) {
        error_detail = "project entry must be an object";
        return false;
    }

    std::string base_path;
    if (!read_string(entry, "name", project.info.name, error_detail) ||
        !read_string(entry, "basePath", base_path, error_detail)) {
        return false;
    }
    project.info.base_path = resolve_path(base_path, base_directory);
    if (project.info.name.empty()) {
        project.info.name = std::filesystem::path(project.info.base_path).filename().string();
    }

    if (!read_environment(entry, project.environment, error_detail)) {
        return false;
    }

    if (entry.contains("build")) {
        const json &build = entry["build"];
        if (!build.is_object()) {
            error_detail = "'build' must be an object";
            return false;
        }
        if (!read_string_list(build, "incremental", project.incremental_build_command, error_detail) ||
            !read_string_list(build, "rebuild", project.rebuild_command, error_detail)) {
            return false;
        }
        if (project.rebuild_command.empty()) {
            project.rebuild_command = project.incremental_build_command;
        }
    }

    if (entry.contains("test")) {
        const json &test = entry["test"];
        if (!test.is_object()) {
            error_detail = "'test' must be an object";
            return false;
        }
        if (!read_string_list(test, "command", project.test_command, error_detail) ||
            !read_string(test, "filterArgument", project.test_filter_argument, error_detail)) {
            return false;
        }
    }

    if (entry.contains("runConfigurations")) {
        const json &configurations = entry["runConfigurations"];
        if (!configurations.is_array()) {
            error_detail = "'runConfigurations' must be an array";
            return false;
        }
        for (const auto &configuration_entry : configurations) {
            host::RunConfiguration configuration;
            if (!parse_run_configuration(configuration_entry, project, configuration, error_detail)) {
                return false;
            }
            project.run_configurations.push_back(configuration);
        }
    }

    if (entry.contains("activityMarkers")) {
        const json &markers = entry["activityMarkers"];
        if (!markers.is_object()) {
            error_detail = "'activityMarkers' must be an object";
            return false;
        }
        std::string build_marker;
        std::string test_marker;
        if (!read_string(markers, "build", build_marker, error_detail) ||
            !read_string(markers, "test", test_marker, error_detail)) {
            return false;
        }
        if (!build_marker.empty()) {
            project.build_activity_marker = resolve_path(build_marker, project.info.base_path);
        }
        if (!test_marker.empty()) {
            project.test_activity_marker = resolve_path(test_marker, project.info.base_path);
        }
    }
    return true;
}

} // namespace

ProjectFileResult parse_projects(const json &document, const std::string &base_directory) {
    ProjectFileResult result;
    if (!document.is_object()) {
        result.error_detail = "Project file must be a JSON object";
        return result;
    }

    json entries = json::array();
    if (document.contains("projects")) {
        if (!document["projects"].is_array()) {
            result.error_detail = "'projects' must be an array";
            return result;
        }
        entries = document["projects"];
    } else {
        entries.push_back(document);
    }

    for (size_t index = 0; index < entries.size(); index++) {
        LocalProject project;
        std::string error_detail;
        if (!parse_project(entries[index], base_directory, project, error_detail)) {
            result.error_detail = "Project " + std::to_string(index) + ": " + error_detail;
            result.projects.clear();
            return result;
        }
        result.projects.push_back(project);
    }

    result.success = true;
    return result;
}

ProjectFileResult load_project_file(const std::string &file_path) {
    ProjectFileResult result;

    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        result.error_detail = "Cannot read project file: " + file_path;
        return result;
    }

    json document;
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &parse_error) {
        result.error_detail = "Invalid JSON in project file " + file_path + ": " + parse_error.what();
        return result;
    }

    std::filesystem::path directory = std::filesystem::absolute(std::filesystem::path(file_path)).parent_path();
    result = parse_projects(document, directory.string());
    if (result.success) {
        debug_log::log("Loaded " + std::to_string(result.projects.size()) + " project(s) from " + file_path);
    }
    return result;
}

std::string gtest_filter_for_pattern(const std::string &pattern) {
    if (pattern.empty()) {
        return "*";
    }
    size_t hash = pattern.find('#');
    if (hash != std::string::npos) {
        return pattern.substr(0, hash) + "." + pattern.substr(hash + 1);
    }
    if (pattern.find('*') != std::string::npos || pattern.find('.') != std::string::npos) {
        return pattern;
    }
    return pattern + ".*";
}

} // namespace local_host
