#include "host/local/local_host.hpp"
#include "host/local/compiler_output_parser.hpp"
#include "host/local/gtest_output_parser.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>

namespace local_host {

static constexpr size_t kFailureTailLines = 20;

static std::string lowercase(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lowered;
}

static bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

host::BuildOutcome build_outcome_for(const std::string &output, const platform::ExitStatus &status) {
    host::BuildOutcome outcome;
    CompilerDiagnostics diagnostics = parse_compiler_output(output);
    outcome.errors = diagnostics.errors;
    outcome.warnings = diagnostics.warnings;
    outcome.aborted = status.signal_number != 0;

    if (status.exit_code != 0 && outcome.errors.empty() && !outcome.aborted) {
        host::BuildMessage placeholder;
        placeholder.message = "Build command exited with code " + std::to_string(status.exit_code);
        std::string tail = output_tail(output, kFailureTailLines);
        if (!tail.empty()) {
            placeholder.message += "\n" + tail;
        }
        outcome.errors.push_back(placeholder);
    }
    return outcome;
}

LocalHost::LocalHost(const std::vector<LocalProject> &projects, const LocalHostOptions &options)
    : context_("local-host"),
      projects_(projects),
      options_(options),
      debugger_(std::make_unique<gdb_session::GdbDebugger>(context_, options.gdb_executable,
                                                           options.terminate_grace)),
      build_activity_(std::make_shared<BuildActivity>()) {}

LocalHost::~LocalHost() {
    shutdown();
}

std::optional<host::ProjectInfo> LocalHost::find_project(const std::string &project_reference) {
    if (projects_.empty()) {
        return std::nullopt;
    }
    if (!project_reference.empty()) {
        std::string lowered_reference = lowercase(project_reference);
        for (const auto &project : projects_) {
            if (project.info.base_path == project_reference || ends_with(project.info.base_path, project_reference) ||
                lowercase(project.info.name) == lowered_reference) {
                return project.info;
            }
        }
        debug_log::log("No project matches '" + project_reference + "', using " + projects_.front().info.name);
    }
    return projects_.front().info;
}

std::vector<host::ProjectInfo> LocalHost::list_projects() {
    std::vector<host::ProjectInfo> projects;
    for (const auto &project : projects_) {
        projects.push_back(project.info);
    }
    return projects;
}

const LocalProject *LocalHost::project_for(const host::ProjectInfo &project) const {
    for (const auto &candidate : projects_) {
        if (candidate.info.base_path == project.base_path && candidate.info.name == project.name) {
            return &candidate;
        }
    }
    return nullptr;
}

std::vector<host::RunConfiguration> LocalHost::list_run_configurations(const host::ProjectInfo &project) {
    const LocalProject *local_project = project_for(project);
    if (local_project == nullptr) {
        return {};
    }
    return local_project->run_configurations;
}

std::shared_ptr<LocalProcess> LocalHost::start_tracked(const ProcessStart &start, const ProcessCallbacks &callbacks,
                                                       std::string &error_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            error_message = "Host is shut down";
            return nullptr;
        }
    }

    std::shared_ptr<LocalProcess> process = LocalProcess::start(start, callbacks, error_message);
    if (!process) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    processes_.erase(std::remove_if(processes_.begin(), processes_.end(),
                                    [](const std::shared_ptr<LocalProcess> &tracked) {
                                        return tracked->is_terminated();
                                    }),
                     processes_.end());
    processes_.push_back(process);
    return process;
}

host::LaunchResult LocalHost::launch(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                                     const host::ProcessListener &listener) {
    host::LaunchResult result;
    if (configuration.command.empty()) {
        result.error_message = "Run configuration '" + configuration.name + "' has no command";
        return result;
    }

    ProcessStart start;
    start.executable = configuration.command.front();
    start.arguments.assign(configuration.command.begin() + 1, configuration.command.end());
    start.working_directory =
        configuration.working_directory.empty() ? project.base_path : configuration.working_directory;
    start.environment = configuration.environment;
    start.terminate_grace = options_.terminate_grace;

    std::string error_message;
    std::shared_ptr<LocalProcess> process = start_tracked(start, callbacks_for(listener), error_message);
    if (!process) {
        result.error_message = error_message;
        return result;
    }

    result.success = true;
    result.process = process;
    return result;
}

void BuildActivity::started(const std::string &base_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[base_path]++;
}

void BuildActivity::finished(const std::string &base_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iterator = active_.find(base_path);
    if (iterator != active_.end() && --iterator->second <= 0) {
        active_.erase(iterator);
    }
}

bool BuildActivity::is_active(const std::string &base_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(base_path) > 0;
}

namespace {

// Output of one build, shared between the reader thread and the exit callback.
struct BuildCapture {
    std::mutex mutex;
    std::string output;
    size_t limit = 0;
    bool truncated = false;
};

} // namespace

void LocalHost::build(const host::ProjectInfo &project, bool incremental,
                      std::function<void(const host::BuildOutcome &outcome)> on_finished) {
    const LocalProject *local_project = project_for(project);
    const std::vector<std::string> *command = nullptr;
    if (local_project != nullptr) {
        command = incremental ? &local_project->incremental_build_command : &local_project->rebuild_command;
    }
    if (command == nullptr || command->empty()) {
        host::BuildOutcome outcome;
        host::BuildMessage message;
        message.message = "No build command configured for project " + project.name;
        outcome.errors.push_back(message);
        on_finished(outcome);
        return;
    }

    build_activity_->started(project.base_path);

    auto capture = std::make_shared<BuildCapture>();
    capture->limit = options_.build_output_limit;

    ProcessCallbacks callbacks;
    callbacks.on_text = [capture](const std::string &text) {
        std::lock_guard<std::mutex> lock(capture->mutex);
        if (capture->output.size() + text.size() <= capture->limit) {
            capture->output += text;
        } else {
            capture->truncated = true;
        }
    };
    std::string base_path = project.base_path;
    std::shared_ptr<BuildActivity> activity = build_activity_;
    callbacks.on_exit = [activity, capture, base_path, on_finished](const platform::ExitStatus &status) {
        std::string output;
        {
            std::lock_guard<std::mutex> lock(capture->mutex);
            output = capture->output;
        }
        if (capture->truncated) {
            debug_log::log("Build output exceeded " + std::to_string(capture->limit) +
                           " bytes, diagnostics may be incomplete");
        }
        activity->finished(base_path);
        on_finished(build_outcome_for(output, status));
    };

    ProcessStart start;
    start.executable = command->front();
    start.arguments.assign(command->begin() + 1, command->end());
    start.working_directory = project.base_path;
    start.environment = local_project->environment;
    start.terminate_grace = options_.terminate_grace;

    std::string error_message;
    if (!start_tracked(start, callbacks, error_message)) {
        build_activity_->finished(project.base_path);
        host::BuildOutcome outcome;
        host::BuildMessage message;
        message.message = "Failed to start build command: " + error_message;
        outcome.errors.push_back(message);
        on_finished(outcome);
        return;
    }
    debug_log::log(std::string(incremental ? "Incremental build" : "Rebuild") + " of " + project.name + " started");
}

host::TestLaunch LocalHost::prepare_tests(const host::ProjectInfo &project, const std::string &pattern) {
    host::TestLaunch launch;
    const LocalProject *local_project = project_for(project);
    if (local_project == nullptr || local_project->test_command.empty()) {
        launch.error_message = "No test command configured for project " + project.name;
        return launch;
    }

    launch.configuration.name = "test: " + pattern;
    launch.configuration.command = local_project->test_command;
    launch.configuration.working_directory = project.base_path;
    launch.configuration.environment = local_project->environment;

    std::string argument = local_project->test_filter_argument;
    if (!argument.empty()) {
        size_t placeholder = argument.find("{filter}");
        if (placeholder != std::string::npos) {
            argument.replace(placeholder, 8, gtest_filter_for_pattern(pattern));
        }
        launch.configuration.command.push_back(argument);
    }

    launch.results = std::make_shared<GtestResultSource>(context_);
    launch.success = true;
    return launch;
}

bool LocalHost::is_activity_in_progress(const host::ProjectInfo &project, host::OperationClass operation_class) {
    const LocalProject *local_project = project_for(project);
    if (operation_class == host::OperationClass::Build) {
        if (build_activity_->is_active(project.base_path)) {
            return true;
        }
        return local_project != nullptr && !local_project->build_activity_marker.empty() &&
               platform::path_exists(local_project->build_activity_marker);
    }
    return local_project != nullptr && !local_project->test_activity_marker.empty() &&
           platform::path_exists(local_project->test_activity_marker);
}

void LocalHost::shutdown() {
    std::vector<std::shared_ptr<LocalProcess>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        running.swap(processes_);
    }

    debugger_->shutdown();

    for (const auto &process : running) {
        process->terminate();
    }
    auto wait_limit = options_.terminate_grace + std::chrono::milliseconds(1000);
    for (const auto &process : running) {
        if (!process->wait_finished(wait_limit)) {
            debug_log::warn("Process " + std::to_string(process->process_id()) + " did not exit during shutdown");
        }
    }

    context_.shutdown();
    debug_log::log("Local host shut down");
}

} // namespace local_host
