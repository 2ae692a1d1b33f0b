#ifndef DEVBRIDGE_LOCAL_HOST_HPP
#define DEVBRIDGE_LOCAL_HOST_HPP

// host::Host over local processes: projects from a project file, builds and
// tests as child processes, run configurations launched directly, gdb as the
// debugger.

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "host/application_context.hpp"
#include "host/gdb/gdb_debugger.hpp"
#include "host/host_abi.hpp"
#include "host/local/local_process.hpp"
#include "host/local/project_file.hpp"

namespace local_host {

struct LocalHostOptions {
    std::chrono::milliseconds terminate_grace{2000};
    std::string gdb_executable = "gdb";
    // Build output kept for diagnostics parsing.
    size_t build_output_limit = 8 * 1024 * 1024;
};

// Builds started through a host, by project base path.
class BuildActivity {
public:
    void started(const std::string &base_path);
    void finished(const std::string &base_path);
    bool is_active(const std::string &base_path) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, int> active_;
};

class LocalHost : public host::Host {
public:
    LocalHost(const std::vector<LocalProject> &projects, const LocalHostOptions &options);
    ~LocalHost() override;

    host::ApplicationContext &application_context() override { return context_; }

    std::optional<host::ProjectInfo> find_project(const std::string &project_reference) override;
    std::vector<host::ProjectInfo> list_projects() override;
    std::vector<host::RunConfiguration> list_run_configurations(const host::ProjectInfo &project) override;

    host::LaunchResult launch(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                              const host::ProcessListener &listener) override;
    void build(const host::ProjectInfo &project, bool incremental,
               std::function<void(const host::BuildOutcome &outcome)> on_finished) override;
    host::TestLaunch prepare_tests(const host::ProjectInfo &project, const std::string &pattern) override;
    bool is_activity_in_progress(const host::ProjectInfo &project, host::OperationClass operation_class) override;

    host::Debugger *debugger() override { return debugger_.get(); }

    // Ends debug sessions, terminates every process still running, then
    // stops the application context. Idempotent.
    void shutdown();

private:
    const LocalProject *project_for(const host::ProjectInfo &project) const;
    std::shared_ptr<LocalProcess> start_tracked(const ProcessStart &start, const ProcessCallbacks &callbacks,
                                                std::string &error_message);

    host::ApplicationContext context_;
    const std::vector<LocalProject> projects_;
    const LocalHostOptions options_;
    std::unique_ptr<gdb_session::GdbDebugger> debugger_;

    std::mutex mutex_;
    // Owned until they finish, so shutdown() reaches builds too.
    std::vector<std::shared_ptr<LocalProcess>> processes_;
    // Shared with build exit callbacks.
    std::shared_ptr<BuildActivity> build_activity_;
    bool shut_down_ = false;
};

// Build outcome for captured output and the exit status of the build command.
host::BuildOutcome build_outcome_for(const std::string &output, const platform::ExitStatus &status);

} // namespace local_host

#endif // DEVBRIDGE_LOCAL_HOST_HPP
