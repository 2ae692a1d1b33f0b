#include "host/gdb/gdb_debugger.hpp"
#include "host/gdb/gdb_launch.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <atomic>

namespace gdb_session {

static std::string location_text(const std::string &file, int line) {
    return file + ":" + std::to_string(line);
}

GdbDebugger::GdbDebugger(host::ApplicationContext &context, const std::string &gdb_executable,
                         std::chrono::milliseconds terminate_grace)
    : context_(context), gdb_executable_(gdb_executable), terminate_grace_(terminate_grace) {}

GdbDebugger::~GdbDebugger() {
    shutdown();
}

std::vector<std::shared_ptr<GdbSession>> GdbDebugger::live_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::shared_ptr<GdbSession> &session) { return !session->is_active(); }),
                    sessions_.end());
    return sessions_;
}

std::shared_ptr<host::DebugSession> GdbDebugger::current_session() {
    std::vector<std::shared_ptr<GdbSession>> live = live_sessions();
    if (live.empty()) {
        return nullptr;
    }
    return live.back();
}

std::vector<std::shared_ptr<host::DebugSession>> GdbDebugger::sessions() {
    std::vector<std::shared_ptr<host::DebugSession>> result;
    for (const auto &session : live_sessions()) {
        result.push_back(session);
    }
    return result;
}

void GdbDebugger::start_session(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                                std::function<void(const host::SessionStart &start)> on_started) {
    auto reported = std::make_shared<std::atomic<bool>>(false);
    auto finish = [reported, on_started](const host::SessionStart &start) {
        if (!reported->exchange(true) && on_started) {
            on_started(start);
        }
    };
    auto fail = [finish](const std::string &message) {
        host::SessionStart start;
        start.error_message = message;
        finish(start);
    };

    if (configuration.command.empty()) {
        fail("Run configuration '" + configuration.name + "' has no command");
        return;
    }
    std::string executable = gdb_launch::find_gdb_executable(gdb_executable_);
    if (executable.empty()) {
        fail("gdb executable not found: " + gdb_executable_);
        return;
    }

    std::vector<host::LineBreakpoint> installed;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id = "debug-" + std::to_string(next_session_++);
        installed = breakpoints_;
    }

    auto session = std::make_shared<GdbSession>(context_, session_id, configuration.name);
    std::string error_message;
    if (!session->launch(executable, configuration, terminate_grace_, error_message)) {
        fail("Failed to start gdb: " + error_message);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.push_back(session);
    }
    debug_log::log("Debug session " + session_id + " for '" + configuration.name + "' in project " +
                   project.name + " with " + std::to_string(installed.size()) + " breakpoint(s)");

    for (const auto &breakpoint : installed) {
        std::string location = location_text(breakpoint.file, breakpoint.line);
        session->insert_breakpoint(breakpoint, [location](const CommandResult &result) {
            if (!result.success) {
                debug_log::warn("Breakpoint at " + location + " not installed: " + result.error_message);
            }
        });
    }

    session->send_command("-exec-run", [finish, fail, session](const CommandResult &result) {
        if (!result.success) {
            fail("Failed to run program: " + result.error_message);
            session->stop();
            return;
        }
        host::SessionStart start;
        start.success = true;
        start.session = session;
        finish(start);
    });
}

std::vector<host::LineBreakpoint> GdbDebugger::breakpoints() {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakpoints_;
}

host::BreakpointChange GdbDebugger::set_breakpoint(const std::string &file, int line, const std::string &condition) {
    host::BreakpointChange change;
    if (file.empty() || line < 1) {
        change.error_message = "Invalid breakpoint location " + location_text(file, line);
        return change;
    }

    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = std::find_if(breakpoints_.begin(), breakpoints_.end(),
                                     [&file, line](const host::LineBreakpoint &breakpoint) {
                                         return breakpoint.file == file && breakpoint.line == line;
                                     });
        if (existing != breakpoints_.end()) {
            existing->condition = condition;
            change.breakpoint = *existing;
            replaced = true;
        } else {
            host::LineBreakpoint breakpoint;
            breakpoint.id = "bp-" + std::to_string(next_breakpoint_++);
            breakpoint.file = file;
            breakpoint.line = line;
            breakpoint.condition = condition;
            breakpoints_.push_back(breakpoint);
            change.breakpoint = breakpoint;
        }
    }

    std::string location = location_text(file, line);
    for (const auto &session : live_sessions()) {
        if (replaced) {
            session->remove_breakpoint(change.breakpoint.id);
        }
        session->insert_breakpoint(change.breakpoint, [location](const CommandResult &result) {
            if (!result.success) {
                debug_log::warn("Breakpoint at " + location + " not applied: " + result.error_message);
            }
        });
    }

    change.success = true;
    return change;
}

host::BreakpointChange GdbDebugger::remove_breakpoint(const std::string &file, int line) {
    host::BreakpointChange change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = std::find_if(breakpoints_.begin(), breakpoints_.end(),
                                     [&file, line](const host::LineBreakpoint &breakpoint) {
                                         return breakpoint.file == file && breakpoint.line == line;
                                     });
        if (existing == breakpoints_.end()) {
            change.not_found = true;
            return change;
        }
        change.breakpoint = *existing;
        breakpoints_.erase(existing);
    }

    for (const auto &session : live_sessions()) {
        session->remove_breakpoint(change.breakpoint.id);
    }
    change.success = true;
    return change;
}

void GdbDebugger::shutdown() {
    std::vector<std::shared_ptr<GdbSession>> ending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ending.swap(sessions_);
    }
    for (const auto &session : ending) {
        session->stop();
    }
    for (const auto &session : ending) {
        if (!session->wait_exited(terminate_grace_)) {
            debug_log::warn("gdb session '" + session->name() + "' did not exit, terminating");
            session->terminate_process();
        }
    }
}

} // namespace gdb_session
