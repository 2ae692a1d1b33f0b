#ifndef DEVBRIDGE_GDB_DEBUGGER_HPP
#define DEVBRIDGE_GDB_DEBUGGER_HPP

// host::Debugger backed by gdb sessions. Owns the line breakpoints; each
// new session receives all of them before the program starts and live
// sessions follow every change.

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "host/application_context.hpp"
#include "host/gdb/gdb_session.hpp"
#include "host/host_abi.hpp"

namespace gdb_session {

class GdbDebugger : public host::Debugger {
public:
    GdbDebugger(host::ApplicationContext &context, const std::string &gdb_executable,
                std::chrono::milliseconds terminate_grace);
    ~GdbDebugger() override;

    std::shared_ptr<host::DebugSession> current_session() override;
    std::vector<std::shared_ptr<host::DebugSession>> sessions() override;

    void start_session(const host::ProjectInfo &project, const host::RunConfiguration &configuration,
                       std::function<void(const host::SessionStart &start)> on_started) override;

    std::vector<host::LineBreakpoint> breakpoints() override;
    host::BreakpointChange set_breakpoint(const std::string &file, int line, const std::string &condition) override;
    host::BreakpointChange remove_breakpoint(const std::string &file, int line) override;

    // Ends every session, waiting up to grace for gdb to exit before killing it.
    void shutdown();

private:
    std::vector<std::shared_ptr<GdbSession>> live_sessions();

    host::ApplicationContext &context_;
    const std::string gdb_executable_;
    const std::chrono::milliseconds terminate_grace_;

    std::mutex mutex_;
    std::vector<std::shared_ptr<GdbSession>> sessions_;
    std::vector<host::LineBreakpoint> breakpoints_;
    uint64_t next_session_ = 1;
    uint64_t next_breakpoint_ = 1;
};

} // namespace gdb_session

#endif // DEVBRIDGE_GDB_DEBUGGER_HPP
