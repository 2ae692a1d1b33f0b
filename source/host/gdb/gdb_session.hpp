#ifndef DEVBRIDGE_GDB_SESSION_HPP
#define DEVBRIDGE_GDB_SESSION_HPP

// One debugged program driven through a gdb process speaking MI.
//
// Commands carry a numeric token; the matching result record resolves the
// command's callback, which runs on the application context. Exec-async
// records (*stopped, *running) update the suspended state and position.

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "host/application_context.hpp"
#include "host/gdb/gdb_mi_parser.hpp"
#include "host/host_abi.hpp"
#include "host/local/local_process.hpp"

namespace gdb_session {

// Result record of one command; error_message is set for ^error and when
// gdb went away before answering.
struct CommandResult {
    bool success = false;
    std::string record_class;
    gdb_mi::json results = gdb_mi::json::object();
    std::string error_message;
};

using CommandCallback = std::function<void(const CommandResult &result)>;

// Frames and variables are delivered in chunks of this size.
static constexpr size_t CHILDREN_CHUNK_SIZE = 20;

class GdbSession : public host::DebugSession, public std::enable_shared_from_this<GdbSession> {
public:
    GdbSession(host::ApplicationContext &context, const std::string &id, const std::string &name);
    ~GdbSession() override;

    // Starts gdb for configuration. False with error_message set on failure.
    bool launch(const std::string &gdb_executable, const host::RunConfiguration &configuration,
                std::chrono::milliseconds terminate_grace, std::string &error_message);

    // Any thread. The callback runs on the application context.
    void send_command(const std::string &command, CommandCallback callback);

    std::string name() const override { return name_; }
    std::string id() const override { return id_; }
    bool is_active() const override;
    bool is_suspended() const override;
    host::SourcePosition current_position() const override;

    void pause() override;
    void resume() override;
    void step_over() override;
    void step_into() override;
    void step_out() override;
    void stop() override;

    bool has_evaluator() const override;
    void evaluate(const std::string &expression, const host::EvaluationCallback &callback) override;
    void compute_stack_frames(const host::StackFrameSink &sink) override;
    void compute_variables(int frame_index, const host::VariableSink &sink) override;

    // Breakpoints keyed by the debugger-level id; gdb numbers stay internal.
    void insert_breakpoint(const host::LineBreakpoint &breakpoint, CommandCallback callback);
    void remove_breakpoint(const std::string &breakpoint_id);

    // Feeds raw gdb output; public for the process listener and tests.
    void handle_output(const std::string &text);
    void handle_exit(int exit_code);

    // Blocks until gdb has exited or timeout elapses.
    bool wait_exited(std::chrono::milliseconds timeout) const;

    // Signals gdb's process group without asking gdb first.
    void terminate_process();

private:
    void handle_line(const std::string &line);
    void handle_record(const gdb_mi::Record &record);
    void handle_exec_async(const gdb_mi::Record &record);
    void deliver(CommandCallback callback, const CommandResult &result);
    std::shared_ptr<local_host::LocalProcess> process() const;

    host::ApplicationContext &context_;
    const std::string id_;
    const std::string name_;

    mutable std::mutex mutex_;
    // Published under mutex_; the reader thread may run before launch() returns.
    std::shared_ptr<local_host::LocalProcess> process_;
    std::string partial_line_;
    uint64_t next_token_ = 1;
    std::map<uint64_t, CommandCallback> pending_;
    bool active_ = false;
    bool suspended_ = false;
    bool exit_requested_ = false;
    host::SourcePosition position_;
    std::string thread_id_;
    // Debugger-level breakpoint id -> gdb breakpoint number.
    std::map<std::string, std::string> breakpoint_numbers_;
};

// MI frame tuple ({level, func, file, fullname, line}) to a stack frame.
host::StackFrameInfo frame_from_tuple(const gdb_mi::json &frame);

// MI variable tuple ({name, type, value}); a missing value means a compound.
host::VariableInfo variable_from_tuple(const gdb_mi::json &variable);

} // namespace gdb_session

#endif // DEVBRIDGE_GDB_SESSION_HPP
