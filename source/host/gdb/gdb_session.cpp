#include "host/gdb/gdb_session.hpp"
#include "host/gdb/gdb_launch.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace gdb_session {

static CommandCallback warn_on_failure(const std::string &session_name, const std::string &command) {
    return [session_name, command](const CommandResult &result) {
        if (!result.success) {
            debug_log::warn("gdb session '" + session_name + "': " + command + " failed: " + result.error_message);
        }
    };
}

host::StackFrameInfo frame_from_tuple(const gdb_mi::json &frame) {
    host::StackFrameInfo info;
    info.index = gdb_mi::int_field(frame, "level");
    info.function_name = gdb_mi::string_field(frame, "func", "??");
    info.file = gdb_mi::string_field(frame, "fullname", gdb_mi::string_field(frame, "file"));
    info.line = gdb_mi::int_field(frame, "line");
    return info;
}

host::VariableInfo variable_from_tuple(const gdb_mi::json &variable) {
    host::VariableInfo info;
    info.name = gdb_mi::string_field(variable, "name");
    info.type = gdb_mi::string_field(variable, "type");
    // --simple-values leaves out the value of arrays, structs and unions.
    info.has_children = !(variable.is_object() && variable.contains("value"));
    info.value = gdb_mi::string_field(variable, "value", info.has_children ? "{...}" : "");
    return info;
}

GdbSession::GdbSession(host::ApplicationContext &context, const std::string &id, const std::string &name)
    : context_(context), id_(id), name_(name) {}

GdbSession::~GdbSession() {
    if (process_ && !process_->is_terminated()) {
        process_->terminate();
    }
}

bool GdbSession::launch(const std::string &gdb_executable, const host::RunConfiguration &configuration,
                        std::chrono::milliseconds terminate_grace, std::string &error_message) {
    gdb_launch::GdbCommandLine command_line = gdb_launch::build_gdb_command_line(gdb_executable, configuration);

    local_host::ProcessStart start;
    start.executable = command_line.executable_path;
    start.arguments = command_line.arguments;
    start.working_directory = configuration.working_directory;
    start.environment = configuration.environment;
    start.pipe_stdin = true;
    start.terminate_grace = terminate_grace;

    std::weak_ptr<GdbSession> weak_session = shared_from_this();
    local_host::ProcessCallbacks callbacks;
    callbacks.on_text = [weak_session](const std::string &text) {
        if (auto session = weak_session.lock()) {
            session->handle_output(text);
        }
    };
    callbacks.on_exit = [weak_session](const platform::ExitStatus &status) {
        if (auto session = weak_session.lock()) {
            session->handle_exit(status.exit_code);
        }
    };

    // Holding the lock keeps an early exit record waiting until the handle is published.
    std::shared_ptr<local_host::LocalProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = true;
        process_ = local_host::LocalProcess::start(start, callbacks, error_message);
        process = process_;
        if (!process_) {
            active_ = false;
            return false;
        }
    }

    debug_log::log("gdb session '" + name_ + "' started (pid " + std::to_string(process->process_id()) + ")");
    for (const auto &command : gdb_launch::session_setup_commands()) {
        send_command(command, warn_on_failure(name_, command));
    }
    return true;
}

std::shared_ptr<local_host::LocalProcess> GdbSession::process() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_;
}

void GdbSession::deliver(CommandCallback callback, const CommandResult &result) {
    if (!callback) {
        return;
    }
    if (!context_.invoke_later([callback, result]() { callback(result); })) {
        debug_log::log("gdb session '" + name_ + "': result dropped, application context is shut down");
    }
}

void GdbSession::send_command(const std::string &command, CommandCallback callback) {
    uint64_t token = 0;
    std::shared_ptr<local_host::LocalProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = process_;
        if (!active_ || !process) {
            CommandResult result;
            result.error_message = "Debug session has ended";
            deliver(callback, result);
            return;
        }
        token = next_token_++;
        if (callback) {
            pending_[token] = callback;
        }
    }

    debug_log::log("gdb <- " + std::to_string(token) + command);
    if (!process->write_input(std::to_string(token) + command + "\n")) {
        CommandCallback failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto iterator = pending_.find(token);
            if (iterator != pending_.end()) {
                failed = iterator->second;
                pending_.erase(iterator);
            }
        }
        CommandResult result;
        result.error_message = "Failed to send command to gdb";
        deliver(failed, result);
    }
}

bool GdbSession::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool GdbSession::is_suspended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && suspended_;
}

host::SourcePosition GdbSession::current_position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

void GdbSession::pause() {
    send_command("-exec-interrupt", warn_on_failure(name_, "-exec-interrupt"));
}

void GdbSession::resume() {
    send_command("-exec-continue", warn_on_failure(name_, "-exec-continue"));
}

void GdbSession::step_over() {
    send_command("-exec-next", warn_on_failure(name_, "-exec-next"));
}

void GdbSession::step_into() {
    send_command("-exec-step", warn_on_failure(name_, "-exec-step"));
}

void GdbSession::step_out() {
    send_command("-exec-finish", warn_on_failure(name_, "-exec-finish"));
}

void GdbSession::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || exit_requested_) {
            return;
        }
        exit_requested_ = true;
    }
    debug_log::log("gdb session '" + name_ + "' stopping");
    std::shared_ptr<local_host::LocalProcess> process = this->process();
    if (process && !process->write_input("-gdb-exit\n")) {
        process->terminate();
    }
}

bool GdbSession::has_evaluator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && suspended_;
}

void GdbSession::evaluate(const std::string &expression, const host::EvaluationCallback &callback) {
    std::weak_ptr<GdbSession> weak_session = shared_from_this();
    send_command("-var-create - * " + gdb_mi::quote_argument(expression),
                 [weak_session, expression, callback](const CommandResult &result) {
                     if (!result.success) {
                         if (callback.error_occurred) {
                             callback.error_occurred(result.error_message);
                         }
                         return;
                     }

                     host::VariableInfo value;
                     value.name = expression;
                     value.value = gdb_mi::string_field(result.results, "value");
                     value.type = gdb_mi::string_field(result.results, "type");
                     value.has_children = gdb_mi::int_field(result.results, "numchild") > 0;

                     std::string variable_object = gdb_mi::string_field(result.results, "name");
                     auto session = weak_session.lock();
                     if (session && !variable_object.empty()) {
                         session->send_command("-var-delete " + variable_object, nullptr);
                     }
                     if (callback.evaluated) {
                         callback.evaluated(value);
                     }
                 });
}

void GdbSession::compute_stack_frames(const host::StackFrameSink &sink) {
    std::string command = "-stack-list-frames";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_id_.empty()) {
            command += " --thread " + thread_id_;
        }
    }
    send_command(command, [sink](const CommandResult &result) {
        if (!result.success) {
            if (sink.error_occurred) {
                sink.error_occurred(result.error_message);
            }
            return;
        }

        std::vector<host::StackFrameInfo> frames;
        const gdb_mi::json &stack = result.results.contains("stack") ? result.results["stack"]
                                                                      : gdb_mi::json::array();
        for (const auto &frame : stack) {
            frames.push_back(frame_from_tuple(frame));
        }

        if (!sink.add_frames) {
            return;
        }
        if (frames.empty()) {
            sink.add_frames(frames, true);
            return;
        }
        for (size_t offset = 0; offset < frames.size(); offset += CHILDREN_CHUNK_SIZE) {
            size_t end = std::min(frames.size(), offset + CHILDREN_CHUNK_SIZE);
            std::vector<host::StackFrameInfo> chunk(frames.begin() + offset, frames.begin() + end);
            sink.add_frames(chunk, end == frames.size());
        }
    });
}

void GdbSession::compute_variables(int frame_index, const host::VariableSink &sink) {
    std::string command = "-stack-list-variables";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_id_.empty()) {
            command += " --thread " + thread_id_;
        }
    }
    command += " --frame " + std::to_string(frame_index) + " --simple-values";

    send_command(command, [sink](const CommandResult &result) {
        if (!result.success) {
            if (sink.error_occurred) {
                sink.error_occurred(result.error_message);
            }
            return;
        }

        std::vector<host::VariableInfo> variables;
        const gdb_mi::json &listed = result.results.contains("variables") ? result.results["variables"]
                                                                           : gdb_mi::json::array();
        for (const auto &variable : listed) {
            variables.push_back(variable_from_tuple(variable));
        }

        if (!sink.add_variables) {
            return;
        }
        if (variables.empty()) {
            sink.add_variables(variables, true);
            return;
        }
        for (size_t offset = 0; offset < variables.size(); offset += CHILDREN_CHUNK_SIZE) {
            size_t end = std::min(variables.size(), offset + CHILDREN_CHUNK_SIZE);
            std::vector<host::VariableInfo> chunk(variables.begin() + offset, variables.begin() + end);
            sink.add_variables(chunk, end == variables.size());
        }
    });
}

void GdbSession::insert_breakpoint(const host::LineBreakpoint &breakpoint, CommandCallback callback) {
    std::string command = "-break-insert -f";
    if (!breakpoint.condition.empty()) {
        command += " -c " + gdb_mi::quote_argument(breakpoint.condition);
    }
    if (!breakpoint.enabled) {
        command += " -d";
    }
    command += " " + gdb_mi::quote_argument(breakpoint.file + ":" + std::to_string(breakpoint.line));

    std::weak_ptr<GdbSession> weak_session = shared_from_this();
    std::string breakpoint_id = breakpoint.id;
    send_command(command, [weak_session, breakpoint_id, callback](const CommandResult &result) {
        if (result.success) {
            std::string number = gdb_mi::string_field(result.results.value("bkpt", gdb_mi::json::object()), "number");
            auto session = weak_session.lock();
            if (session && !number.empty()) {
                std::lock_guard<std::mutex> lock(session->mutex_);
                session->breakpoint_numbers_[breakpoint_id] = number;
            }
        }
        if (callback) {
            callback(result);
        }
    });
}

void GdbSession::remove_breakpoint(const std::string &breakpoint_id) {
    std::string number;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iterator = breakpoint_numbers_.find(breakpoint_id);
        if (iterator == breakpoint_numbers_.end()) {
            return;
        }
        number = iterator->second;
        breakpoint_numbers_.erase(iterator);
    }
    send_command("-break-delete " + number, warn_on_failure(name_, "-break-delete " + number));
}

void GdbSession::handle_output(const std::string &text) {
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        partial_line_ += text;
        size_t line_start = 0;
        for (;;) {
            size_t newline = partial_line_.find('\n', line_start);
            if (newline == std::string::npos) {
                break;
            }
            lines.push_back(partial_line_.substr(line_start, newline - line_start));
            line_start = newline + 1;
        }
        partial_line_.erase(0, line_start);
    }
    for (const auto &line : lines) {
        handle_line(line);
    }
}

void GdbSession::handle_line(const std::string &line) {
    gdb_mi::Record record;
    std::string error_detail;
    if (gdb_mi::parse_record(line, record, error_detail)) {
        handle_record(record);
        return;
    }
    if (!error_detail.empty()) {
        debug_log::log("gdb session '" + name_ + "': unparsed record (" + error_detail + "): " + line);
        return;
    }
    // The debugged program shares gdb's output.
    debug_log::log("[" + name_ + "] " + line);
}

void GdbSession::handle_record(const gdb_mi::Record &record) {
    switch (record.type) {
    case gdb_mi::RecordType::Result: {
        if (record.record_class == "exit") {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = false;
            suspended_ = false;
        }
        if (!record.has_token) {
            return;
        }
        CommandCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto iterator = pending_.find(record.token);
            if (iterator == pending_.end()) {
                return;
            }
            callback = iterator->second;
            pending_.erase(iterator);
        }
        CommandResult result;
        result.success = record.record_class != "error";
        result.record_class = record.record_class;
        result.results = record.results;
        if (!result.success) {
            result.error_message = gdb_mi::string_field(record.results, "msg", "gdb reported an error");
        }
        deliver(callback, result);
        return;
    }
    case gdb_mi::RecordType::ExecAsync:
        handle_exec_async(record);
        return;
    case gdb_mi::RecordType::ConsoleStream:
    case gdb_mi::RecordType::TargetStream:
    case gdb_mi::RecordType::LogStream:
        if (!record.stream_text.empty()) {
            std::string text = record.stream_text;
            if (text.back() == '\n') {
                text.pop_back();
            }
            debug_log::log("gdb '" + name_ + "': " + text);
        }
        return;
    case gdb_mi::RecordType::StatusAsync:
    case gdb_mi::RecordType::NotifyAsync:
    case gdb_mi::RecordType::Prompt:
        return;
    }
}

void GdbSession::handle_exec_async(const gdb_mi::Record &record) {
    if (record.record_class == "running") {
        std::lock_guard<std::mutex> lock(mutex_);
        suspended_ = false;
        return;
    }
    if (record.record_class != "stopped") {
        return;
    }

    std::string reason = gdb_mi::string_field(record.results, "reason");
    if (reason.compare(0, 6, "exited") == 0) {
        bool send_exit = false;
        std::shared_ptr<local_host::LocalProcess> process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            process = process_;
            suspended_ = false;
            active_ = false;
            send_exit = !exit_requested_;
            exit_requested_ = true;
        }
        debug_log::log("gdb session '" + name_ + "': program " + reason);
        if (send_exit && process && !process->write_input("-gdb-exit\n")) {
            process->terminate();
        }
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    suspended_ = true;
    if (record.results.contains("frame")) {
        const gdb_mi::json &frame = record.results["frame"];
        position_.file = gdb_mi::string_field(frame, "fullname", gdb_mi::string_field(frame, "file"));
        position_.line = gdb_mi::int_field(frame, "line");
    } else {
        position_ = host::SourcePosition{};
    }
    std::string thread_id = gdb_mi::string_field(record.results, "thread-id");
    if (!thread_id.empty()) {
        thread_id_ = thread_id;
    }
}

void GdbSession::handle_exit(int exit_code) {
    std::map<uint64_t, CommandCallback> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        suspended_ = false;
        abandoned.swap(pending_);
    }
    debug_log::log("gdb session '" + name_ + "' ended, gdb exit code " + std::to_string(exit_code));

    CommandResult result;
    result.error_message = "gdb exited before answering";
    for (const auto &entry : abandoned) {
        deliver(entry.second, result);
    }
}

bool GdbSession::wait_exited(std::chrono::milliseconds timeout) const {
    std::shared_ptr<local_host::LocalProcess> process = this->process();
    if (!process) {
        return true;
    }
    return process->wait_finished(timeout);
}

void GdbSession::terminate_process() {
    std::shared_ptr<local_host::LocalProcess> process = this->process();
    if (process) {
        process->terminate();
    }
}

} // namespace gdb_session
