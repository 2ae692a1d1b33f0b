#ifndef DEVBRIDGE_LOCAL_PROCESS_HPP
#define DEVBRIDGE_LOCAL_PROCESS_HPP

// A child process with merged stdout/stderr captured by a reader thread.
// Output is delivered as valid UTF-8 chunks; the exit callback follows the
// last chunk exactly once.

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "host/host_abi.hpp"
#include "platform/platform_abi.hpp"

namespace local_host {

struct ProcessCallbacks {
    std::function<void(const std::string &text)> on_text;
    std::function<void(const platform::ExitStatus &status)> on_exit;
};

struct ProcessStart {
    std::string executable;
    std::vector<std::string> arguments;
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool pipe_stdin = false;
    // SIGTERM to SIGKILL escalation after terminate().
    std::chrono::milliseconds terminate_grace{2000};
};

class LocalProcess : public host::ProcessHandle {
public:
    // Spawns the process and its reader thread. Null with error_message set
    // when the spawn fails; no callback is invoked in that case.
    static std::shared_ptr<LocalProcess> start(const ProcessStart &start, const ProcessCallbacks &callbacks,
                                               std::string &error_message);

    ~LocalProcess() override;

    int process_id() const override;
    bool is_terminated() const override;
    void terminate() override;

    // SIGKILL to the group right away.
    void kill();

    // Blocks until the exit callback has run or timeout elapses.
    bool wait_finished(std::chrono::milliseconds timeout) const;

    // Only valid once the process is terminated.
    platform::ExitStatus exit_status() const;

    // stdin pipe, or -1 when the process was started without one.
    int stdin_descriptor() const;
    bool write_input(const std::string &data);

    struct State;

private:
    explicit LocalProcess(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

// Adapts a host listener: the exit status becomes the exit code, with
// 128 + signal for a signalled process.
ProcessCallbacks callbacks_for(const host::ProcessListener &listener);

} // namespace local_host

#endif // DEVBRIDGE_LOCAL_PROCESS_HPP
