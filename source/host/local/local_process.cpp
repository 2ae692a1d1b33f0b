#include "host/local/local_process.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <poll.h>
#include <unistd.h>

namespace local_host {

// Output still arriving after the leader exited comes from descendants that
// inherited the pipe; stop waiting for EOF once it has been quiet this long.
static constexpr std::chrono::milliseconds kDescendantQuietPeriod{500};
static constexpr int kPollIntervalMs = 100;

struct LocalProcess::State {
    int process_id = -1;
    int output_descriptor = -1;
    int stdin_descriptor = -1;
    ProcessCallbacks callbacks;
    std::chrono::milliseconds terminate_grace{2000};

    mutable std::mutex mutex;
    mutable std::condition_variable finished_condition;
    bool reaped = false;
    bool finished = false;
    bool terminate_requested = false;
    bool killed = false;
    std::chrono::steady_clock::time_point terminate_requested_at;
    platform::ExitStatus status;

    std::mutex input_mutex;
};

static void deliver_text(LocalProcess::State &state, const std::string &text) {
    if (text.empty() || !state.callbacks.on_text) {
        return;
    }
    try {
        state.callbacks.on_text(text);
    } catch (const std::exception &exception) {
        debug_log::warn("Output listener of process " + std::to_string(state.process_id) +
                        " threw: " + exception.what());
    }
}

static void escalate_if_due(LocalProcess::State &state) {
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.terminate_requested || state.killed || state.reaped) {
            return;
        }
        if (std::chrono::steady_clock::now() - state.terminate_requested_at < state.terminate_grace) {
            return;
        }
        state.killed = true;
    }
    debug_log::log("Process " + std::to_string(state.process_id) + " ignored SIGTERM, sending SIGKILL");
    platform::kill_process_group(state.process_id);
}

static platform::ExitStatus reap_if_exited(LocalProcess::State &state) {
    platform::ExitStatus status = platform::poll_process_exit(state.process_id);
    if (status.exited) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.reaped = true;
    }
    return status;
}

static void reader_loop(std::shared_ptr<LocalProcess::State> state) {
    utf8_sanitize::ChunkDecoder decoder;
    char buffer[8192];
    platform::ExitStatus status;
    std::chrono::steady_clock::time_point quiet_since;

    for (;;) {
        escalate_if_due(*state);

        pollfd descriptor{};
        descriptor.fd = state->output_descriptor;
        descriptor.events = POLLIN;
        int ready = ::poll(&descriptor, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            debug_log::warn("poll failed on process output: " + std::string(std::strerror(errno)));
            break;
        }

        if (ready > 0) {
            ssize_t count = ::read(state->output_descriptor, buffer, sizeof(buffer));
            if (count > 0) {
                deliver_text(*state, decoder.feed(buffer, static_cast<size_t>(count)));
                quiet_since = std::chrono::steady_clock::now();
                continue;
            }
            if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            // EOF: every writer closed the pipe.
            break;
        }

        if (!status.exited) {
            status = reap_if_exited(*state);
            if (status.exited) {
                quiet_since = std::chrono::steady_clock::now();
            }
        } else if (std::chrono::steady_clock::now() - quiet_since >= kDescendantQuietPeriod) {
            debug_log::log("Process " + std::to_string(state->process_id) +
                           " exited; descendants still hold its output open");
            break;
        }
    }

    deliver_text(*state, decoder.flush());
    platform::close_descriptor(state->output_descriptor);

    while (!status.exited) {
        status = reap_if_exited(*state);
        if (status.exited) {
            break;
        }
        escalate_if_due(*state);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    debug_log::log("Process " + std::to_string(state->process_id) + " exited with code " +
                   std::to_string(status.exit_code));

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->status = status;
    }
    if (state->callbacks.on_exit) {
        try {
            state->callbacks.on_exit(status);
        } catch (const std::exception &exception) {
            debug_log::warn("Exit listener of process " + std::to_string(state->process_id) +
                            " threw: " + exception.what());
        }
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
    }
    state->finished_condition.notify_all();
}

std::shared_ptr<LocalProcess> LocalProcess::start(const ProcessStart &start, const ProcessCallbacks &callbacks,
                                                  std::string &error_message) {
    platform::SpawnOptions options;
    options.working_directory = start.working_directory;
    options.environment = start.environment;
    options.pipe_stdin = start.pipe_stdin;
    options.new_process_group = true;

    platform::SpawnResult spawned = platform::spawn_process(start.executable, start.arguments, options);
    if (!spawned.success) {
        error_message = spawned.error_message;
        return nullptr;
    }

    auto state = std::make_shared<State>();
    state->process_id = spawned.process_id;
    state->output_descriptor = spawned.output_descriptor;
    state->stdin_descriptor = spawned.stdin_descriptor;
    state->callbacks = callbacks;
    state->terminate_grace = start.terminate_grace;

    debug_log::log("Started process " + std::to_string(spawned.process_id) + ": " + start.executable);

    // Detached: the thread owns a reference to the state and ends with the process.
    std::thread(reader_loop, state).detach();
    return std::shared_ptr<LocalProcess>(new LocalProcess(state));
}

LocalProcess::LocalProcess(std::shared_ptr<State> state) : state_(std::move(state)) {}

LocalProcess::~LocalProcess() {
    std::lock_guard<std::mutex> lock(state_->input_mutex);
    if (state_->stdin_descriptor >= 0) {
        platform::close_descriptor(state_->stdin_descriptor);
        state_->stdin_descriptor = -1;
    }
}

int LocalProcess::process_id() const {
    return state_->process_id;
}

bool LocalProcess::is_terminated() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->finished;
}

void LocalProcess::terminate() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->reaped || state_->terminate_requested) {
            return;
        }
        state_->terminate_requested = true;
        state_->terminate_requested_at = std::chrono::steady_clock::now();
    }
    debug_log::log("Terminating process group " + std::to_string(state_->process_id));
    platform::terminate_process_group(state_->process_id);
}

void LocalProcess::kill() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->reaped) {
            return;
        }
        state_->terminate_requested = true;
        state_->killed = true;
    }
    platform::kill_process_group(state_->process_id);
}

bool LocalProcess::wait_finished(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->finished_condition.wait_for(lock, timeout, [this] { return state_->finished; });
}

platform::ExitStatus LocalProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->status;
}

int LocalProcess::stdin_descriptor() const {
    return state_->stdin_descriptor;
}

bool LocalProcess::write_input(const std::string &data) {
    std::lock_guard<std::mutex> lock(state_->input_mutex);
    if (state_->stdin_descriptor < 0) {
        return false;
    }
    return platform::write_all(state_->stdin_descriptor, data);
}

ProcessCallbacks callbacks_for(const host::ProcessListener &listener) {
    ProcessCallbacks callbacks;
    callbacks.on_text = listener.on_text;
    std::function<void(int)> on_terminated = listener.on_terminated;
    callbacks.on_exit = [on_terminated](const platform::ExitStatus &status) {
        if (on_terminated) {
            on_terminated(status.exit_code);
        }
    };
    return callbacks;
}

} // namespace local_host
