#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

extern char **environ;

namespace platform {

// Inherited environment with the overrides applied, as KEY=VALUE strings.
static std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string text(*entry);
        auto equals_position = text.find('=');
        if (equals_position == std::string::npos) {
            continue;
        }
        merged[text.substr(0, equals_position)] = text.substr(equals_position + 1);
    }
    for (const auto &override_entry : overrides) {
        merged[override_entry.first] = override_entry.second;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto &entry : merged) {
        result.push_back(entry.first + "=" + entry.second);
    }
    return result;
}

static ExitStatus decode_wait_status(int status) {
    ExitStatus exit_status;
    exit_status.exited = true;
    if (WIFEXITED(status)) {
        exit_status.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status.signal_number = WTERMSIG(status);
        exit_status.exit_code = 128 + exit_status.signal_number;
    }
    return exit_status;
}

// Child side after fork: only async-signal-safe calls. Reports errno through
// error_descriptor and exits if any step fails.
[[noreturn]] static void exec_child(const std::string &executable, char *const *argv, char *const *envp,
                                    const SpawnOptions &options, int input_descriptor,
                                    int output_descriptor, int error_descriptor) {
    int child_errno = 0;

    if (options.new_process_group) {
        setpgid(0, 0);
    }
    if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0) {
        child_errno = errno;
    }
    if (child_errno == 0) {
        if (dup2(input_descriptor, STDIN_FILENO) < 0 ||
            dup2(output_descriptor, STDOUT_FILENO) < 0 ||
            dup2(output_descriptor, STDERR_FILENO) < 0) {
            child_errno = errno;
        }
    }
    if (child_errno == 0) {
        execvpe(executable.c_str(), argv, envp);
        child_errno = errno;
    }

    ssize_t ignored = write(error_descriptor, &child_errno, sizeof(child_errno));
    (void)ignored;
    _exit(127);
}

SpawnResult spawn_process(const std::string &executable,
                          const std::vector<std::string> &arguments,
                          const SpawnOptions &options) {
    SpawnResult result;

    // Build argv and envp before fork; the child must not allocate.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = build_environment(options.environment);
    std::vector<char *> environment_pointers;
    for (auto &environment_string : environment_strings) {
        environment_pointers.push_back(environment_string.data());
    }
    environment_pointers.push_back(nullptr);

    int output_pipe[2] = {-1, -1};
    int input_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe() failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe() failed: " + std::string(strerror(errno));
        close(output_pipe[0]);
        close(output_pipe[1]);
        return result;
    }
    if (options.pipe_stdin) {
        if (pipe2(input_pipe, O_CLOEXEC) != 0) {
            result.error_message = "pipe() failed: " + std::string(strerror(errno));
            close(output_pipe[0]);
            close(output_pipe[1]);
            close(error_pipe[0]);
            close(error_pipe[1]);
            return result;
        }
    } else {
        input_pipe[0] = open("/dev/null", O_RDONLY | O_CLOEXEC);
    }

    pid_t child_pid = fork();
    if (child_pid < 0) {
        result.error_message = "fork() failed: " + std::string(strerror(errno));
        close(output_pipe[0]);
        close(output_pipe[1]);
        close(error_pipe[0]);
        close(error_pipe[1]);
        close_descriptor(input_pipe[0]);
        close_descriptor(input_pipe[1]);
        return result;
    }

    if (child_pid == 0) {
        exec_child(executable, argv_pointers.data(), environment_pointers.data(), options,
                   input_pipe[0], output_pipe[1], error_pipe[1]);
    }

    if (options.new_process_group) {
        // Also set from the parent so signalling the group right after spawn works.
        setpgid(child_pid, child_pid);
    }

    close(output_pipe[1]);
    close(error_pipe[1]);
    close_descriptor(input_pipe[0]);

    // The error pipe closes on successful exec (O_CLOEXEC); data means failure.
    int child_errno = 0;
    ssize_t bytes_read = 0;
    do {
        bytes_read = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes_read < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (bytes_read == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(child_pid, &status, 0);
        close(output_pipe[0]);
        close_descriptor(input_pipe[1]);
        result.error_message = "Failed to start '" + executable + "': " + std::string(strerror(child_errno));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.output_descriptor = output_pipe[0];
    result.stdin_descriptor = options.pipe_stdin ? input_pipe[1] : -1;
    return result;
}

ExitStatus poll_process_exit(int process_id) {
    ExitStatus exit_status;
    if (process_id <= 0) {
        return exit_status;
    }
    int status = 0;
    pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (wait_result == static_cast<pid_t>(process_id)) {
        return decode_wait_status(status);
    }
    if (wait_result < 0 && errno == ECHILD) {
        // Already reaped elsewhere; nothing more will be learned about it.
        exit_status.exited = true;
    }
    return exit_status;
}

static bool signal_group(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(-static_cast<pid_t>(process_id), signal_number) == 0) {
        return true;
    }
    return kill(static_cast<pid_t>(process_id), signal_number) == 0;
}

bool terminate_process_group(int process_id) {
    return signal_group(process_id, SIGTERM);
}

bool kill_process_group(int process_id) {
    return signal_group(process_id, SIGKILL);
}

bool write_all(int descriptor, const std::string &data) {
    if (descriptor < 0) {
        return false;
    }
    size_t written_total = 0;
    while (written_total < data.size()) {
        ssize_t written = write(descriptor, data.data() + written_total, data.size() - written_total);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written_total += static_cast<size_t>(written);
    }
    return true;
}

void close_descriptor(int descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
    }
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool path_exists(const std::string &path) {
    std::error_code error;
    return std::filesystem::exists(path, error);
}

std::string find_executable_on_path(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return path_exists(name) ? name : "";
    }
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + name;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

} // namespace platform
