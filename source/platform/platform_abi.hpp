#ifndef DEVBRIDGE_PLATFORM_ABI_HPP
#define DEVBRIDGE_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <map>
#include <string>
#include <vector>

namespace platform {

struct SpawnOptions {
    // Empty = inherit the current working directory.
    std::string working_directory;
    // Added to (or replacing entries of) the inherited environment.
    std::map<std::string, std::string> environment;
    // When false the child's stdin is /dev/null.
    bool pipe_stdin = false;
    // Put the child in its own process group so the whole tree can be signalled.
    bool new_process_group = true;
};

// Result of spawning a child process. stderr is redirected into the stdout pipe.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_descriptor = -1;
    int output_descriptor = -1;
    std::string error_message;
};

// Spawn a child process. executable is searched on PATH when it has no '/'.
// Failures of chdir/exec in the child are reported here, not as an exit code.
SpawnResult spawn_process(const std::string &executable,
                          const std::vector<std::string> &arguments,
                          const SpawnOptions &options = {});

struct ExitStatus {
    bool exited = false;
    int exit_code = -1;
    // Set when the process was terminated by a signal.
    int signal_number = 0;
};

// Non-blocking reap. exited stays false while the process is still running.
ExitStatus poll_process_exit(int process_id);

// SIGTERM / SIGKILL to the process group led by process_id (falls back to the
// single process when it has no group of its own).
bool terminate_process_group(int process_id);
bool kill_process_group(int process_id);

// Write all bytes, retrying on partial writes. Returns false on error.
bool write_all(int descriptor, const std::string &data);

void close_descriptor(int descriptor);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

bool path_exists(const std::string &path);

// Search PATH for an executable name. Returns the full path, or empty.
std::string find_executable_on_path(const std::string &name);

} // namespace platform

#endif // DEVBRIDGE_PLATFORM_ABI_HPP
