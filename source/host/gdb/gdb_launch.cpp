#include "host/gdb/gdb_launch.hpp"
#include "platform/platform_abi.hpp"

#include <unistd.h>

namespace gdb_launch {

std::string find_gdb_executable(const std::string &configured) {
    std::string candidate = configured.empty() ? "gdb" : configured;
    if (candidate.find('/') != std::string::npos) {
        if (platform::path_exists(candidate) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        return "";
    }
    return platform::find_executable_on_path(candidate);
}

GdbCommandLine build_gdb_command_line(const std::string &gdb_executable,
                                      const host::RunConfiguration &configuration) {
    GdbCommandLine command_line;
    command_line.executable_path = gdb_executable;
    command_line.arguments = {
        "--interpreter=mi2",
        "--quiet",
        "--nx",
    };
    if (!configuration.command.empty()) {
        command_line.arguments.push_back("--args");
        for (const auto &argument : configuration.command) {
            command_line.arguments.push_back(argument);
        }
    }
    return command_line;
}

std::vector<std::string> session_setup_commands() {
    return {
        // Commands such as -exec-interrupt are accepted while the program runs.
        "-gdb-set mi-async on",
        "-gdb-set confirm off",
        "-gdb-set print pretty off",
        "-enable-pretty-printing",
    };
}

} // namespace gdb_launch
