#ifndef DEVBRIDGE_GDB_LAUNCH_HPP
#define DEVBRIDGE_GDB_LAUNCH_HPP

// GDB executable discovery and command line for a debug session.

#include <string>
#include <vector>

#include "host/host_abi.hpp"

namespace gdb_launch {

struct GdbCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// configured may be a path or a bare name searched on PATH. Empty when
// nothing executable was found.
std::string find_gdb_executable(const std::string &configured);

// gdb in MI mode with the configuration's program and its arguments after
// --args, so the inferior starts with exactly that command.
GdbCommandLine build_gdb_command_line(const std::string &gdb_executable,
                                      const host::RunConfiguration &configuration);

// Commands sent before any breakpoint is inserted.
std::vector<std::string> session_setup_commands();

} // namespace gdb_launch

#endif // DEVBRIDGE_GDB_LAUNCH_HPP
