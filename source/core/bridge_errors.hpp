#ifndef DEVBRIDGE_BRIDGE_ERRORS_HPP
#define DEVBRIDGE_BRIDGE_ERRORS_HPP

// Typed failures returned as data by every core operation.

#include <string>

namespace bridge_core {

enum class ErrorKind {
    None,
    InvalidRequest,
    NoProjectOpen,
    LockAcquisitionTimeout,
    UpstreamActivityTimeout,
    // Caller-visible only: host-side work may still be running.
    OperationTimeout,
    RunNotFound,
    NoActiveDebugSession,
    SessionNotSuspended,
    EvaluatorUnavailable,
    ExtractionFailed,
    NoMatchingTests,
    ConfigurationNotFound,
    LaunchFailed,
    SessionStartFailed,
    BreakpointNotFound,
    UnknownOperation,
    // Reported by the debugger itself (evaluation error, frame enumeration error).
    DebuggerError,
    ServiceShutDown,
    InternalFault,
};

// Stable name used at the request boundary ("LockAcquisitionTimeout", ...).
const char *error_kind_name(ErrorKind kind);

struct BridgeError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool is_set() const { return kind != ErrorKind::None; }
};

inline BridgeError make_error(ErrorKind kind, const std::string &message) {
    BridgeError error;
    error.kind = kind;
    error.message = message;
    return error;
}

} // namespace bridge_core

#endif // DEVBRIDGE_BRIDGE_ERRORS_HPP
