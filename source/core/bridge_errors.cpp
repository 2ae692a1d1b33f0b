#include "core/bridge_errors.hpp"

namespace bridge_core {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidRequest:
        return "InvalidRequest";
    case ErrorKind::NoProjectOpen:
        return "NoProjectOpen";
    case ErrorKind::LockAcquisitionTimeout:
        return "LockAcquisitionTimeout";
    case ErrorKind::UpstreamActivityTimeout:
        return "UpstreamActivityTimeout";
    case ErrorKind::OperationTimeout:
        return "OperationTimeout";
    case ErrorKind::RunNotFound:
        return "RunNotFound";
    case ErrorKind::NoActiveDebugSession:
        return "NoActiveDebugSession";
    case ErrorKind::SessionNotSuspended:
        return "SessionNotSuspended";
    case ErrorKind::EvaluatorUnavailable:
        return "EvaluatorUnavailable";
    case ErrorKind::ExtractionFailed:
        return "ExtractionFailed";
    case ErrorKind::NoMatchingTests:
        return "NoMatchingTests";
    case ErrorKind::ConfigurationNotFound:
        return "ConfigurationNotFound";
    case ErrorKind::LaunchFailed:
        return "LaunchFailed";
    case ErrorKind::SessionStartFailed:
        return "SessionStartFailed";
    case ErrorKind::BreakpointNotFound:
        return "BreakpointNotFound";
    case ErrorKind::UnknownOperation:
        return "UnknownOperation";
    case ErrorKind::DebuggerError:
        return "DebuggerError";
    case ErrorKind::ServiceShutDown:
        return "ServiceShutDown";
    case ErrorKind::InternalFault:
        return "InternalFault";
    }
    return "Unknown";
}

} // namespace bridge_core
