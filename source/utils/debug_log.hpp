#ifndef DEVBRIDGE_DEBUG_LOG_HPP
#define DEVBRIDGE_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if DEVBRIDGE_DEBUG env is set to a truthy value (1, true, yes).
// The environment is read once; later changes are ignored.
bool is_debug_enabled();

// Writes message to stderr with [devbridge] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [devbridge] prefix regardless of DEVBRIDGE_DEBUG.
void warn(const std::string &message);

} // namespace debug_log

#endif // DEVBRIDGE_DEBUG_LOG_HPP
