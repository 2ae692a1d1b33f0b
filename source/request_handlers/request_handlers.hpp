#ifndef DEVBRIDGE_REQUEST_HANDLERS_HPP
#define DEVBRIDGE_REQUEST_HANDLERS_HPP

// Operation handler registration.
// Each handle_*.cpp file provides a register function that is called during startup.

namespace request_handlers {

// Register all available operations with the request registry. Safe to call
// more than once.
void register_all_operations();

} // namespace request_handlers

#endif // DEVBRIDGE_REQUEST_HANDLERS_HPP
