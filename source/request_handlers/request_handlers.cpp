#include "request_handlers/request_handlers.hpp"

#include <mutex>

// Forward declarations of individual registration functions.
// Each handle_*.cpp defines its own namespace with a register_operations() function.

namespace handle_build { void register_operations(); }
namespace handle_test { void register_operations(); }
namespace handle_runs { void register_operations(); }
namespace handle_debug { void register_operations(); }
namespace handle_breakpoints { void register_operations(); }
namespace handle_service { void register_operations(); }

namespace request_handlers {

static std::once_flag registration_flag;

void register_all_operations() {
    std::call_once(registration_flag, [] {
        handle_build::register_operations();
        handle_test::register_operations();
        handle_runs::register_operations();
        handle_debug::register_operations();
        handle_breakpoints::register_operations();
        // Last: health lists everything registered before it.
        handle_service::register_operations();
    });
}

} // namespace request_handlers
