#ifndef DEVBRIDGE_BRIDGE_SERVICE_HPP
#define DEVBRIDGE_BRIDGE_SERVICE_HPP

// Service object shared by every request handler. Owns the operation locks,
// the run registry, the result caches and the debug facade for one host.

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/bridge_config.hpp"
#include "core/bridge_errors.hpp"
#include "core/debug_facade.hpp"
#include "core/operation_lock.hpp"
#include "core/result_cache.hpp"
#include "core/run_registry.hpp"
#include "core/test_result_extraction.hpp"
#include "host/host_abi.hpp"

namespace bridge_core {

struct BuildRunResult {
    bool success = false;
    std::string project_name;
    std::vector<host::BuildMessage> errors;
    std::vector<host::BuildMessage> warnings;
    long time_milliseconds = 0;
    bool aborted = false;
    BridgeError error;
};

struct BuildDiagnostics {
    bool available = false;
    std::string project_name;
    std::vector<host::BuildMessage> errors;
    std::vector<host::BuildMessage> warnings;
};

struct ServiceResetReport {
    size_t runs_forgotten = 0;
    ResetReport build_lock;
    ResetReport test_lock;
};

// "build" / "test"; empty when the name matches neither.
std::optional<host::OperationClass> parse_operation_class(const std::string &name);
const char *operation_class_name(host::OperationClass operation_class);

class BridgeService {
public:
    BridgeService(host::Host &host, const bridge_config::BridgeConfig &config);
    ~BridgeService();

    BridgeService(const BridgeService &) = delete;
    BridgeService &operator=(const BridgeService &) = delete;

    // timeout overrides the configured build timeout when set.
    BuildRunResult build(bool incremental, std::optional<std::chrono::milliseconds> timeout,
                         const std::string &project_reference);
    std::optional<BuildRunResult> last_build() const;
    BuildDiagnostics build_diagnostics() const;

    // Waits for build activity to finish, then runs the tests matching
    // pattern as a registered run and extracts the result tree. With debug
    // the tests start under the debugger and the call returns the session.
    TestRunResult test(const std::string &pattern, std::optional<std::chrono::milliseconds> timeout,
                       const std::string &project_reference, bool debug = false);
    std::optional<TestRunResult> last_test() const;

    std::vector<host::ProjectInfo> projects();

    RunRegistry &runs() { return registry_; }
    DebugFacade &debugger() { return debug_facade_; }

    std::vector<LockStatus> lock_status() const;
    // Non-authoritative: a lock held by another thread is only reported.
    ResetReport reset_lock(host::OperationClass operation_class);

    ServiceResetReport reset();

    // Terminates every run and refuses further build and test requests.
    // Idempotent.
    void shutdown();
    bool is_shut_down() const { return shut_down_.load(); }

    const bridge_config::BridgeConfig &config() const { return config_; }
    host::Host &host() { return host_; }

private:
    OperationLock &lock_for(host::OperationClass operation_class);

    host::Host &host_;
    const bridge_config::BridgeConfig config_;
    OperationLock build_lock_;
    OperationLock test_lock_;
    RunRegistry registry_;
    DebugFacade debug_facade_;
    // Shared with late host callbacks that may outlive a timed-out request.
    std::shared_ptr<ResultCache<BuildRunResult>> build_cache_;
    std::shared_ptr<ResultCache<TestRunResult>> test_cache_;
    std::atomic<bool> shut_down_{false};
};

} // namespace bridge_core

#endif // DEVBRIDGE_BRIDGE_SERVICE_HPP
