#ifndef DEVBRIDGE_COMPLETION_BRIDGE_HPP
#define DEVBRIDGE_COMPLETION_BRIDGE_HPP

// Turns callback-style completion on the application context into a value a
// caller thread can block on with a timeout.
//
// A timed-out wait does not cancel the dispatched work: it keeps running on
// the application context and may still resolve the signal later, which is
// then ignored. The shared state outlives the waiting caller.

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include "core/bridge_errors.hpp"
#include "host/application_context.hpp"
#include "utils/debug_log.hpp"

namespace bridge_core {

enum class BridgeStatus {
    Completed,
    TimedOut,
    // The work reported a failure or threw.
    Faulted,
    // The application context refused the work (shut down, or the caller is
    // the application thread itself and would deadlock).
    Rejected,
};

template <typename Result>
struct BridgeOutcome {
    BridgeStatus status = BridgeStatus::Faulted;
    Result value{};
    std::string fault_message;

    bool completed() const { return status == BridgeStatus::Completed; }
};

// Single-assignment completion. Copies share one state; only the first
// complete() or fail() takes effect.
template <typename Result>
class CompletionSignal {
public:
    CompletionSignal() : state_(std::make_shared<State>()) {
        state_->future = state_->promise.get_future().share();
    }

    bool complete(Result value) const {
        if (state_->resolved.exchange(true)) {
            return false;
        }
        Resolution resolution;
        resolution.value = std::move(value);
        state_->promise.set_value(std::move(resolution));
        return true;
    }

    bool fail(const std::string &message) const {
        if (state_->resolved.exchange(true)) {
            return false;
        }
        Resolution resolution;
        resolution.faulted = true;
        resolution.fault_message = message;
        state_->promise.set_value(std::move(resolution));
        return true;
    }

    bool is_resolved() const { return state_->resolved.load(); }

    BridgeOutcome<Result> wait_for(std::chrono::milliseconds timeout) const {
        BridgeOutcome<Result> outcome;
        if (state_->future.wait_for(timeout) != std::future_status::ready) {
            outcome.status = BridgeStatus::TimedOut;
            return outcome;
        }
        const Resolution &resolution = state_->future.get();
        if (resolution.faulted) {
            outcome.status = BridgeStatus::Faulted;
            outcome.fault_message = resolution.fault_message;
        } else {
            outcome.status = BridgeStatus::Completed;
            outcome.value = resolution.value;
        }
        return outcome;
    }

private:
    struct Resolution {
        bool faulted = false;
        Result value{};
        std::string fault_message;
    };

    struct State {
        std::atomic<bool> resolved{false};
        std::promise<Resolution> promise;
        std::shared_future<Resolution> future;
    };

    std::shared_ptr<State> state_;
};

struct TimeoutPolicy {
    std::chrono::milliseconds timeout{5000};
    // Used in log lines only.
    std::string operation_name;
};

// Schedules dispatch on the application context, handing it a signal to
// resolve (now, or later from any thread), and blocks the caller up to
// policy.timeout. A dispatch that throws resolves the signal as a fault.
template <typename Result>
BridgeOutcome<Result> run_on_application_context(
    host::ApplicationContext &context,
    std::function<void(const CompletionSignal<Result> &)> dispatch,
    const TimeoutPolicy &policy) {
    BridgeOutcome<Result> outcome;

    if (context.is_application_thread()) {
        outcome.status = BridgeStatus::Rejected;
        outcome.fault_message = "'" + policy.operation_name +
                                "' cannot block on the application context from the application context";
        debug_log::warn(outcome.fault_message);
        return outcome;
    }

    CompletionSignal<Result> signal;
    std::string operation_name = policy.operation_name;
    bool queued = context.invoke_later([dispatch, signal, operation_name]() {
        try {
            dispatch(signal);
        } catch (const std::exception &exception) {
            debug_log::warn("'" + operation_name + "' failed on the application context: " + exception.what());
            signal.fail(exception.what());
        }
    });

    if (!queued) {
        outcome.status = BridgeStatus::Rejected;
        outcome.fault_message = "Application context is shut down";
        return outcome;
    }

    outcome = signal.wait_for(policy.timeout);
    if (outcome.status == BridgeStatus::TimedOut) {
        debug_log::log("'" + policy.operation_name + "' timed out after " +
                       std::to_string(policy.timeout.count()) + " ms; host work may still be running");
    }
    return outcome;
}

// Typed error for an outcome that did not complete.
template <typename Result>
BridgeError bridge_failure(const BridgeOutcome<Result> &outcome, const host::ApplicationContext &context,
                           const std::string &timeout_message) {
    switch (outcome.status) {
    case BridgeStatus::Completed:
        break;
    case BridgeStatus::TimedOut:
        return make_error(ErrorKind::OperationTimeout, timeout_message);
    case BridgeStatus::Rejected:
        return make_error(context.is_running() ? ErrorKind::InternalFault : ErrorKind::ServiceShutDown,
                          outcome.fault_message);
    case BridgeStatus::Faulted:
        return make_error(ErrorKind::InternalFault, outcome.fault_message);
    }
    return BridgeError{};
}

} // namespace bridge_core

#endif // DEVBRIDGE_COMPLETION_BRIDGE_HPP
