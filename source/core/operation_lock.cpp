#include "core/operation_lock.hpp"
#include "utils/debug_log.hpp"

#include <sstream>

namespace bridge_core {

static std::string describe_thread(std::thread::id thread_id) {
    std::ostringstream stream;
    stream << "thread " << thread_id;
    return stream.str();
}

OperationLock::OperationLock(const std::string &operation_class) : operation_class_(operation_class) {}

AcquireOutcome OperationLock::acquire(std::chrono::milliseconds timeout,
                                      const std::string &holder_description) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool available = condition_.wait_for(lock, timeout, [this] { return !locked_; });
    if (!available) {
        debug_log::log("Lock '" + operation_class_ + "' not acquired within " +
                       std::to_string(timeout.count()) + " ms (held by " + holder_description_ + ")");
        return AcquireOutcome::TimedOut;
    }

    locked_ = true;
    owner_ = std::this_thread::get_id();
    holder_description_ = holder_description.empty() ? describe_thread(owner_) : holder_description;
    acquired_at_ = std::chrono::steady_clock::now();
    debug_log::log("Lock '" + operation_class_ + "' acquired by " + holder_description_);
    return AcquireOutcome::Acquired;
}

void OperationLock::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_ || owner_ != std::this_thread::get_id()) {
            return;
        }
        locked_ = false;
        owner_ = std::thread::id();
        holder_description_.clear();
    }
    condition_.notify_one();
    debug_log::log("Lock '" + operation_class_ + "' released");
}

bool OperationLock::is_locked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

bool OperationLock::held_by_current_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_ && owner_ == std::this_thread::get_id();
}

LockStatus OperationLock::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LockStatus result;
    result.operation_class = operation_class_;
    result.locked = locked_;
    if (locked_) {
        result.holder_description = holder_description_;
        result.held_for_milliseconds = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - acquired_at_).count());
    }
    return result;
}

ExternalActivityOutcome OperationLock::wait_for_external_activity(const std::function<bool()> &probe,
                                                                  std::chrono::milliseconds max_wait,
                                                                  std::chrono::milliseconds poll_interval) {
    auto deadline = std::chrono::steady_clock::now() + max_wait;
    bool logged = false;

    for (;;) {
        if (!probe()) {
            return ExternalActivityOutcome::Finished;
        }
        if (!logged) {
            debug_log::log("Waiting for externally started activity to finish");
            logged = true;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return ExternalActivityOutcome::TimedOut;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(remaining < poll_interval ? remaining : poll_interval);
    }
}

ResetReport OperationLock::reset() {
    ResetReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_) {
            // Probe-acquire succeeded trivially: nothing to recover.
            report.outcome = ResetOutcome::WasAvailable;
            return report;
        }
        report.holder_description = holder_description_;
        report.held_for_milliseconds = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - acquired_at_).count());

        if (owner_ != std::this_thread::get_id()) {
            report.outcome = ResetOutcome::HeldElsewhere;
            debug_log::warn("Lock '" + operation_class_ + "' reset requested but held by " + holder_description_);
            return report;
        }

        locked_ = false;
        owner_ = std::thread::id();
        holder_description_.clear();
        report.outcome = ResetOutcome::Released;
    }
    condition_.notify_one();
    debug_log::log("Lock '" + operation_class_ + "' released by reset");
    return report;
}

OperationGuard::OperationGuard(OperationLock &lock, std::chrono::milliseconds timeout,
                               const std::string &holder_description)
    : lock_(lock) {
    acquired_ = (lock_.acquire(timeout, holder_description) == AcquireOutcome::Acquired);
}

OperationGuard::~OperationGuard() {
    if (acquired_) {
        lock_.release();
    }
}

} // namespace bridge_core
