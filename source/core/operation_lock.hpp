#ifndef DEVBRIDGE_OPERATION_LOCK_HPP
#define DEVBRIDGE_OPERATION_LOCK_HPP

// Mutual exclusion for one operation class (build, test, ...).
//
// Acquisition is bounded; the holder is a caller thread, not the application
// context. reset() is a recovery escape hatch: it only releases the lock when
// called by the holder and otherwise just reports who holds it.

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace bridge_core {

enum class AcquireOutcome {
    Acquired,
    TimedOut,
};

enum class ExternalActivityOutcome {
    Finished,
    TimedOut,
};

enum class ResetOutcome {
    // The calling thread held the lock and released it.
    Released,
    // Nobody held it.
    WasAvailable,
    // Held by another thread; left untouched.
    HeldElsewhere,
};

struct ResetReport {
    ResetOutcome outcome = ResetOutcome::WasAvailable;
    std::string holder_description;
    long held_for_milliseconds = 0;
};

struct LockStatus {
    std::string operation_class;
    bool locked = false;
    std::string holder_description;
    long held_for_milliseconds = 0;
};

class OperationLock {
public:
    explicit OperationLock(const std::string &operation_class);

    OperationLock(const OperationLock &) = delete;
    OperationLock &operator=(const OperationLock &) = delete;

    AcquireOutcome acquire(std::chrono::milliseconds timeout,
                           const std::string &holder_description = "");

    // No-op unless the calling thread is the holder.
    void release();

    bool is_locked() const;
    bool held_by_current_thread() const;
    LockStatus status() const;

    // Polls probe (true = an instance of this class started outside the
    // bridge is still active) until it reports idle or max_wait elapses.
    static ExternalActivityOutcome wait_for_external_activity(const std::function<bool()> &probe,
                                                              std::chrono::milliseconds max_wait,
                                                              std::chrono::milliseconds poll_interval);

    ResetReport reset();

    const std::string &operation_class() const { return operation_class_; }

private:
    const std::string operation_class_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool locked_ = false;
    std::thread::id owner_;
    std::string holder_description_;
    std::chrono::steady_clock::time_point acquired_at_;
};

// Releases the lock on every exit path of the scope that acquired it.
class OperationGuard {
public:
    OperationGuard(OperationLock &lock, std::chrono::milliseconds timeout,
                   const std::string &holder_description);
    ~OperationGuard();

    OperationGuard(const OperationGuard &) = delete;
    OperationGuard &operator=(const OperationGuard &) = delete;

    bool acquired() const { return acquired_; }

private:
    OperationLock &lock_;
    bool acquired_ = false;
};

} // namespace bridge_core

#endif // DEVBRIDGE_OPERATION_LOCK_HPP
