#ifndef DEVBRIDGE_APPLICATION_CONTEXT_HPP
#define DEVBRIDGE_APPLICATION_CONTEXT_HPP

// The single execution context for state-mutating host work.
// One worker thread drains a FIFO of tasks in submission order.

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace host {

class ApplicationContext {
public:
    using Task = std::function<void()>;

    explicit ApplicationContext(const std::string &name = "application");
    ~ApplicationContext();

    ApplicationContext(const ApplicationContext &) = delete;
    ApplicationContext &operator=(const ApplicationContext &) = delete;

    // Queue a task. Returns false (task dropped) once shutdown() has started.
    bool invoke_later(Task task);

    bool is_application_thread() const;
    bool is_running() const;

    // Runs the tasks already queued, then stops the worker. Idempotent.
    void shutdown();

private:
    void worker_loop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::thread worker_;
    std::thread::id worker_id_;
};

} // namespace host

#endif // DEVBRIDGE_APPLICATION_CONTEXT_HPP
