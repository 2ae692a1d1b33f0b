#include "host/application_context.hpp"
#include "utils/debug_log.hpp"

#include <exception>

namespace host {

ApplicationContext::ApplicationContext(const std::string &name) : name_(name) {
    std::lock_guard<std::mutex> lock(mutex_);
    worker_ = std::thread(&ApplicationContext::worker_loop, this);
    worker_id_ = worker_.get_id();
}

ApplicationContext::~ApplicationContext() {
    shutdown();
}

bool ApplicationContext::invoke_later(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            debug_log::log("ApplicationContext '" + name_ + "': task rejected after shutdown");
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool ApplicationContext::is_application_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::this_thread::get_id() == worker_id_;
}

bool ApplicationContext::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

void ApplicationContext::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    if (worker_.joinable()) {
        if (std::this_thread::get_id() == worker_.get_id()) {
            // Shutdown requested by one of our own tasks.
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void ApplicationContext::worker_loop() {
    // The constructor publishes worker_id_ under the same mutex.
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    debug_log::log("ApplicationContext '" + name_ + "' started");

    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception &exception) {
            debug_log::warn("ApplicationContext '" + name_ + "': task threw: " + exception.what());
        }
    }

    debug_log::log("ApplicationContext '" + name_ + "' stopped");
}

} // namespace host
