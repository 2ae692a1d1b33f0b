#ifndef DEVBRIDGE_RESULT_CACHE_HPP
#define DEVBRIDGE_RESULT_CACHE_HPP

// Most recent result of one operation class. Cleared when a new operation of
// the class starts so a long-running one never serves the previous result.
// A result that completes after a newer operation began is dropped.

#include <cstdint>
#include <mutex>
#include <optional>

namespace bridge_core {

template <typename Result>
class ResultCache {
public:
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_.reset();
    }

    void store(const Result &value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = value;
    }

    // Clears the cache and returns the generation the new operation stores under.
    uint64_t begin_operation() {
        std::lock_guard<std::mutex> lock(mutex_);
        value_.reset();
        return ++generation_;
    }

    bool store_for(uint64_t generation, const Result &value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return false;
        }
        value_ = value;
        return true;
    }

    std::optional<Result> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<Result> value_;
    uint64_t generation_ = 0;
};

} // namespace bridge_core

#endif // DEVBRIDGE_RESULT_CACHE_HPP
