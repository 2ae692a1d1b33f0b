#ifndef DEVBRIDGE_BOUNDED_OUTPUT_BUFFER_HPP
#define DEVBRIDGE_BOUNDED_OUTPUT_BUFFER_HPP

// Thread-safe append-only text sink with a hard capacity.
// The first append that does not fit is cut (on a UTF-8 boundary) and the
// truncation marker is written in its place; later appends are dropped and
// only counted. Draining the buffer with read(true) re-opens it.

#include <cstddef>
#include <mutex>
#include <string>

namespace bridge_core {

class BoundedOutputBuffer {
public:
    static constexpr char kTruncationMarker[] = "\n... [output truncated]";

    struct Snapshot {
        std::string text;
        bool truncated = false;
        // Bytes discarded since the last drain.
        size_t dropped_bytes = 0;
    };

    explicit BoundedOutputBuffer(size_t capacity);

    BoundedOutputBuffer(const BoundedOutputBuffer &) = delete;
    BoundedOutputBuffer &operator=(const BoundedOutputBuffer &) = delete;

    void append(const std::string &text);

    // Returns the current content; with clear set, the buffer is emptied in
    // the same critical section so consecutive reads never overlap.
    Snapshot read(bool clear);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool is_truncated() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::string content_;
    bool truncated_ = false;
    size_t dropped_bytes_ = 0;
};

} // namespace bridge_core

#endif // DEVBRIDGE_BOUNDED_OUTPUT_BUFFER_HPP
