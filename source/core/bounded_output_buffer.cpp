#include "core/bounded_output_buffer.hpp"
#include "utils/utf8_sanitize.hpp"

#include <algorithm>

namespace bridge_core {

static constexpr size_t kMarkerLength = sizeof(BoundedOutputBuffer::kTruncationMarker) - 1;

BoundedOutputBuffer::BoundedOutputBuffer(size_t capacity) : capacity_(capacity) {}

void BoundedOutputBuffer::append(const std::string &text) {
    if (text.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (truncated_) {
        dropped_bytes_ += text.size();
        return;
    }

    if (content_.size() + text.size() <= capacity_) {
        content_ += text;
        return;
    }

    // Overflow: keep as much as fits in front of the marker.
    size_t total_size = content_.size() + text.size();
    size_t room = (capacity_ > kMarkerLength) ? capacity_ - kMarkerLength : 0;
    if (content_.size() < room) {
        // A few extra bytes let the cut see where a multibyte sequence ends.
        size_t wanted = room - content_.size() + 3;
        content_.append(text, 0, std::min(text.size(), wanted));
    }
    size_t keep = utf8_sanitize::safe_prefix_length(content_, room);
    content_.resize(keep);

    if (capacity_ >= kMarkerLength) {
        content_.append(kTruncationMarker, kMarkerLength);
    } else {
        content_.append(kTruncationMarker, capacity_);
    }

    dropped_bytes_ += total_size - keep;
    truncated_ = true;
}

BoundedOutputBuffer::Snapshot BoundedOutputBuffer::read(bool clear) {
    std::lock_guard<std::mutex> lock(mutex_);

    Snapshot snapshot;
    snapshot.truncated = truncated_;
    snapshot.dropped_bytes = dropped_bytes_;

    if (clear) {
        snapshot.text.swap(content_);
        truncated_ = false;
        dropped_bytes_ = 0;
    } else {
        snapshot.text = content_;
    }
    return snapshot;
}

size_t BoundedOutputBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_.size();
}

bool BoundedOutputBuffer::is_truncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

} // namespace bridge_core
