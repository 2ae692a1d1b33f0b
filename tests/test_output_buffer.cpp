// Tests for the bounded output buffer: capacity, truncation marker, drains.

#include "core/bounded_output_buffer.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace test_output_buffer {

static const std::string kMarker = bridge_core::BoundedOutputBuffer::kTruncationMarker;

// Test: Appends within capacity are kept verbatim.
static bool test_appends_within_capacity() {
    bridge_core::BoundedOutputBuffer buffer(100);
    buffer.append("hello ");
    buffer.append("world");
    auto snapshot = buffer.read(false);
    bool success = snapshot.text == "hello world" && !snapshot.truncated && buffer.size() == 11;

    if (success) {
        std::cout << "  OK: Appends within capacity are kept" << std::endl;
    } else {
        std::cout << "  FAIL: Buffer content was: " << snapshot.text << std::endl;
    }
    return success;
}

// Test: One append larger than the remaining room never exceeds capacity.
static bool test_single_oversized_append() {
    bridge_core::BoundedOutputBuffer buffer(64);
    buffer.append("0123456789");
    buffer.append(std::string(500, 'x'));
    auto snapshot = buffer.read(false);
    bool success = snapshot.text.size() <= 64 && snapshot.truncated &&
                   snapshot.text.compare(0, 10, "0123456789") == 0 &&
                   snapshot.text.size() >= kMarker.size() &&
                   snapshot.text.compare(snapshot.text.size() - kMarker.size(), kMarker.size(), kMarker) == 0;

    if (success) {
        std::cout << "  OK: Oversized append is cut and marked within capacity" << std::endl;
    } else {
        std::cout << "  FAIL: Size " << snapshot.text.size() << ", truncated " << snapshot.truncated << std::endl;
    }
    return success;
}

// Test: After truncation, later appends are only counted.
static bool test_appends_after_truncation_are_dropped() {
    bridge_core::BoundedOutputBuffer buffer(40);
    buffer.append(std::string(50, 'a'));
    size_t size_after_cut = buffer.size();
    buffer.append("more");
    buffer.append("and more");
    auto snapshot = buffer.read(false);
    bool success = buffer.size() == size_after_cut && snapshot.text.find("more") == std::string::npos &&
                   snapshot.dropped_bytes >= 12;

    if (success) {
        std::cout << "  OK: Appends after truncation are dropped and counted" << std::endl;
    } else {
        std::cout << "  FAIL: Dropped bytes " << snapshot.dropped_bytes << ", size " << buffer.size() << std::endl;
    }
    return success;
}

// Test: The cut never splits a multibyte UTF-8 sequence.
static bool test_cut_on_utf8_boundary() {
    std::string euro = "\xE2\x82\xAC";
    size_t capacity = kMarker.size() + 7;
    bridge_core::BoundedOutputBuffer buffer(capacity);
    std::string text;
    for (int index = 0; index < 10; index++) {
        text += euro;
    }
    buffer.append(text);
    auto snapshot = buffer.read(false);
    std::string kept = snapshot.text.substr(0, snapshot.text.size() - kMarker.size());
    bool success = snapshot.text.size() <= capacity && kept == euro + euro;

    if (success) {
        std::cout << "  OK: Truncation keeps whole UTF-8 sequences" << std::endl;
    } else {
        std::cout << "  FAIL: Kept " << kept.size() << " bytes before the marker" << std::endl;
    }
    return success;
}

// Test: Draining returns the content once and re-opens a truncated buffer.
static bool test_drain_reopens() {
    bridge_core::BoundedOutputBuffer buffer(40);
    buffer.append(std::string(60, 'b'));
    auto first = buffer.read(true);
    buffer.append("after");
    auto second = buffer.read(true);
    auto third = buffer.read(true);
    bool success = first.truncated && second.text == "after" && !second.truncated && third.text.empty();

    if (success) {
        std::cout << "  OK: Drains do not overlap and re-open the buffer" << std::endl;
    } else {
        std::cout << "  FAIL: Second drain returned: " << second.text << std::endl;
    }
    return success;
}

// Test: Concurrent writers never push the buffer over capacity.
static bool test_concurrent_appends() {
    bridge_core::BoundedOutputBuffer buffer(1000);
    std::vector<std::thread> writers;
    for (int writer = 0; writer < 4; writer++) {
        writers.emplace_back([&buffer]() {
            for (int index = 0; index < 200; index++) {
                buffer.append("line of output\n");
            }
        });
    }
    for (auto &thread : writers) {
        thread.join();
    }
    bool success = buffer.size() <= 1000 && buffer.is_truncated();

    if (success) {
        std::cout << "  OK: Concurrent appends respect capacity" << std::endl;
    } else {
        std::cout << "  FAIL: Size after concurrent appends: " << buffer.size() << std::endl;
    }
    return success;
}

// Test: A capacity smaller than the marker still holds.
static bool test_tiny_capacity() {
    bridge_core::BoundedOutputBuffer buffer(5);
    buffer.append("0123456789");
    bool success = buffer.size() <= 5 && buffer.is_truncated();

    if (success) {
        std::cout << "  OK: Tiny capacity is never exceeded" << std::endl;
    } else {
        std::cout << "  FAIL: Tiny buffer size: " << buffer.size() << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_appends_within_capacity();
    all_passed &= test_single_oversized_append();
    all_passed &= test_appends_after_truncation_are_dropped();
    all_passed &= test_cut_on_utf8_boundary();
    all_passed &= test_drain_reopens();
    all_passed &= test_concurrent_appends();
    all_passed &= test_tiny_capacity();
    return all_passed;
}

} // namespace test_output_buffer
