// Tests for UTF-8 sanitizing of captured process output.

#include "utils/utf8_sanitize.hpp"

#include <iostream>
#include <string>

namespace test_utf8_sanitize {

static const std::string REPLACEMENT = "\xEF\xBF\xBD";

// Test: Valid text passes through; invalid bytes become U+FFFD.
static bool test_sanitize() {
    bool success = utf8_sanitize::sanitize("caf\xC3\xA9") == "caf\xC3\xA9" &&
                   utf8_sanitize::sanitize("a\xFF" "b") == "a" + REPLACEMENT + "b" &&
                   utf8_sanitize::sanitize("\xE2\x82") == REPLACEMENT + REPLACEMENT;

    if (success) {
        std::cout << "  OK: Invalid bytes are replaced" << std::endl;
    } else {
        std::cout << "  FAIL: Sanitized text mismatch" << std::endl;
    }
    return success;
}

// Test: A sequence split across chunks is reassembled.
static bool test_chunk_decoder() {
    utf8_sanitize::ChunkDecoder decoder;
    std::string first = decoder.feed("price \xE2\x82", 8);
    std::string second = decoder.feed("\xAC 5", 3);
    utf8_sanitize::ChunkDecoder truncated;
    std::string held = truncated.feed("x\xF0\x9F", 3);
    std::string flushed = truncated.flush();
    std::string flushed_again = truncated.flush();

    bool success = first == "price " && second == "\xE2\x82\xAC 5" && held == "x" &&
                   flushed == utf8_sanitize::sanitize("\xF0\x9F") && flushed == REPLACEMENT + REPLACEMENT &&
                   flushed_again.empty();

    if (success) {
        std::cout << "  OK: Split multibyte sequences are reassembled" << std::endl;
    } else {
        std::cout << "  FAIL: Decoder produced '" << first << "' + '" << second << "'" << std::endl;
    }
    return success;
}

// Test: Truncation never cuts inside a multibyte sequence.
static bool test_safe_prefix_length() {
    std::string text = "ab\xE2\x82\xAC";
    bool success = utf8_sanitize::safe_prefix_length(text, 3) == 2 &&
                   utf8_sanitize::safe_prefix_length(text, 4) == 2 &&
                   utf8_sanitize::safe_prefix_length(text, 5) == 5 &&
                   utf8_sanitize::safe_prefix_length(text, 2) == 2;

    if (success) {
        std::cout << "  OK: Prefixes end on sequence boundaries" << std::endl;
    } else {
        std::cout << "  FAIL: Prefix of 3 is " << utf8_sanitize::safe_prefix_length(text, 3) << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_sanitize();
    all_passed &= test_chunk_decoder();
    all_passed &= test_safe_prefix_length();
    return all_passed;
}

} // namespace test_utf8_sanitize
