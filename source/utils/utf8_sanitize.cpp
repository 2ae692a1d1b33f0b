#include "utils/utf8_sanitize.hpp"

#include <cstdint>

namespace utf8_sanitize {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD in UTF-8
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8) - 1;

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
unsigned char utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// Appends the sanitized form of [begin, end) to output. When hold_tail is set
// and the input ends in a sequence that is valid so far but incomplete, those
// bytes are not consumed. Returns the number of bytes consumed.
size_t decode_into(const unsigned char *begin, const unsigned char *end,
                   std::string &output, bool hold_tail) {
    const unsigned char *pointer = begin;

    while (pointer < end) {
        unsigned char length = utf8_lead_length(*pointer);

        if (length == 0) {
            output.append(kReplacementUtf8, kReplacementLength);
            ++pointer;
            continue;
        }

        size_t available = static_cast<size_t>(end - pointer);
        size_t checked = (available < length) ? available : length;

        bool valid = true;
        for (size_t index = 1; index < checked; ++index) {
            if (!is_continuation(pointer[index])) {
                valid = false;
                break;
            }
        }

        if (!valid) {
            output.append(kReplacementUtf8, kReplacementLength);
            ++pointer;
            continue;
        }

        if (available < length) {
            if (hold_tail) {
                break;
            }
            output.append(kReplacementUtf8, kReplacementLength);
            ++pointer;
            continue;
        }

        output.append(reinterpret_cast<const char *>(pointer), static_cast<size_t>(length));
        pointer += length;
    }

    return static_cast<size_t>(pointer - begin);
}

} // namespace

std::string sanitize(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    const unsigned char *begin = reinterpret_cast<const unsigned char *>(text.data());
    decode_into(begin, begin + text.size(), result, false);
    return result;
}

size_t safe_prefix_length(const std::string &text, size_t max_length) {
    if (max_length >= text.size()) {
        return text.size();
    }
    size_t cut = max_length;
    // Walk back over continuation bytes to the lead byte of the split sequence.
    while (cut > 0 && is_continuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    return cut;
}

std::string ChunkDecoder::feed(const char *data, size_t length) {
    pending_.append(data, length);

    std::string result;
    result.reserve(pending_.size());
    const unsigned char *begin = reinterpret_cast<const unsigned char *>(pending_.data());
    size_t consumed = decode_into(begin, begin + pending_.size(), result, true);
    pending_.erase(0, consumed);
    return result;
}

std::string ChunkDecoder::flush() {
    std::string result = sanitize(pending_);
    pending_.clear();
    return result;
}

} // namespace utf8_sanitize
