#ifndef DEVBRIDGE_UTF8_SANITIZE_HPP
#define DEVBRIDGE_UTF8_SANITIZE_HPP

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
std::string sanitize(const std::string &text);

// Length of the longest prefix of text, at most max_length bytes, that does not
// end inside a multibyte sequence. Used when truncating captured output.
size_t safe_prefix_length(const std::string &text, size_t max_length);

// Incremental decoder for process output read in arbitrary chunks.
// A multibyte sequence split across two reads is held back until the
// remaining bytes arrive instead of being replaced with U+FFFD.
class ChunkDecoder {
public:
    // Returns the valid UTF-8 text completed by this chunk.
    std::string feed(const char *data, size_t length);

    // Returns whatever is still held back (replaced with U+FFFD); call at EOF.
    std::string flush();

private:
    std::string pending_;
};

} // namespace utf8_sanitize

#endif // DEVBRIDGE_UTF8_SANITIZE_HPP
