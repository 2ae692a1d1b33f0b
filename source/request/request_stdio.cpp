#include "request/request_stdio.hpp"

#include <iostream>
#include <mutex>

namespace request_stdio {

static std::mutex output_mutex;

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;

    char character;
    while (input.get(character)) {
        if (brace_depth == 0) {
            // Anything before the opening brace (whitespace, stray newlines) is skipped.
            if (character == '{') {
                brace_depth = 1;
                buffer += character;
            }
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
        } else if (inside_string) {
            if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
        } else if (character == '"') {
            inside_string = true;
        } else if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(const std::string &json_string) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << json_string << "\n";
    std::cout.flush();
}

} // namespace request_stdio
