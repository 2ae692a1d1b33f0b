#ifndef DEVBRIDGE_GDB_MI_PARSER_HPP
#define DEVBRIDGE_GDB_MI_PARSER_HPP

// Parser for GDB/MI output records (one line each).
//
// Values map onto JSON: c-strings become strings, tuples objects and lists
// arrays. A list of results ("[frame={...},frame={...}]") keeps the values
// and drops the repeated names.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace gdb_mi {

using json = nlohmann::json;

enum class RecordType {
    // ^done, ^running, ^connected, ^error, ^exit
    Result,
    // *stopped, *running
    ExecAsync,
    // +download
    StatusAsync,
    // =thread-created, =breakpoint-modified, ...
    NotifyAsync,
    // ~"text"
    ConsoleStream,
    // @"text"
    TargetStream,
    // &"text"
    LogStream,
    // (gdb)
    Prompt,
};

struct Record {
    RecordType type = RecordType::Prompt;
    bool has_token = false;
    uint64_t token = 0;
    // "done", "error", "stopped", ... Empty for streams and the prompt.
    std::string record_class;
    // Results of result and async records as an object.
    json results = json::object();
    // Decoded text of stream records.
    std::string stream_text;
};

// False when line is not an MI record (e.g. output of the debugged program
// sharing the terminal). error_detail says why when it looked like one.
bool parse_record(const std::string &line, Record &record, std::string &error_detail);

// Decodes a C string literal starting at text[position] (the opening quote).
// position is left after the closing quote.
bool parse_c_string(const std::string &text, size_t &position, std::string &value);

// Quotes a value for use as an MI command argument.
std::string quote_argument(const std::string &value);

// String member of an MI tuple, or fallback when absent or not a string.
std::string string_field(const json &tuple, const char *key, const std::string &fallback = "");
int int_field(const json &tuple, const char *key, int fallback = 0);

} // namespace gdb_mi

#endif // DEVBRIDGE_GDB_MI_PARSER_HPP
