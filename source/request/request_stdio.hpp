#ifndef DEVBRIDGE_REQUEST_STDIO_HPP
#define DEVBRIDGE_REQUEST_STDIO_HPP

// Stdio transport of the request loop: JSON objects in on stdin, one JSON
// response per line out on stdout.

#include <istream>
#include <string>

namespace request_stdio {

// Read a single complete JSON object from input.
// Brace-counting with string/escape awareness, so it works both with
// newline-delimited and pretty-printed requests. Returns an empty string on
// EOF or a read error (e.g. interrupted by a signal).
std::string read_message(std::istream &input);

// Write one response line to stdout. Safe to call from several threads; lines
// never interleave.
void write_message(const std::string &json_string);

} // namespace request_stdio

#endif // DEVBRIDGE_REQUEST_STDIO_HPP
