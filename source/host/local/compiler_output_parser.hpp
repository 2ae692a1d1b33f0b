#ifndef DEVBRIDGE_COMPILER_OUTPUT_PARSER_HPP
#define DEVBRIDGE_COMPILER_OUTPUT_PARSER_HPP

// GCC/Clang style diagnostics: "file:line[:column]: error|fatal error|warning: text".

#include <string>
#include <vector>

#include "host/host_abi.hpp"

namespace local_host {

enum class DiagnosticSeverity {
    Error,
    Warning,
};

struct ParsedDiagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    host::BuildMessage message;
};

// False for lines that are not diagnostics (notes, context lines, make output).
bool parse_diagnostic_line(const std::string &line, ParsedDiagnostic &diagnostic);

struct CompilerDiagnostics {
    std::vector<host::BuildMessage> errors;
    std::vector<host::BuildMessage> warnings;
};

// Repeated identical diagnostics (one header included twice) are reported once.
CompilerDiagnostics parse_compiler_output(const std::string &output);

// Last max_lines non-empty lines of output.
std::string output_tail(const std::string &output, size_t max_lines);

} // namespace local_host

#endif // DEVBRIDGE_COMPILER_OUTPUT_PARSER_HPP
