#include "host/local/compiler_output_parser.hpp"

#include <cctype>
#include <set>
#include <sstream>
#include <tuple>

namespace local_host {

struct SeverityMarker {
    const char *text;
    DiagnosticSeverity severity;
};

static const SeverityMarker SEVERITY_MARKERS[] = {
    {": fatal error: ", DiagnosticSeverity::Error},
    {": error: ", DiagnosticSeverity::Error},
    {": warning: ", DiagnosticSeverity::Warning},
};

static bool is_number(const std::string &text) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char character : text) {
        if (!std::isdigit(static_cast<unsigned char>(character))) {
            return false;
        }
    }
    return true;
}

bool parse_diagnostic_line(const std::string &line, ParsedDiagnostic &diagnostic) {
    size_t marker_position = std::string::npos;
    const SeverityMarker *found = nullptr;
    for (const auto &marker : SEVERITY_MARKERS) {
        size_t position = line.find(marker.text);
        if (position != std::string::npos && position < marker_position) {
            marker_position = position;
            found = &marker;
        }
    }
    if (found == nullptr) {
        return false;
    }

    // Location is "file:line" or "file:line:column".
    std::string location = line.substr(0, marker_position);
    std::string message_text = line.substr(marker_position + std::string(found->text).size());

    size_t last_colon = location.rfind(':');
    if (last_colon == std::string::npos) {
        return false;
    }
    std::string last_part = location.substr(last_colon + 1);
    if (!is_number(last_part)) {
        return false;
    }

    host::BuildMessage message;
    std::string head = location.substr(0, last_colon);
    size_t previous_colon = head.rfind(':');
    if (previous_colon != std::string::npos && is_number(head.substr(previous_colon + 1))) {
        message.file = head.substr(0, previous_colon);
        message.line = std::stoi(head.substr(previous_colon + 1));
        message.column = std::stoi(last_part);
    } else {
        message.file = head;
        message.line = std::stoi(last_part);
    }
    if (message.file.empty()) {
        return false;
    }
    message.message = message_text;

    diagnostic.severity = found->severity;
    diagnostic.message = message;
    return true;
}

CompilerDiagnostics parse_compiler_output(const std::string &output) {
    CompilerDiagnostics diagnostics;
    std::set<std::tuple<std::string, int, int, std::string>> seen;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        ParsedDiagnostic diagnostic;
        if (!parse_diagnostic_line(line, diagnostic)) {
            continue;
        }
        const host::BuildMessage &message = diagnostic.message;
        if (!seen.insert(std::make_tuple(message.file, message.line, message.column, message.message)).second) {
            continue;
        }
        if (diagnostic.severity == DiagnosticSeverity::Error) {
            diagnostics.errors.push_back(message);
        } else {
            diagnostics.warnings.push_back(message);
        }
    }
    return diagnostics;
}

std::string output_tail(const std::string &output, size_t max_lines) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        lines.push_back(line);
    }

    size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::string tail;
    for (size_t index = first; index < lines.size(); index++) {
        if (!tail.empty()) {
            tail += '\n';
        }
        tail += lines[index];
    }
    return tail;
}

} // namespace local_host
