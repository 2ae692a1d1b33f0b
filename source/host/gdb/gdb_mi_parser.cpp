#include "host/gdb/gdb_mi_parser.hpp"

#include <cctype>
#include <stdexcept>

namespace gdb_mi {

namespace {

bool is_name_character(char character) {
    return std::isalnum(static_cast<unsigned char>(character)) || character == '_' || character == '-';
}

// Recursive descent over the value grammar of one record line.
class ValueParser {
public:
    ValueParser(const std::string &text, size_t position) : text_(text), position_(position) {}

    size_t position() const { return position_; }
    const std::string &error() const { return error_; }
    bool at_end() const { return position_ >= text_.size(); }

    bool parse_value(json &value) {
        if (at_end()) {
            return fail("value expected at end of line");
        }
        char next = text_[position_];
        if (next == '"') {
            std::string decoded;
            if (!parse_c_string(text_, position_, decoded)) {
                return fail("malformed c-string");
            }
            value = decoded;
            return true;
        }
        if (next == '{') {
            return parse_tuple(value);
        }
        if (next == '[') {
            return parse_list(value);
        }
        return fail(std::string("unexpected '") + next + "'");
    }

    bool parse_result(std::string &name, json &value) {
        size_t start = position_;
        while (!at_end() && is_name_character(text_[position_])) {
            position_++;
        }
        if (position_ == start || at_end() || text_[position_] != '=') {
            return fail("result name expected");
        }
        name = text_.substr(start, position_ - start);
        position_++;
        return parse_value(value);
    }

    // ("," result)* up to the end of the line.
    bool parse_trailing_results(json &object) {
        while (!at_end()) {
            if (text_[position_] != ',') {
                return fail("',' expected");
            }
            position_++;
            // Multi-location breakpoints append bare tuples after bkpt={...}.
            if (!at_end() && text_[position_] == '{') {
                json ignored;
                if (!parse_tuple(ignored)) {
                    return false;
                }
                continue;
            }
            std::string name;
            json value;
            if (!parse_result(name, value)) {
                return false;
            }
            object[name] = value;
        }
        return true;
    }

private:
    bool fail(const std::string &message) {
        if (error_.empty()) {
            error_ = message + " at column " + std::to_string(position_);
        }
        return false;
    }

    bool parse_tuple(json &value) {
        value = json::object();
        position_++;
        if (!at_end() && text_[position_] == '}') {
            position_++;
            return true;
        }
        for (;;) {
            std::string name;
            json member;
            if (!parse_result(name, member)) {
                return false;
            }
            value[name] = member;
            if (at_end()) {
                return fail("unterminated tuple");
            }
            if (text_[position_] == '}') {
                position_++;
                return true;
            }
            if (text_[position_] != ',') {
                return fail("',' or '}' expected in tuple");
            }
            position_++;
        }
    }

    bool parse_list(json &value) {
        value = json::array();
        position_++;
        if (!at_end() && text_[position_] == ']') {
            position_++;
            return true;
        }
        for (;;) {
            if (at_end()) {
                return fail("unterminated list");
            }
            json item;
            char next = text_[position_];
            if (next == '"' || next == '{' || next == '[') {
                if (!parse_value(item)) {
                    return false;
                }
            } else {
                std::string ignored_name;
                if (!parse_result(ignored_name, item)) {
                    return false;
                }
            }
            value.push_back(item);
            if (at_end()) {
                return fail("unterminated list");
            }
            if (text_[position_] == ']') {
                position_++;
                return true;
            }
            if (text_[position_] != ',') {
                return fail("',' or ']' expected in list");
            }
            position_++;
        }
    }

    const std::string &text_;
    size_t position_;
    std::string error_;
};

} // namespace

bool parse_c_string(const std::string &text, size_t &position, std::string &value) {
    if (position >= text.size() || text[position] != '"') {
        return false;
    }
    value.clear();
    size_t index = position + 1;
    while (index < text.size()) {
        char character = text[index];
        if (character == '"') {
            position = index + 1;
            return true;
        }
        if (character != '\\') {
            value += character;
            index++;
            continue;
        }

        index++;
        if (index >= text.size()) {
            return false;
        }
        char escaped = text[index];
        switch (escaped) {
        case 'n': value += '\n'; index++; break;
        case 't': value += '\t'; index++; break;
        case 'r': value += '\r'; index++; break;
        case 'a': value += '\a'; index++; break;
        case 'b': value += '\b'; index++; break;
        case 'f': value += '\f'; index++; break;
        case 'v': value += '\v'; index++; break;
        case 'e': value += '\x1b'; index++; break;
        default:
            if (escaped >= '0' && escaped <= '7') {
                // Up to three octal digits; GDB escapes non-ASCII bytes this way.
                int code = 0;
                int digits = 0;
                while (digits < 3 && index < text.size() && text[index] >= '0' && text[index] <= '7') {
                    code = code * 8 + (text[index] - '0');
                    index++;
                    digits++;
                }
                value += static_cast<char>(code & 0xff);
            } else {
                value += escaped;
                index++;
            }
            break;
        }
    }
    return false;
}

bool parse_record(const std::string &raw_line, Record &record, std::string &error_detail) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    record = Record{};
    if (line.compare(0, 5, "(gdb)") == 0 && line.find_first_not_of(' ', 5) == std::string::npos) {
        record.type = RecordType::Prompt;
        return true;
    }

    size_t position = 0;
    while (position < line.size() && std::isdigit(static_cast<unsigned char>(line[position]))) {
        position++;
    }
    if (position > 0) {
        try {
            record.token = std::stoull(line.substr(0, position));
            record.has_token = true;
        } catch (const std::out_of_range &) {
            return false;
        }
    }
    if (position >= line.size()) {
        return false;
    }

    char marker = line[position];
    switch (marker) {
    case '~':
    case '@':
    case '&': {
        record.type = marker == '~'   ? RecordType::ConsoleStream
                      : marker == '@' ? RecordType::TargetStream
                                      : RecordType::LogStream;
        size_t string_position = position + 1;
        if (!parse_c_string(line, string_position, record.stream_text) || string_position != line.size()) {
            error_detail = "malformed stream record";
            return false;
        }
        return true;
    }
    case '^':
        record.type = RecordType::Result;
        break;
    case '*':
        record.type = RecordType::ExecAsync;
        break;
    case '+':
        record.type = RecordType::StatusAsync;
        break;
    case '=':
        record.type = RecordType::NotifyAsync;
        break;
    default:
        return false;
    }

    size_t class_start = position + 1;
    size_t class_end = class_start;
    while (class_end < line.size() && is_name_character(line[class_end])) {
        class_end++;
    }
    if (class_end == class_start) {
        error_detail = "record class expected";
        return false;
    }
    record.record_class = line.substr(class_start, class_end - class_start);

    ValueParser parser(line, class_end);
    if (!parser.parse_trailing_results(record.results)) {
        error_detail = parser.error();
        return false;
    }
    return true;
}

std::string quote_argument(const std::string &value) {
    std::string quoted = "\"";
    for (char character : value) {
        if (character == '"' || character == '\\') {
            quoted += '\\';
            quoted += character;
        } else if (character == '\n') {
            quoted += "\\n";
        } else {
            quoted += character;
        }
    }
    quoted += '"';
    return quoted;
}

std::string string_field(const json &tuple, const char *key, const std::string &fallback) {
    if (!tuple.is_object() || !tuple.contains(key) || !tuple[key].is_string()) {
        return fallback;
    }
    return tuple[key].get<std::string>();
}

int int_field(const json &tuple, const char *key, int fallback) {
    std::string text = string_field(tuple, key);
    if (text.empty()) {
        if (tuple.is_object() && tuple.contains(key) && tuple[key].is_number_integer()) {
            return tuple[key].get<int>();
        }
        return fallback;
    }
    try {
        return std::stoi(text);
    } catch (const std::exception &) {
        return fallback;
    }
}

} // namespace gdb_mi
