#include "host/local/gtest_output_parser.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <stdexcept>

namespace local_host {

static const std::string RUN_PREFIX = "[ RUN      ] ";
static const std::string OK_PREFIX = "[       OK ] ";
static const std::string FAILED_PREFIX = "[  FAILED  ] ";
static const std::string SKIPPED_PREFIX = "[  SKIPPED ] ";

static bool starts_with(const std::string &text, const std::string &prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

static std::string trim(const std::string &text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        begin++;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(begin, end - begin);
}

std::string failure_summary(const std::vector<std::string> &lines) {
    for (size_t index = 0; index < lines.size(); index++) {
        std::string line = trim(lines[index]);
        if (line.size() >= 7 && line.compare(line.size() - 7, 7, "Failure") == 0) {
            for (size_t next = index + 1; next < lines.size(); next++) {
                std::string detail = trim(lines[next]);
                if (!detail.empty()) {
                    return detail;
                }
            }
            return line;
        }
    }
    for (const auto &raw_line : lines) {
        std::string line = trim(raw_line);
        if (!line.empty()) {
            return line;
        }
    }
    return "";
}

long parse_duration_milliseconds(const std::string &result_rest) {
    const std::string suffix = " ms)";
    if (result_rest.size() < suffix.size() ||
        result_rest.compare(result_rest.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return 0;
    }
    size_t open_position = result_rest.rfind('(');
    if (open_position == std::string::npos) {
        return 0;
    }
    std::string digits = result_rest.substr(open_position + 1, result_rest.size() - suffix.size() - open_position - 1);
    if (digits.empty()) {
        return 0;
    }
    for (char character : digits) {
        if (!std::isdigit(static_cast<unsigned char>(character))) {
            return 0;
        }
    }
    try {
        return std::stol(digits);
    } catch (const std::out_of_range &) {
        return 0;
    }
}

void GtestOutputParser::feed(const std::string &text) {
    partial_line_ += text;
    size_t line_start = 0;
    for (;;) {
        size_t newline = partial_line_.find('\n', line_start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = partial_line_.substr(line_start, newline - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        handle_line(line);
        line_start = newline + 1;
    }
    partial_line_.erase(0, line_start);
}

void GtestOutputParser::finish() {
    if (!partial_line_.empty()) {
        std::string line;
        line.swap(partial_line_);
        handle_line(line);
    }
    if (in_test_) {
        debug_log::log("Test " + current_full_name_ + " did not report a result");
        in_test_ = false;
    }
}

host::TestTreeNode &GtestOutputParser::suite_named(const std::string &suite_name) {
    for (size_t index = 0; index < suites_.size(); index++) {
        if (suites_[index].name == suite_name) {
            current_suite_ = index;
            return suites_[index];
        }
    }
    host::TestTreeNode suite;
    suite.name = suite_name;
    suites_.push_back(suite);
    current_suite_ = suites_.size() - 1;
    return suites_.back();
}

void GtestOutputParser::handle_line(const std::string &line) {
    if (starts_with(line, RUN_PREFIX)) {
        current_full_name_ = trim(line.substr(RUN_PREFIX.size()));
        std::string suite_name;
        std::string method_name = current_full_name_;
        size_t dot = current_full_name_.find('.');
        if (dot != std::string::npos) {
            suite_name = current_full_name_.substr(0, dot);
            method_name = current_full_name_.substr(dot + 1);
        }

        host::TestTreeNode leaf;
        leaf.name = method_name;
        leaf.is_leaf = true;
        leaf.outcome = host::TestOutcome::Running;
        suite_named(suite_name).children.push_back(leaf);
        current_output_.clear();
        in_test_ = true;
        return;
    }

    if (starts_with(line, OK_PREFIX)) {
        finish_current(host::TestOutcome::Passed, line.substr(OK_PREFIX.size()));
        return;
    }
    if (starts_with(line, FAILED_PREFIX)) {
        finish_current(host::TestOutcome::Defect, line.substr(FAILED_PREFIX.size()));
        return;
    }
    if (starts_with(line, SKIPPED_PREFIX)) {
        finish_current(host::TestOutcome::Ignored, line.substr(SKIPPED_PREFIX.size()));
        return;
    }

    if (in_test_) {
        current_output_.push_back(line);
    }
}

void GtestOutputParser::finish_current(host::TestOutcome outcome, const std::string &result_rest) {
    // Summary lines after the run repeat failed names with no test running.
    if (!in_test_ || !starts_with(result_rest, current_full_name_)) {
        return;
    }
    host::TestTreeNode &leaf = suites_[current_suite_].children.back();
    leaf.outcome = outcome;
    leaf.duration_milliseconds = parse_duration_milliseconds(result_rest);
    if (outcome != host::TestOutcome::Passed) {
        std::string diagnostic;
        for (const auto &output_line : current_output_) {
            diagnostic += output_line;
            diagnostic += '\n';
        }
        leaf.diagnostic_text = diagnostic;
        leaf.error_message = failure_summary(current_output_);
    }
    current_output_.clear();
    in_test_ = false;
}

host::TestTreeNode GtestOutputParser::tree() const {
    host::TestTreeNode root;
    root.name = "root";
    root.children = suites_;
    return root;
}

size_t GtestOutputParser::case_count() const {
    size_t count = 0;
    for (const auto &suite : suites_) {
        count += suite.children.size();
    }
    return count;
}

// --- GtestResultSource ---

GtestResultSource::GtestResultSource(host::ApplicationContext &context)
    : context_(context), parser_(std::make_shared<GtestOutputParser>()) {}

void GtestResultSource::on_process_text(const std::string &text) {
    std::shared_ptr<GtestOutputParser> parser = parser_;
    if (!context_.invoke_later([parser, text]() { parser->feed(text); })) {
        debug_log::log("Test output dropped, application context is shut down");
    }
}

void GtestResultSource::on_process_terminated(int exit_code) {
    std::shared_ptr<GtestOutputParser> parser = parser_;
    bool queued = context_.invoke_later([parser, exit_code]() {
        parser->finish();
        debug_log::log("Test process exited with code " + std::to_string(exit_code) + ", " +
                       std::to_string(parser->case_count()) + " case(s) reported");
    });
    if (!queued) {
        debug_log::log("Test termination dropped, application context is shut down");
    }
}

host::TestTreeNode GtestResultSource::read_tree() {
    return parser_->tree();
}

} // namespace local_host
