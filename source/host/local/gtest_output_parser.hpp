#ifndef DEVBRIDGE_GTEST_OUTPUT_PARSER_HPP
#define DEVBRIDGE_GTEST_OUTPUT_PARSER_HPP

// Builds a test result tree from GoogleTest console output:
//
//   [ RUN      ] Suite.Name
//   ...failure text...
//   [  FAILED  ] Suite.Name (3 ms)
//
// Suites become inner nodes, test cases leaves named after the method.

#include <memory>
#include <string>
#include <vector>

#include "host/application_context.hpp"
#include "host/host_abi.hpp"

namespace local_host {

class GtestOutputParser {
public:
    // Text may end mid-line; the remainder is kept for the next call.
    void feed(const std::string &text);

    // Processes a trailing partial line. A test still running at this point
    // keeps the Running outcome.
    void finish();

    host::TestTreeNode tree() const;

    size_t case_count() const;

private:
    void handle_line(const std::string &line);
    void finish_current(host::TestOutcome outcome, const std::string &result_rest);
    host::TestTreeNode &suite_named(const std::string &suite_name);

    std::string partial_line_;
    std::vector<host::TestTreeNode> suites_;
    bool in_test_ = false;
    std::string current_full_name_;
    size_t current_suite_ = 0;
    std::vector<std::string> current_output_;
};

// "Failure" context of a gtest failure block, or its first non-empty line.
std::string failure_summary(const std::vector<std::string> &lines);

// Duration from a result line remainder like "Suite.Name (12 ms)"; 0 if absent.
long parse_duration_milliseconds(const std::string &result_rest);

// Feeds process output to a parser on the application context, so reads of
// the tree observe all text delivered before them.
class GtestResultSource : public host::TestResultSource {
public:
    explicit GtestResultSource(host::ApplicationContext &context);

    void on_process_text(const std::string &text) override;
    void on_process_terminated(int exit_code) override;
    host::TestTreeNode read_tree() override;

private:
    host::ApplicationContext &context_;
    std::shared_ptr<GtestOutputParser> parser_;
};

} // namespace local_host

#endif // DEVBRIDGE_GTEST_OUTPUT_PARSER_HPP
