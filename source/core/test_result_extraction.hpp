#ifndef DEVBRIDGE_TEST_RESULT_EXTRACTION_HPP
#define DEVBRIDGE_TEST_RESULT_EXTRACTION_HPP

// Reads the host's test result tree after the test process has terminated.
// The tree is populated asynchronously, so an empty tree is re-read up to a
// fixed number of attempts before falling back to the exit code.

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "core/bridge_errors.hpp"
#include "host/application_context.hpp"
#include "host/host_abi.hpp"

namespace bridge_core {

enum class TestStatus {
    Passed,
    Failed,
    Skipped,
    Error,
};

// "PASSED", "FAILED", "SKIPPED", "ERROR".
const char *test_status_name(TestStatus status);

struct TestCaseResult {
    std::string name;
    std::string class_name;
    std::string method_name;
    TestStatus status = TestStatus::Passed;
    long time_milliseconds = 0;
    std::string message;
    std::string stack_trace;
};

struct TestRunResult {
    bool success = false;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    long time_milliseconds = 0;
    std::vector<TestCaseResult> tests;
    // Run registry entry of the test process, when one was started.
    std::string run_id;
    // Informational note, e.g. for the exit-code fallback.
    std::string message;
    // Set when the tests were started under the debugger instead.
    std::string debug_session_id;
    int extraction_attempts = 0;
    BridgeError error;
};

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds delay{200};
    // Bound for a single read on the application context.
    std::chrono::milliseconds read_timeout{5000};
};

struct ParsedTestName {
    std::string class_name;
    std::string method_name;
};

// "method(Class)" splits into its parts; anything else is the method name
// with parent_name (or "Unknown") as the class.
ParsedTestName parse_test_name(const std::string &test_name, const std::string &parent_name);

// Defects are errors when their diagnostics name an Error or Exception,
// assertion failures otherwise. A leaf that never reported is an error.
TestStatus classify_leaf(const host::TestTreeNode &leaf);

// Flattens the tree: leaves become cases, other nodes are recursed into.
void collect_test_results(const host::TestTreeNode &node, const std::string &parent_name,
                          std::vector<TestCaseResult> &results);

// Result for a list of cases, or the exit-code fallback when it is empty.
TestRunResult summarize_test_results(std::vector<TestCaseResult> tests, int exit_code, long time_milliseconds);

// Re-reads read_tree on the application context until it yields at least one
// case or policy.max_attempts reads were made, sleeping policy.delay between.
TestRunResult extract_test_results(host::ApplicationContext &context,
                                   const std::function<host::TestTreeNode()> &read_tree,
                                   int exit_code,
                                   std::chrono::steady_clock::time_point started_at,
                                   const RetryPolicy &policy);

} // namespace bridge_core

#endif // DEVBRIDGE_TEST_RESULT_EXTRACTION_HPP
