// Test runner: runs all unit test suites and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_utf8_sanitize {
    bool run_all_tests();
}

namespace test_output_buffer {
    bool run_all_tests();
}

namespace test_completion_bridge {
    bool run_all_tests();
}

namespace test_operation_lock {
    bool run_all_tests();
}

namespace test_run_registry {
    bool run_all_tests();
}

namespace test_result_extraction {
    bool run_all_tests();
}

namespace test_debug_facade {
    bool run_all_tests();
}

namespace test_bridge_service {
    bool run_all_tests();
}

namespace test_request_handlers {
    bool run_all_tests();
}

namespace test_output_parsers {
    bool run_all_tests();
}

namespace test_gdb_mi {
    bool run_all_tests();
}

namespace test_project_config {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_utf8_sanitize", test_utf8_sanitize::run_all_tests},
        {"test_output_buffer", test_output_buffer::run_all_tests},
        {"test_completion_bridge", test_completion_bridge::run_all_tests},
        {"test_operation_lock", test_operation_lock::run_all_tests},
        {"test_run_registry", test_run_registry::run_all_tests},
        {"test_result_extraction", test_result_extraction::run_all_tests},
        {"test_debug_facade", test_debug_facade::run_all_tests},
        {"test_bridge_service", test_bridge_service::run_all_tests},
        {"test_request_handlers", test_request_handlers::run_all_tests},
        {"test_output_parsers", test_output_parsers::run_all_tests},
        {"test_gdb_mi", test_gdb_mi::run_all_tests},
        {"test_project_config", test_project_config::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== devbridge Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
