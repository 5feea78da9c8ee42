// Test runner: runs every test suite and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_argument_schema {
    bool run_all_tests();
}

namespace test_registry {
    bool run_all_tests();
}

namespace test_permission_gate {
    bool run_all_tests();
}

namespace test_dispatcher {
    bool run_all_tests();
}

namespace test_subscriptions {
    bool run_all_tests();
}

namespace test_bridge_scenarios {
    bool run_all_tests();
}

namespace test_wire_protocol {
    bool run_all_tests();
}

namespace test_script_facade {
    bool run_all_tests();
}

namespace test_bridge_config {
    bool run_all_tests();
}

namespace test_linux_sysfs {
    bool run_all_tests();
}

namespace test_system_calls {
    bool run_all_tests();
}

namespace test_host_stdio {
    bool run_all_tests();
}

namespace test_cdp_classify {
    bool run_all_tests();
}

namespace test_chrome_launch {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_argument_schema", test_argument_schema::run_all_tests},
        {"test_registry", test_registry::run_all_tests},
        {"test_permission_gate", test_permission_gate::run_all_tests},
        {"test_dispatcher", test_dispatcher::run_all_tests},
        {"test_subscriptions", test_subscriptions::run_all_tests},
        {"test_bridge_scenarios", test_bridge_scenarios::run_all_tests},
        {"test_wire_protocol", test_wire_protocol::run_all_tests},
        {"test_script_facade", test_script_facade::run_all_tests},
        {"test_bridge_config", test_bridge_config::run_all_tests},
        {"test_linux_sysfs", test_linux_sysfs::run_all_tests},
        {"test_system_calls", test_system_calls::run_all_tests},
        {"test_host_stdio", test_host_stdio::run_all_tests},
        {"test_cdp_classify", test_cdp_classify::run_all_tests},
        {"test_chrome_launch", test_chrome_launch::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== capbridge Test Runner ===" << std::endl;
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
