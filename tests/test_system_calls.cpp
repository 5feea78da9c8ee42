// Tests for the process and file helpers, using standard POSIX tools.

#include <iostream>
#include <string>

#include "platform/system_calls.hpp"

namespace test_system_calls {

// Test: Input reaches the child's stdin and its stdout is captured.
static bool test_run_process_captures_output() {
    platform::ProcessResult result = platform::run_process("/bin/cat", {}, "clip board\n", true, 5000);
    bool success = result.success && result.exit_code == 0 && result.output == "clip board\n";

    if (success) {
        std::cout << "  OK: cat echoed its input" << std::endl;
    } else {
        std::cout << "  FAIL: run_process output '" << result.output << "' error '" << result.error_message << "'"
                  << std::endl;
    }
    return success;
}

// Test: A non-zero exit status is reported, not treated as a failure to run.
static bool test_run_process_exit_code() {
    platform::ProcessResult result = platform::run_process("/bin/sh", {"-c", "exit 3"}, "", false, 5000);
    bool success = result.success && result.exit_code == 3;

    if (success) {
        std::cout << "  OK: Exit code 3 reported" << std::endl;
    } else {
        std::cout << "  FAIL: Exit code was " << result.exit_code << std::endl;
    }
    return success;
}

// Test: A process exceeding its timeout is killed and reported as failed.
static bool test_run_process_timeout() {
    platform::ProcessResult result = platform::run_process("/bin/sleep", {"5"}, "", false, 200);
    bool success = !result.success && result.error_message.find("did not finish") != std::string::npos;

    if (success) {
        std::cout << "  OK: Slow process killed at timeout" << std::endl;
    } else {
        std::cout << "  FAIL: Timeout not enforced (" << result.error_message << ")" << std::endl;
    }
    return success;
}

// Test: A missing executable fails to start.
static bool test_run_process_missing_executable() {
    platform::ProcessResult result = platform::run_process("/nonexistent/capbridge-tool", {}, "", true, 1000);
    bool success = !result.success && !result.error_message.empty();

    if (success) {
        std::cout << "  OK: Missing executable reported" << std::endl;
    } else {
        std::cout << "  FAIL: Missing executable ran" << std::endl;
    }
    return success;
}

// Test: PATH lookup finds sh and misses unknown names.
static bool test_find_executable_on_path() {
    std::string shell = platform::find_executable_on_path("sh");
    bool success = !shell.empty() && shell.back() == 'h' &&
                   platform::find_executable_on_path("capbridge-no-such-tool").empty();

    if (success) {
        std::cout << "  OK: sh found at " << shell << std::endl;
    } else {
        std::cout << "  FAIL: PATH lookup returned '" << shell << "'" << std::endl;
    }
    return success;
}

// Test: Reading a missing file fails.
static bool test_read_missing_file() {
    std::string contents;
    bool success = !platform::read_file_contents("/nonexistent/capbridge/file", contents) && contents.empty();

    if (success) {
        std::cout << "  OK: Missing file not read" << std::endl;
    } else {
        std::cout << "  FAIL: Missing file reported as read" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_run_process_captures_output();
    all_passed &= test_run_process_exit_code();
    all_passed &= test_run_process_timeout();
    all_passed &= test_run_process_missing_executable();
    all_passed &= test_find_executable_on_path();
    all_passed &= test_read_missing_file();
    return all_passed;
}

} // namespace test_system_calls
