#ifndef CAPBRIDGE_SYSTEM_CALLS_HPP
#define CAPBRIDGE_SYSTEM_CALLS_HPP

// Process and file helpers used by the OS adapters and the renderer host.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Result of running a helper tool to completion.
struct ProcessResult {
    bool success = false; // started and exited on its own (any exit code)
    int exit_code = -1;
    std::string output;   // stdout, when captured
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The process runs detached (not waited on immediately).
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Run a process, feed input_text to its stdin, wait for it to exit.
// stdout is captured when capture_output is set, otherwise discarded; stderr is discarded.
// Input is written before output is read, so keep input small when capturing.
// A process still running after timeout_milliseconds is killed (timeout <= 0 waits forever).
ProcessResult run_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::string &input_text,
                          bool capture_output,
                          int timeout_milliseconds);

// Full path of an executable found on PATH, or empty.
std::string find_executable_on_path(const std::string &name);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Wait (poll) until a file exists and is non-empty, up to timeout_milliseconds.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Kill a process by its process ID.
bool kill_process(int process_id);

} // namespace platform

#endif // CAPBRIDGE_SYSTEM_CALLS_HPP
