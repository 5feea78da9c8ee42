#ifndef CAPBRIDGE_CDP_CHROME_LAUNCH_HPP
#define CAPBRIDGE_CDP_CHROME_LAUNCH_HPP

// Chrome launch and debug port discovery via the DevToolsActivePort file.

#include <string>
#include <vector>

namespace cdp_chrome_launch {

struct LaunchOptions {
    std::string user_data_directory = "/tmp/capbridge_chrome_profile";
    bool headless = false;
};

// Result of launching Chrome and discovering the debug port.
struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string error_message;
};

// If a Chrome started on this profile is still running (DevToolsActivePort
// exists), returns its browser WebSocket URL. Otherwise empty.
std::string try_get_existing_websocket_url(const std::string &user_data_directory);

// Launch Chrome with remote debugging on an OS-chosen port.
ChromeLaunchResult launch_chrome(const LaunchOptions &options);

struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// Command line for a debuggable Chrome on the given profile. Port 0 lets Chrome pick.
ChromeCommandLine build_chrome_command_line(const LaunchOptions &options, int port);

// First Chrome or Chromium executable found, or empty.
std::string find_chrome_executable();

// Port from the first line of a DevToolsActivePort file, or -1.
int parse_devtools_active_port(const std::string &file_contents);

// ws://127.0.0.1:<port><browser_path>, with exactly one leading slash on the path.
std::string build_websocket_url(int port, const std::string &browser_path);

} // namespace cdp_chrome_launch

#endif // CAPBRIDGE_CDP_CHROME_LAUNCH_HPP
