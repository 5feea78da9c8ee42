#include "host/cdp/cdp_chrome_launch.hpp"
#include "platform/system_calls.hpp"
#include "utils/log_sink.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace cdp_chrome_launch {

// Bare names are looked up on PATH.
static const std::vector<std::string> LINUX_CHROME_CANDIDATES = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/snap/bin/chromium",
};

static const int PORT_FILE_TIMEOUT_MILLISECONDS = 15000;

std::string find_chrome_executable() {
    for (const auto &candidate : LINUX_CHROME_CANDIDATES) {
        std::string path = platform::find_executable_on_path(candidate);
        if (!path.empty()) {
            return path;
        }
    }
    return "";
}

ChromeCommandLine build_chrome_command_line(const LaunchOptions &options, int port) {
    ChromeCommandLine command_line;
    command_line.executable_path = find_chrome_executable();
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(port),
        "--remote-allow-origins=*",
        "--user-data-dir=" + options.user_data_directory,
    };
    if (getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    if (options.headless) {
        command_line.arguments.push_back("--headless=new");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-sync",
        "--disable-translate",
        "about:blank",
    };
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    return command_line;
}

int parse_devtools_active_port(const std::string &file_contents) {
    std::istringstream line_stream(file_contents);
    std::string first_line;
    if (!std::getline(line_stream, first_line) || first_line.empty()) {
        return -1;
    }

    try {
        int port = std::stoi(first_line);
        if (port > 0 && port <= 65535) {
            return port;
        }
    } catch (const std::exception &) {
        return -1;
    }
    return -1;
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    std::string path = browser_path;
    while (!path.empty() && path[0] == '/') {
        path.erase(0, 1);
    }
    path = path.empty() ? "/devtools/browser" : "/" + path;
    return "ws://127.0.0.1:" + std::to_string(port) + path;
}

// Port on the first line, browser endpoint path on the second.
static std::string websocket_url_from_port_file(const std::string &file_contents) {
    int port = parse_devtools_active_port(file_contents);
    if (port <= 0) {
        return "";
    }
    std::istringstream line_stream(file_contents);
    std::string first_line, second_line;
    std::getline(line_stream, first_line);
    std::getline(line_stream, second_line);
    return build_websocket_url(port, second_line);
}

std::string try_get_existing_websocket_url(const std::string &user_data_directory) {
    std::string file_contents;
    if (!platform::read_file_contents(user_data_directory + "/DevToolsActivePort", file_contents)) {
        return "";
    }
    return websocket_url_from_port_file(file_contents);
}

ChromeLaunchResult launch_chrome(const LaunchOptions &options) {
    ChromeLaunchResult result;

    log_sink::debug("Chrome launch starting, profile " + options.user_data_directory);

    std::error_code error;
    std::filesystem::create_directories(options.user_data_directory, error);
    if (error) {
        result.error_message = "Could not create profile directory " + options.user_data_directory + ": " +
                               error.message();
        return result;
    }
    // A port file left by a Chrome that is gone would be picked up immediately.
    std::string active_port_file = options.user_data_directory + "/DevToolsActivePort";
    std::filesystem::remove(active_port_file, error);

    ChromeCommandLine command_line = build_chrome_command_line(options, 0);
    if (command_line.executable_path.empty()) {
        result.error_message = "Could not find Chrome executable on this system. "
                               "Install google-chrome or chromium and ensure it is on PATH.";
        return result;
    }

    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path,
                                                                 command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn Chrome: " + spawn_result.error_message;
        return result;
    }
    result.process_id = spawn_result.process_id;

    if (!platform::wait_for_file(active_port_file, PORT_FILE_TIMEOUT_MILLISECONDS)) {
        log_sink::debug("launch_chrome: timed out waiting for DevToolsActivePort, killing Chrome pid=" +
                        std::to_string(result.process_id));
        result.error_message = "Timed out waiting for DevToolsActivePort file at: " + active_port_file;
        platform::kill_process(result.process_id);
        return result;
    }

    std::string file_contents;
    if (!platform::read_file_contents(active_port_file, file_contents)) {
        result.error_message = "Could not read DevToolsActivePort file at: " + active_port_file;
        platform::kill_process(result.process_id);
        return result;
    }
    result.debug_port = parse_devtools_active_port(file_contents);
    if (result.debug_port <= 0) {
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        platform::kill_process(result.process_id);
        return result;
    }
    result.websocket_debugger_url = websocket_url_from_port_file(file_contents);

    // The port file is written slightly before the socket accepts connections.
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    result.success = true;
    log_sink::info("Chrome launched (pid=" + std::to_string(result.process_id) + ", port=" +
                   std::to_string(result.debug_port) + ")");
    return result;
}

} // namespace cdp_chrome_launch
