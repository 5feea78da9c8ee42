#include "platform/system_calls.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

static std::vector<char *> build_argv(std::vector<std::string> &argv_strings) {
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);
    return argv_pointers;
}

static void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

static int remaining_milliseconds(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
}

// Write all of text, retrying on EINTR. Stops quietly if the child closed its stdin.
static void write_all(int descriptor, const std::string &text) {
    size_t written = 0;
    while (written < text.size()) {
        ssize_t count = write(descriptor, text.data() + written, text.size() - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        written += static_cast<size_t>(count);
    }
}

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers = build_argv(argv_strings);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                    nullptr, nullptr,
                                    argv_pointers.data(), environ);

    if (spawn_status != 0) {
        result.success = false;
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

ProcessResult run_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::string &input_text,
                          bool capture_output,
                          int timeout_milliseconds) {
    ProcessResult result;

    int input_pipe[2] = {-1, -1};
    int output_pipe[2] = {-1, -1};
    if (pipe2(input_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (capture_output && pipe2(output_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_descriptor(input_pipe[0]);
        close_descriptor(input_pipe[1]);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, input_pipe[0], STDIN_FILENO);
    if (capture_output) {
        posix_spawn_file_actions_adddup2(&file_actions, output_pipe[1], STDOUT_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    }
    posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers = build_argv(argv_strings);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    close_descriptor(input_pipe[0]);
    close_descriptor(output_pipe[1]);

    if (spawn_status != 0) {
        close_descriptor(input_pipe[1]);
        close_descriptor(output_pipe[0]);
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    write_all(input_pipe[1], input_text);
    close_descriptor(input_pipe[1]);

    bool bounded = timeout_milliseconds > 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(bounded ? timeout_milliseconds : 0);
    bool timed_out = false;

    while (output_pipe[0] >= 0) {
        struct pollfd poll_descriptor;
        poll_descriptor.fd = output_pipe[0];
        poll_descriptor.events = POLLIN;
        poll_descriptor.revents = 0;
        int ready = poll(&poll_descriptor, 1, bounded ? remaining_milliseconds(deadline) : -1);
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready == 0) {
            timed_out = true;
            break;
        }
        char buffer[4096];
        ssize_t count = read(output_pipe[0], buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        result.output.append(buffer, static_cast<size_t>(count));
    }
    close_descriptor(output_pipe[0]);

    int wait_status = 0;
    while (!timed_out) {
        pid_t waited = waitpid(child_pid, &wait_status, WNOHANG);
        if (waited == child_pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.error_message = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
        if (bounded && remaining_milliseconds(deadline) == 0) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        kill(child_pid, SIGKILL);
        waitpid(child_pid, &wait_status, 0);
        result.error_message = executable_path + " did not finish within " + std::to_string(timeout_milliseconds) + " ms";
        return result;
    }

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
        result.success = true;
    } else {
        result.error_message = executable_path + " terminated by a signal";
    }
    return result;
}

std::string find_executable_on_path(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + name;
        if (access(full_path.c_str(), X_OK) == 0 && !std::filesystem::is_directory(full_path)) {
            return full_path;
        }
    }
    return "";
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    const auto poll_interval = std::chrono::milliseconds(100);

    while (true) {
        std::error_code error;
        if (std::filesystem::exists(file_path, error)) {
            // Chrome may create the file before writing it.
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), SIGTERM);
    return (kill_result == 0);
}

} // namespace platform
