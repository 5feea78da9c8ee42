#include "platform/linux/linux_platform_adapter.hpp"
#include "platform/linux/linux_sysfs.hpp"
#include "platform/system_calls.hpp"
#include "utils/log_sink.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>

namespace platform {

using bridge_error::ErrorKind;
using capability_contract::PermissionKind;
using capability_contract::PermissionState;

// Clipboard helpers for the running display server.
struct ClipboardTool {
    std::string write_path;
    std::vector<std::string> write_arguments;
    std::string read_path;
    std::vector<std::string> read_arguments;
};

static bool environment_set(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}

static std::optional<ClipboardTool> find_clipboard_tool() {
    if (environment_set("WAYLAND_DISPLAY")) {
        std::string copy_path = find_executable_on_path("wl-copy");
        std::string paste_path = find_executable_on_path("wl-paste");
        if (!copy_path.empty() && !paste_path.empty()) {
            return ClipboardTool{copy_path, {}, paste_path, {"--no-newline"}};
        }
    }
    if (environment_set("DISPLAY")) {
        std::string xclip_path = find_executable_on_path("xclip");
        if (!xclip_path.empty()) {
            return ClipboardTool{xclip_path, {"-selection", "clipboard", "-i"},
                                 xclip_path, {"-selection", "clipboard", "-o"}};
        }
    }
    return std::nullopt;
}

static Position position_from_fixed_location(const bridge_config::FixedLocation &location) {
    Position position;
    position.latitude = location.latitude;
    position.longitude = location.longitude;
    position.accuracy = location.accuracy;
    position.timestamp_ms = now_epoch_milliseconds();
    return position;
}

static const char *prompt_text(PermissionKind kind) {
    switch (kind) {
    case PermissionKind::Location:
        return "Allow this page to use your location?";
    case PermissionKind::Notifications:
        return "Allow this page to show notifications?";
    }
    return "Allow this page to use a restricted capability?";
}

static void deliver_safely(const OutcomeCallback &callback, const AdapterOutcome &outcome) {
    try {
        callback(outcome);
    } catch (const std::exception &exception) {
        log_sink::error(std::string("linux adapter: outcome callback threw: ") + exception.what());
    }
}

LinuxAdapterOptions adapter_options_from_config(const bridge_config::BridgeConfig &config) {
    LinuxAdapterOptions options;
    options.fixed_location = config.fixed_location;
    options.permission_policy = config.permission_policy;
    options.watch_interval_milliseconds = config.watch_interval_milliseconds;
    return options;
}

LinuxPlatformAdapter::LinuxPlatformAdapter(LinuxAdapterOptions options)
    : options_(std::move(options)),
      queue_(std::make_shared<TaskQueue>()) {
    size_t worker_count = options_.worker_count > 0 ? options_.worker_count : 1;
    for (size_t index = 0; index < worker_count; index++) {
        workers_.emplace_back(&LinuxPlatformAdapter::worker_loop, queue_);
    }
}

LinuxPlatformAdapter::~LinuxPlatformAdapter() {
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->stopping = true;
        queue_->tasks.clear();
    }
    queue_->condition.notify_all();
    for (auto &worker : workers_) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // Last reference dropped by a task running on this worker.
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }

    std::vector<std::pair<std::shared_ptr<WatchState>, std::thread>> watches;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watches.swap(watches_);
    }
    for (auto &watch : watches) {
        {
            std::lock_guard<std::mutex> lock(watch.first->mutex);
            watch.first->stopped = true;
        }
        watch.first->condition.notify_all();
        if (watch.second.joinable()) {
            watch.second.join();
        }
    }
}

void LinuxPlatformAdapter::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        if (queue_->stopping) {
            return;
        }
        queue_->tasks.push_back(std::move(task));
    }
    queue_->condition.notify_one();
}

void LinuxPlatformAdapter::worker_loop(std::shared_ptr<TaskQueue> queue) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->condition.wait(lock, [&queue]() { return queue->stopping || !queue->tasks.empty(); });
            if (queue->stopping) {
                return;
            }
            task = std::move(queue->tasks.front());
            queue->tasks.pop_front();
        }
        try {
            task();
        } catch (const std::exception &exception) {
            log_sink::error(std::string("linux adapter: task threw: ") + exception.what());
        }
    }
}

void LinuxPlatformAdapter::join_finished_watches() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        for (auto iterator = watches_.begin(); iterator != watches_.end();) {
            bool done = false;
            {
                std::lock_guard<std::mutex> state_lock(iterator->first->mutex);
                done = iterator->first->finished;
            }
            if (done) {
                finished.push_back(std::move(iterator->second));
                iterator = watches_.erase(iterator);
            } else {
                ++iterator;
            }
        }
    }
    for (auto &thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

OsFamily LinuxPlatformAdapter::os_family() const {
    return OsFamily::Linux;
}

void LinuxPlatformAdapter::clipboard_write(const std::string &text, OutcomeCallback done) {
    post([this, text, done]() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            local_clipboard_ = text;
        }
        std::optional<ClipboardTool> tool = find_clipboard_tool();
        if (tool) {
            ProcessResult process = run_process(tool->write_path, tool->write_arguments, text, false,
                                                options_.tool_timeout_milliseconds);
            if (!process.success || process.exit_code != 0) {
                log_sink::warning("clipboard write via " + tool->write_path +
                                  " failed, keeping the text in the process clipboard: " +
                                  (process.error_message.empty() ? "exit code " + std::to_string(process.exit_code)
                                                                 : process.error_message));
            }
        }
        deliver_safely(done, make_success(true));
    });
}

void LinuxPlatformAdapter::clipboard_read(OutcomeCallback done) {
    post([this, done]() {
        std::optional<ClipboardTool> tool = find_clipboard_tool();
        if (tool) {
            ProcessResult process = run_process(tool->read_path, tool->read_arguments, "", true,
                                                options_.tool_timeout_milliseconds);
            if (process.success && process.exit_code == 0) {
                deliver_safely(done, make_success(process.output));
                return;
            }
            log_sink::debug("clipboard read via " + tool->read_path + " failed, using the process clipboard");
        }
        std::string text;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            text = local_clipboard_;
        }
        deliver_safely(done, make_success(text));
    });
}

void LinuxPlatformAdapter::share(const ShareRequest &request, OutcomeCallback done) {
    (void)request;
    done(make_failure(ErrorKind::CapabilityUnavailable, "no system share sheet on linux"));
}

void LinuxPlatformAdapter::show_notification(const NotificationRequest &request, OutcomeCallback done) {
    post([this, request, done]() {
        std::string notify_path = find_executable_on_path("notify-send");
        if (notify_path.empty()) {
            deliver_safely(done, make_failure(ErrorKind::OperationFailed, "notify-send not found on PATH"));
            return;
        }
        std::vector<std::string> arguments;
        if (!request.icon.empty()) {
            arguments.push_back("--icon=" + request.icon);
        }
        arguments.push_back("--");
        arguments.push_back(request.title);
        if (!request.body.empty()) {
            arguments.push_back(request.body);
        }
        ProcessResult process = run_process(notify_path, arguments, "", false, options_.tool_timeout_milliseconds);
        if (!process.success) {
            deliver_safely(done, make_failure(ErrorKind::OperationFailed, process.error_message));
            return;
        }
        if (process.exit_code != 0) {
            deliver_safely(done, make_failure(ErrorKind::OperationFailed,
                                              "notify-send exited with code " + std::to_string(process.exit_code)));
            return;
        }
        deliver_safely(done, make_success(true));
    });
}

AdapterOutcome LinuxPlatformAdapter::current_position() const {
    if (!options_.fixed_location) {
        return make_failure(ErrorKind::OperationFailed,
                            "no location provider configured (set CAPBRIDGE_LOCATION=lat,lon[,accuracy])");
    }
    return make_success(build_position_value(position_from_fixed_location(*options_.fixed_location)));
}

void LinuxPlatformAdapter::get_current_position(const PositionOptions &options, OutcomeCallback done) {
    (void)options;
    done(current_position());
}

CancelFunction LinuxPlatformAdapter::watch_position(const PositionOptions &options, OutcomeCallback on_event) {
    (void)options;
    join_finished_watches();

    auto state = std::make_shared<WatchState>();
    std::optional<bridge_config::FixedLocation> location = options_.fixed_location;
    auto interval = std::chrono::milliseconds(options_.watch_interval_milliseconds > 0
                                                  ? options_.watch_interval_milliseconds
                                                  : 1000);

    std::thread watch_thread([state, location, interval, on_event]() {
        bool failure_reported = false;
        std::unique_lock<std::mutex> lock(state->mutex);
        while (!state->stopped) {
            lock.unlock();
            if (location) {
                deliver_safely(on_event, make_success(build_position_value(position_from_fixed_location(*location))));
            } else if (!failure_reported) {
                // Reported once; the watch stays open in case the caller keeps it.
                deliver_safely(on_event, make_failure(ErrorKind::OperationFailed, "no location provider configured"));
                failure_reported = true;
            }
            lock.lock();
            state->condition.wait_for(lock, interval, [&state]() { return state->stopped; });
        }
        state->finished = true;
    });

    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watches_.emplace_back(state, std::move(watch_thread));
    }

    return [state]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->stopped = true;
        }
        state->condition.notify_all();
    };
}

void LinuxPlatformAdapter::vibrate(const std::vector<int> &pattern, OutcomeCallback done) {
    (void)pattern;
    done(make_success(true));
}

void LinuxPlatformAdapter::get_battery(OutcomeCallback done) {
    post([this, done]() {
        std::optional<BatteryStatus> status = linux_sysfs::read_battery(options_.power_supply_root);
        if (!status) {
            // Mains-powered machine: report a full battery.
            BatteryStatus mains;
            mains.level = 1.0;
            mains.state = ChargingState::Full;
            status = mains;
        }
        deliver_safely(done, make_success(build_battery_value(*status)));
    });
}

void LinuxPlatformAdapter::get_network(OutcomeCallback done) {
    post([this, done]() {
        deliver_safely(done, make_success(build_network_value(linux_sysfs::read_connection_type(options_.net_root))));
    });
}

void LinuxPlatformAdapter::lock_orientation(const std::string &orientation, OutcomeCallback done) {
    (void)orientation;
    done(make_failure(ErrorKind::CapabilityUnavailable, "desktop windows cannot lock orientation"));
}

void LinuxPlatformAdapter::unlock_orientation(OutcomeCallback done) {
    done(make_failure(ErrorKind::CapabilityUnavailable, "desktop windows cannot lock orientation"));
}

void LinuxPlatformAdapter::get_orientation(OutcomeCallback done) {
    OrientationInfo orientation;
    orientation.type = "landscape-primary";
    orientation.angle = 0;
    done(make_success(build_orientation_value(orientation)));
}

PermissionState LinuxPlatformAdapter::query_permission(PermissionKind kind) {
    switch (options_.permission_policy) {
    case bridge_config::PermissionPolicy::Grant:
        return PermissionState::Granted;
    case bridge_config::PermissionPolicy::Deny:
        return PermissionState::Denied;
    case bridge_config::PermissionPolicy::Ask:
        break;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto iterator = answers_.find(kind);
    return iterator == answers_.end() ? PermissionState::NotDetermined : iterator->second;
}

PermissionState LinuxPlatformAdapter::ask_user(PermissionKind kind) {
    if (!environment_set("DISPLAY") && !environment_set("WAYLAND_DISPLAY")) {
        log_sink::warning("no display for a permission dialog, treating the prompt as denied");
        return PermissionState::Denied;
    }
    std::string zenity_path = find_executable_on_path("zenity");
    if (zenity_path.empty()) {
        log_sink::warning("zenity not found on PATH, treating the prompt as denied");
        return PermissionState::Denied;
    }
    log_sink::info(std::string("asking the user for ") + capability_contract::permission_name(kind) + " permission");
    ProcessResult process = run_process(zenity_path,
                                        {"--question", "--title=Permission request",
                                         std::string("--text=") + prompt_text(kind)},
                                        "", false, 0);
    if (!process.success) {
        log_sink::warning("permission dialog failed: " + process.error_message);
        return PermissionState::Denied;
    }
    // zenity exits 0 for "Yes", 1 for "No", 5 or -1 when closed.
    return process.exit_code == 0 ? PermissionState::Granted : PermissionState::Denied;
}

void LinuxPlatformAdapter::prompt_permission(PermissionKind kind, PermissionCallback done) {
    switch (options_.permission_policy) {
    case bridge_config::PermissionPolicy::Grant:
        done(PermissionState::Granted);
        return;
    case bridge_config::PermissionPolicy::Deny:
        done(PermissionState::Denied);
        return;
    case bridge_config::PermissionPolicy::Ask:
        break;
    }
    post([this, kind, done]() {
        PermissionState answer = ask_user(kind);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            answers_[kind] = answer;
        }
        done(answer);
    });
}

} // namespace platform
