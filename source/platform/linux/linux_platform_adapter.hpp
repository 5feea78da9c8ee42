#ifndef CAPBRIDGE_LINUX_PLATFORM_ADAPTER_HPP
#define CAPBRIDGE_LINUX_PLATFORM_ADAPTER_HPP

// Linux implementation of the platform adapter.
// Desktop tools do the OS work: wl-copy/wl-paste or xclip for the clipboard,
// notify-send for notifications, zenity for permission prompts. Battery and
// network come from sysfs. Blocking work runs on a small worker pool and each
// position watch on its own thread.

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "platform/platform_adapter.hpp"
#include "utils/bridge_config.hpp"

namespace platform {

struct LinuxAdapterOptions {
    std::optional<bridge_config::FixedLocation> fixed_location;
    bridge_config::PermissionPolicy permission_policy = bridge_config::PermissionPolicy::Ask;
    int watch_interval_milliseconds = 1000;
    std::string power_supply_root = "/sys/class/power_supply";
    std::string net_root = "/sys/class/net";
    // Helper tools are killed after this long (prompts excepted).
    int tool_timeout_milliseconds = 5000;
    size_t worker_count = 4;
};

LinuxAdapterOptions adapter_options_from_config(const bridge_config::BridgeConfig &config);

class LinuxPlatformAdapter : public PlatformAdapter {
public:
    explicit LinuxPlatformAdapter(LinuxAdapterOptions options);
    ~LinuxPlatformAdapter() override;

    LinuxPlatformAdapter(const LinuxPlatformAdapter &) = delete;
    LinuxPlatformAdapter &operator=(const LinuxPlatformAdapter &) = delete;

    OsFamily os_family() const override;

    void clipboard_write(const std::string &text, OutcomeCallback done) override;
    void clipboard_read(OutcomeCallback done) override;
    void share(const ShareRequest &request, OutcomeCallback done) override;
    void show_notification(const NotificationRequest &request, OutcomeCallback done) override;
    void get_current_position(const PositionOptions &options, OutcomeCallback done) override;
    CancelFunction watch_position(const PositionOptions &options, OutcomeCallback on_event) override;
    void vibrate(const std::vector<int> &pattern, OutcomeCallback done) override;
    void get_battery(OutcomeCallback done) override;
    void get_network(OutcomeCallback done) override;
    void lock_orientation(const std::string &orientation, OutcomeCallback done) override;
    void unlock_orientation(OutcomeCallback done) override;
    void get_orientation(OutcomeCallback done) override;
    capability_contract::PermissionState query_permission(capability_contract::PermissionKind kind) override;
    void prompt_permission(capability_contract::PermissionKind kind, PermissionCallback done) override;

private:
    struct WatchState {
        std::mutex mutex;
        std::condition_variable condition;
        bool stopped = false;
        bool finished = false;
    };

    // Shared with the workers so the adapter may be released from one of its own tasks.
    struct TaskQueue {
        std::mutex mutex;
        std::condition_variable condition;
        std::deque<std::function<void()>> tasks;
        bool stopping = false;
    };

    void post(std::function<void()> task);
    static void worker_loop(std::shared_ptr<TaskQueue> queue);
    void join_finished_watches();
    AdapterOutcome current_position() const;
    capability_contract::PermissionState ask_user(capability_contract::PermissionKind kind);

    LinuxAdapterOptions options_;

    std::shared_ptr<TaskQueue> queue_;
    std::vector<std::thread> workers_;

    std::mutex watch_mutex_;
    std::vector<std::pair<std::shared_ptr<WatchState>, std::thread>> watches_;

    std::mutex state_mutex_;
    std::string local_clipboard_;
    std::map<capability_contract::PermissionKind, capability_contract::PermissionState> answers_;
};

} // namespace platform

#endif // CAPBRIDGE_LINUX_PLATFORM_ADAPTER_HPP
