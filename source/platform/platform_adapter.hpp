#ifndef CAPBRIDGE_PLATFORM_ADAPTER_HPP
#define CAPBRIDGE_PLATFORM_ADAPTER_HPP

// Platform abstraction interface.
// One implementation per OS family lives under platform/<os>/. The capability
// table adapts JSON arguments to these typed calls, so every adapter satisfies
// the same per-capability contract.
//
// All operations are asynchronous: the adapter reports through the supplied
// callback, from any thread, possibly before the call returns. Adapters report
// failures through the callback rather than by throwing.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include "bridge/bridge_error.hpp"
#include "bridge/capability_contract.hpp"
#include "platform/os_family.hpp"
#include "platform/payloads.hpp"

namespace platform {

using json = nlohmann::json;

// Outcome of one OS operation, or one event of a watch.
struct AdapterOutcome {
    bool success = false;
    json value;
    bridge_error::ErrorKind error_kind = bridge_error::ErrorKind::OperationFailed;
    std::string error_detail;
};

AdapterOutcome make_success(json value);
AdapterOutcome make_failure(bridge_error::ErrorKind kind, const std::string &detail);

using OutcomeCallback = std::function<void(const AdapterOutcome &outcome)>;
using PermissionCallback = std::function<void(capability_contract::PermissionState state)>;
// Stops a watch. Must be safe to call more than once and from any thread.
using CancelFunction = std::function<void()>;

class PlatformAdapter {
public:
    virtual ~PlatformAdapter() = default;

    virtual OsFamily os_family() const = 0;

    virtual void clipboard_write(const std::string &text, OutcomeCallback done) = 0;
    virtual void clipboard_read(OutcomeCallback done) = 0;

    virtual void share(const ShareRequest &request, OutcomeCallback done) = 0;

    virtual void show_notification(const NotificationRequest &request, OutcomeCallback done) = 0;

    // Value: build_position_value().
    virtual void get_current_position(const PositionOptions &options, OutcomeCallback done) = 0;
    // Delivers position values (or failures) to on_event until the returned function is called.
    virtual CancelFunction watch_position(const PositionOptions &options, OutcomeCallback on_event) = 0;

    // Durations in milliseconds, alternating vibrate/pause. Desktop adapters succeed as a no-op.
    virtual void vibrate(const std::vector<int> &pattern, OutcomeCallback done) = 0;

    // Value: build_battery_value().
    virtual void get_battery(OutcomeCallback done) = 0;
    // Value: build_network_value().
    virtual void get_network(OutcomeCallback done) = 0;

    virtual void lock_orientation(const std::string &orientation, OutcomeCallback done) = 0;
    virtual void unlock_orientation(OutcomeCallback done) = 0;
    // Value: build_orientation_value().
    virtual void get_orientation(OutcomeCallback done) = 0;

    // Current OS-level permission state, without prompting. Polled before gated calls.
    virtual capability_contract::PermissionState query_permission(capability_contract::PermissionKind kind) = 0;
    // Show the OS permission prompt and report the answer. Dismissal reports NotDetermined or Denied.
    virtual void prompt_permission(capability_contract::PermissionKind kind, PermissionCallback done) = 0;
};

} // namespace platform

#endif // CAPBRIDGE_PLATFORM_ADAPTER_HPP
