#ifndef CAPBRIDGE_CAPABILITY_CONTRACT_HPP
#define CAPBRIDGE_CAPABILITY_CONTRACT_HPP

// Data-only description of a capability: name, argument schema, result shape,
// required permission and the OS families that serve it.
// Contracts are defined once at startup and never mutated.

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

#include "platform/os_family.hpp"

namespace capability_contract {

using json = nlohmann::json;

// OS permissions observable by script content.
enum class PermissionKind {
    Location,
    Notifications
};

// OS permission state as cached by the permission gate.
enum class PermissionState {
    NotDetermined,
    Granted,
    Denied,
    Restricted // parental controls / MDM; behaves like Denied and cannot be prompted
};

// Tag for the value carried by a successful result.
enum class ResultShape {
    Null,
    Boolean,
    Text,
    PermissionStatus, // "granted" | "denied" | "default"
    Position,
    WatchHandle,      // {watchId}, followed by Position events
    Battery,
    Network,
    Orientation
};

enum class CallKind {
    OneShot,
    Watch
};

struct CapabilityContract {
    std::string name;
    std::optional<PermissionKind> required_permission;
    // Families where the capability is served, natively or as a graceful no-op.
    // Anywhere else calls fail with CapabilityUnavailable.
    std::set<platform::OsFamily> platform_support;
    ResultShape result_shape = ResultShape::Null;
    CallKind call_kind = CallKind::OneShot;
    // Waits on the user (permission dialog, share sheet): no call timeout.
    bool interactive = false;
    json argument_schema; // JSON Schema subset, see argument_schema.hpp
};

const char *permission_name(PermissionKind kind);
const char *permission_state_name(PermissionState state);
const char *result_shape_name(ResultShape shape);

// Web-facing permission string: "granted", "denied" (Denied, Restricted) or "default".
std::string web_permission_string(PermissionState state);

bool is_supported_on(const CapabilityContract &contract, platform::OsFamily family);

} // namespace capability_contract

#endif // CAPBRIDGE_CAPABILITY_CONTRACT_HPP
