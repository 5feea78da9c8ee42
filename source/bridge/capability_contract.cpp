#include "bridge/capability_contract.hpp"

namespace capability_contract {

const char *permission_name(PermissionKind kind) {
    switch (kind) {
    case PermissionKind::Location:
        return "location";
    case PermissionKind::Notifications:
        return "notifications";
    }
    return "location";
}

const char *permission_state_name(PermissionState state) {
    switch (state) {
    case PermissionState::NotDetermined:
        return "notDetermined";
    case PermissionState::Granted:
        return "granted";
    case PermissionState::Denied:
        return "denied";
    case PermissionState::Restricted:
        return "restricted";
    }
    return "notDetermined";
}

const char *result_shape_name(ResultShape shape) {
    switch (shape) {
    case ResultShape::Null:
        return "null";
    case ResultShape::Boolean:
        return "boolean";
    case ResultShape::Text:
        return "text";
    case ResultShape::PermissionStatus:
        return "permissionStatus";
    case ResultShape::Position:
        return "position";
    case ResultShape::WatchHandle:
        return "watchHandle";
    case ResultShape::Battery:
        return "battery";
    case ResultShape::Network:
        return "network";
    case ResultShape::Orientation:
        return "orientation";
    }
    return "null";
}

std::string web_permission_string(PermissionState state) {
    switch (state) {
    case PermissionState::Granted:
        return "granted";
    case PermissionState::Denied:
    case PermissionState::Restricted:
        return "denied";
    case PermissionState::NotDetermined:
        return "default";
    }
    return "default";
}

bool is_supported_on(const CapabilityContract &contract, platform::OsFamily family) {
    return contract.platform_support.count(family) > 0;
}

} // namespace capability_contract
