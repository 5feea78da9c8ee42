#include "bridge/bridge_error.hpp"

namespace bridge_error {

const char *kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnknownCapability:
        return "UnknownCapability";
    case ErrorKind::InvalidArguments:
        return "InvalidArguments";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::CapabilityUnavailable:
        return "CapabilityUnavailable";
    case ErrorKind::OperationFailed:
        return "OperationFailed";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::BridgeDisposed:
        return "BridgeDisposed";
    }
    return "OperationFailed";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::OperationFailed || kind == ErrorKind::Timeout;
}

} // namespace bridge_error
