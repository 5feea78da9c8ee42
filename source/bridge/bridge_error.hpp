#ifndef CAPBRIDGE_BRIDGE_ERROR_HPP
#define CAPBRIDGE_BRIDGE_ERROR_HPP

// Error taxonomy shared by adapters, the dispatcher and the wire format.

namespace bridge_error {

enum class ErrorKind {
    UnknownCapability,     // caller bug: name not in the registry
    InvalidArguments,      // caller bug: arguments fail the contract's schema
    PermissionDenied,      // terminal, never retried by the bridge
    CapabilityUnavailable, // platform lacks the feature, terminal
    OperationFailed,       // OS call raised an error, caller may retry
    Timeout,               // caller may retry
    BridgeDisposed         // owning bridge instance is tearing down
};

// Wire name of an error kind, e.g. "PermissionDenied".
const char *kind_name(ErrorKind kind);

// True for kinds the caller may reasonably retry (OperationFailed, Timeout).
bool is_retryable(ErrorKind kind);

} // namespace bridge_error

#endif // CAPBRIDGE_BRIDGE_ERROR_HPP
