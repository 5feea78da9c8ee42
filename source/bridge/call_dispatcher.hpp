#ifndef CAPBRIDGE_CALL_DISPATCHER_HPP
#define CAPBRIDGE_CALL_DISPATCHER_HPP

// Call dispatcher: turns each inbound CallRequest into exactly one CallResult.
//
// Order of checks (cheap failures first, nothing reaches the OS until all pass):
//   disposed -> BridgeDisposed
//   unknown name -> UnknownCapability
//   schema mismatch -> InvalidArguments
//   not served on this OS -> CapabilityUnavailable
//   correlation id already outstanding -> InvalidArguments
//   gated and denied/restricted -> PermissionDenied (notDetermined prompts first)
//   then the handler runs under the call timeout (interactive contracts excepted).
//
// The first outcome for a correlation id wins. Late or duplicate completions,
// including a real result arriving after Timeout, are dropped. Handler
// exceptions become OperationFailed. Must be owned by a std::shared_ptr.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "bridge/bridge_error.hpp"
#include "bridge/capability_registry.hpp"
#include "bridge/deadline_timer.hpp"
#include "bridge/permission_gate.hpp"
#include "platform/platform_adapter.hpp"

namespace call_dispatcher {

using json = nlohmann::json;

struct CallRequest {
    uint64_t correlation_id = 0;
    std::string capability;
    json arguments = json::object();
};

struct CallResult {
    uint64_t correlation_id = 0;
    bool success = false;
    json value;
    bridge_error::ErrorKind error_kind = bridge_error::ErrorKind::OperationFailed;
    std::string error_message;
};

// Receives every CallResult. Called from the dispatching thread, OS callback
// threads or the timer thread, never while dispatcher locks are held.
using ResultSink = std::function<void(const CallResult &result)>;

struct DispatcherOptions {
    std::chrono::milliseconds call_timeout{10000};
    uint64_t bridge_id = 0; // for log lines
};

class CallDispatcher : public std::enable_shared_from_this<CallDispatcher> {
public:
    CallDispatcher(std::shared_ptr<const capability_registry::CapabilityRegistry> registry,
                   std::shared_ptr<permission_gate::PermissionGate> gate,
                   ResultSink sink,
                   DispatcherOptions options = {});
    ~CallDispatcher();

    CallDispatcher(const CallDispatcher &) = delete;
    CallDispatcher &operator=(const CallDispatcher &) = delete;

    // Start handling a request. Never blocks on the OS; the result reaches the sink later
    // (or before returning, for calls that fail validation or complete synchronously).
    void dispatch(const CallRequest &request);

    // Begin teardown: outstanding calls resolve with BridgeDisposed, later
    // dispatches fail with BridgeDisposed, late completions are dropped.
    void dispose();

    bool is_disposed() const;
    size_t outstanding_count() const;

private:
    enum class Admission {
        Admitted,
        Disposed,
        DuplicateId
    };

    struct PendingCall {
        std::string capability;
        deadline_timer::DeadlineTimer::TimerId timer_id = 0;
    };

    Admission admit(uint64_t correlation_id, const std::string &capability);
    void after_permission(uint64_t correlation_id, const capability_registry::RegistryEntry *entry,
                          const json &arguments, permission_gate::PermissionState state);
    void invoke(uint64_t correlation_id, const capability_registry::RegistryEntry *entry, const json &arguments);
    void complete(uint64_t correlation_id, const platform::AdapterOutcome &outcome);
    void reject(uint64_t correlation_id, const std::string &capability, bridge_error::ErrorKind kind,
                const std::string &message);
    void deliver(const CallResult &result, const std::string &capability);

    std::shared_ptr<const capability_registry::CapabilityRegistry> registry_;
    std::shared_ptr<permission_gate::PermissionGate> gate_;
    ResultSink sink_;
    DispatcherOptions options_;
    deadline_timer::DeadlineTimer timer_;

    mutable std::mutex mutex_;
    std::map<uint64_t, PendingCall> pending_;
    bool disposed_ = false;
};

} // namespace call_dispatcher

#endif // CAPBRIDGE_CALL_DISPATCHER_HPP
