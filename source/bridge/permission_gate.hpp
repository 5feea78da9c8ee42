#ifndef CAPBRIDGE_PERMISSION_GATE_HPP
#define CAPBRIDGE_PERMISSION_GATE_HPP

// Permission gate: process-wide cache of OS permission state, shared by all
// bridge instances, with prompt coalescing.
//
// States per permission kind:
//   notDetermined -> granted | denied | restricted   (first OS query or a prompt)
//   denied        -> granted                         (only through request(), i.e. the OS dialog)
//
// Gated calls go through require(), which never prompts from denied.
// request() is the explicit ask (notification.requestPermission).
//   granted       -> denied | restricted             (external revocation, seen by refresh())
//
// All state lives behind one mutex and is written only here. Concurrent
// request() calls for the same kind share a single OS prompt and all observe
// its answer. Must be owned by a std::shared_ptr (prompts keep it alive).

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "bridge/capability_contract.hpp"
#include "platform/platform_adapter.hpp"

namespace permission_gate {

using capability_contract::PermissionKind;
using capability_contract::PermissionState;

using StateCallback = std::function<void(PermissionState state)>;

class PermissionGate : public std::enable_shared_from_this<PermissionGate> {
public:
    explicit PermissionGate(std::shared_ptr<platform::PlatformAdapter> adapter);

    // Cached state. Never prompts or blocks; the first call for a kind seeds
    // the cache from the OS.
    PermissionState check(PermissionKind kind) const;

    // Poll the OS and apply external revocation (granted -> denied/restricted).
    // Returns the resulting cached state. No-op while a prompt is showing.
    PermissionState refresh(PermissionKind kind);

    // Resolve the state, prompting the OS when it is notDetermined or denied.
    // granted and restricted answer immediately. on_resolved may run on the
    // calling thread or on the OS thread that answers the prompt.
    // A dismissed prompt resolves as denied.
    void request(PermissionKind kind, StateCallback on_resolved);

    // Gate for a call that needs kind: refresh from the OS and prompt only when
    // the state is notDetermined, in one step. A call arriving while a prompt
    // is showing waits for that prompt's answer. denied, granted and restricted
    // answer immediately without prompting.
    void require(PermissionKind kind, StateCallback on_resolved);

    // True while an OS prompt for kind is outstanding.
    bool is_prompting(PermissionKind kind) const;

private:
    struct Slot {
        PermissionState state = PermissionState::NotDetermined;
        bool seeded = false;
        bool prompt_in_flight = false;
        std::vector<StateCallback> waiters;
    };

    Slot &slot_locked(PermissionKind kind) const;
    PermissionState poll_locked(PermissionKind kind, Slot &slot);
    // Caller has set prompt_in_flight and queued its waiter.
    void start_prompt(PermissionKind kind);
    void finish_prompt(PermissionKind kind, PermissionState answer);

    std::shared_ptr<platform::PlatformAdapter> adapter_;
    mutable std::mutex mutex_;
    mutable std::map<PermissionKind, Slot> slots_;
};

} // namespace permission_gate

#endif // CAPBRIDGE_PERMISSION_GATE_HPP
