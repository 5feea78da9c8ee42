#ifndef CAPBRIDGE_BRIDGE_INSTANCE_HPP
#define CAPBRIDGE_BRIDGE_INSTANCE_HPP

// One bridge instance per content surface (tab, or one load of it).
// Owns the capability registry binding, the subscription table and the
// dispatcher of that surface; shares the process-wide permission gate.
// A navigation or tab closure disposes the instance and, for a navigation,
// the host builds a fresh one for the new document.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "bridge/call_dispatcher.hpp"
#include "bridge/capability_registry.hpp"
#include "bridge/permission_gate.hpp"
#include "bridge/subscription_manager.hpp"
#include "platform/platform_adapter.hpp"
#include "utils/bridge_config.hpp"

namespace bridge_instance {

// Where results and events leave the bridge. Both may be called from any
// thread; the host serialises them onto its transport.
struct OutboundChannel {
    std::function<void(const call_dispatcher::CallResult &result)> deliver_result;
    std::function<void(const subscription_manager::SubscriptionEvent &event)> deliver_event;
};

class BridgeInstance {
public:
    BridgeInstance(std::shared_ptr<platform::PlatformAdapter> adapter,
                   std::shared_ptr<permission_gate::PermissionGate> gate,
                   const bridge_config::BridgeConfig &config,
                   OutboundChannel channel);
    ~BridgeInstance();

    BridgeInstance(const BridgeInstance &) = delete;
    BridgeInstance &operator=(const BridgeInstance &) = delete;

    // Process-wide unique, monotonic.
    uint64_t id() const;

    void handle_call(const call_dispatcher::CallRequest &request);

    // Console output forwarded by the facade. level is the console method name.
    void handle_console(const std::string &level, const std::string &text);

    // Teardown: outstanding calls resolve with BridgeDisposed, every subscription
    // is cancelled before this returns. Safe to call more than once.
    void dispose();
    bool is_disposed() const;

    // Facade script for this instance's capability set.
    std::string facade_script() const;

    const capability_registry::CapabilityRegistry &registry() const;
    subscription_manager::SubscriptionManager &subscriptions();
    size_t outstanding_calls() const;

private:
    uint64_t id_;
    std::string binding_name_;
    std::shared_ptr<subscription_manager::SubscriptionManager> subscriptions_;
    std::shared_ptr<const capability_registry::CapabilityRegistry> registry_;
    std::shared_ptr<call_dispatcher::CallDispatcher> dispatcher_;
};

} // namespace bridge_instance

#endif // CAPBRIDGE_BRIDGE_INSTANCE_HPP
