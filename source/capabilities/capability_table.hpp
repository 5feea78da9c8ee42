#ifndef CAPBRIDGE_CAPABILITY_TABLE_HPP
#define CAPBRIDGE_CAPABILITY_TABLE_HPP

// Static capability table.
// Each cap_*.cpp file contributes the contracts and handlers of one capability
// family; build_registry() assembles them into the registry of one bridge instance.

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "bridge/capability_contract.hpp"
#include "bridge/capability_registry.hpp"
#include "bridge/permission_gate.hpp"
#include "bridge/subscription_manager.hpp"
#include "platform/platform_adapter.hpp"

namespace capability_table {

using json = nlohmann::json;

// What handlers close over. Shared pointers: a handler may still be running
// on an OS thread while its bridge instance tears down.
struct CapabilityContext {
    std::shared_ptr<platform::PlatformAdapter> adapter;
    std::shared_ptr<permission_gate::PermissionGate> gate;
    std::shared_ptr<subscription_manager::SubscriptionManager> subscriptions;
};

struct CapabilityBinding {
    capability_contract::CapabilityContract contract;
    capability_registry::CapabilityHandler handler;
};

// Every binding of the fixed capability set.
std::vector<CapabilityBinding> build_bindings(const CapabilityContext &context);

// Registry for the given OS. Throws DuplicateCapabilityError on a malformed table.
std::shared_ptr<const capability_registry::CapabilityRegistry> build_registry(platform::OsFamily running_os,
                                                                              const CapabilityContext &context);

// {"type":"object","properties":...,"required":[...]}
json make_object_schema(const json &properties, const std::vector<std::string> &required = {});

// Wrap done so a successful outcome is replaced by value (e.g. true for fire-and-forget calls).
platform::OutcomeCallback success_as(json value, platform::OutcomeCallback done);

// String property or fallback when absent.
std::string string_argument(const json &arguments, const std::string &name, const std::string &fallback = "");

} // namespace capability_table

#endif // CAPBRIDGE_CAPABILITY_TABLE_HPP
