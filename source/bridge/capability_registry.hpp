#ifndef CAPBRIDGE_CAPABILITY_REGISTRY_HPP
#define CAPBRIDGE_CAPABILITY_REGISTRY_HPP

// Capability registry: capability name -> contract + handler.
// Populated once while a bridge instance is constructed, then only read
// (the bridge holds it as const), so lookups need no locking.

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge/capability_contract.hpp"
#include "platform/os_family.hpp"
#include "platform/platform_adapter.hpp"

namespace capability_registry {

using json = nlohmann::json;

// A capability handler: receives validated arguments, reports exactly one
// outcome through done (extra reports are dropped by the dispatcher).
using CapabilityHandler = std::function<void(const json &arguments, platform::OutcomeCallback done)>;

struct RegistryEntry {
    capability_contract::CapabilityContract contract;
    CapabilityHandler handler;
    // Decided at registration: false when the running OS is not in
    // contract.platform_support. Unavailable entries carry no handler.
    bool available = false;
};

class DuplicateCapabilityError : public std::logic_error {
public:
    explicit DuplicateCapabilityError(const std::string &name);
};

class CapabilityRegistry {
public:
    explicit CapabilityRegistry(platform::OsFamily running_os);

    // Add a capability. Throws DuplicateCapabilityError if the name is taken.
    void register_capability(const capability_contract::CapabilityContract &contract, CapabilityHandler handler);

    // Look up by name. Returns nullptr for an unknown capability.
    const RegistryEntry *resolve(const std::string &name) const;

    // Names of entries served on the running OS, sorted.
    std::vector<std::string> available_names() const;

    size_t size() const;
    platform::OsFamily running_os() const;

private:
    platform::OsFamily running_os_;
    std::map<std::string, RegistryEntry> entries_;
};

} // namespace capability_registry

#endif // CAPBRIDGE_CAPABILITY_REGISTRY_HPP
