#include "bridge/capability_registry.hpp"

namespace capability_registry {

DuplicateCapabilityError::DuplicateCapabilityError(const std::string &name)
    : std::logic_error("DuplicateCapability: " + name) {}

CapabilityRegistry::CapabilityRegistry(platform::OsFamily running_os) : running_os_(running_os) {}

void CapabilityRegistry::register_capability(const capability_contract::CapabilityContract &contract,
                                             CapabilityHandler handler) {
    if (entries_.count(contract.name) > 0) {
        throw DuplicateCapabilityError(contract.name);
    }

    RegistryEntry entry;
    entry.contract = contract;
    entry.available = capability_contract::is_supported_on(contract, running_os_);
    if (entry.available) {
        entry.handler = std::move(handler);
    }
    entries_.emplace(contract.name, std::move(entry));
}

const RegistryEntry *CapabilityRegistry::resolve(const std::string &name) const {
    auto iterator = entries_.find(name);
    if (iterator == entries_.end()) {
        return nullptr;
    }
    return &iterator->second;
}

std::vector<std::string> CapabilityRegistry::available_names() const {
    std::vector<std::string> names;
    for (const auto &pair : entries_) {
        if (pair.second.available) {
            names.push_back(pair.first);
        }
    }
    return names;
}

size_t CapabilityRegistry::size() const {
    return entries_.size();
}

platform::OsFamily CapabilityRegistry::running_os() const {
    return running_os_;
}

} // namespace capability_registry
