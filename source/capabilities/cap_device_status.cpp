#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

namespace cap_device_status {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;

    CapabilityBinding battery_binding;
    battery_binding.contract.name = "battery.get";
    battery_binding.contract.platform_support = platform::all_os_families();
    battery_binding.contract.result_shape = capability_contract::ResultShape::Battery;
    battery_binding.contract.argument_schema = capability_table::make_object_schema(json::object());
    battery_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        log_sink::debug("battery.get invoked");
        adapter->get_battery(std::move(done));
    };
    bindings.push_back(std::move(battery_binding));

    CapabilityBinding network_binding;
    network_binding.contract.name = "network.get";
    network_binding.contract.platform_support = platform::all_os_families();
    network_binding.contract.result_shape = capability_contract::ResultShape::Network;
    network_binding.contract.argument_schema = capability_table::make_object_schema(json::object());
    network_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        log_sink::debug("network.get invoked");
        adapter->get_network(std::move(done));
    };
    bindings.push_back(std::move(network_binding));
}

} // namespace cap_device_status
