#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

namespace cap_screen_orientation {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;
    // Desktop windows do not rotate: lock/unlock only exist on phones and tablets.
    const std::set<platform::OsFamily> mobile = {platform::OsFamily::Android, platform::OsFamily::Ios};

    CapabilityBinding lock_binding;
    lock_binding.contract.name = "screenOrientation.lock";
    lock_binding.contract.platform_support = mobile;
    lock_binding.contract.result_shape = capability_contract::ResultShape::Boolean;
    lock_binding.contract.argument_schema = capability_table::make_object_schema(
        {{"orientation",
          {{"type", "string"},
           {"enum", {"any", "natural", "portrait", "portrait-primary", "portrait-secondary", "landscape",
                     "landscape-primary", "landscape-secondary"}}}}},
        {"orientation"});
    lock_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        std::string orientation = arguments["orientation"].get<std::string>();
        log_sink::debug("screenOrientation.lock invoked: " + orientation);
        adapter->lock_orientation(orientation, capability_table::success_as(true, done));
    };
    bindings.push_back(std::move(lock_binding));

    CapabilityBinding unlock_binding;
    unlock_binding.contract.name = "screenOrientation.unlock";
    unlock_binding.contract.platform_support = mobile;
    unlock_binding.contract.result_shape = capability_contract::ResultShape::Boolean;
    unlock_binding.contract.argument_schema = capability_table::make_object_schema(json::object());
    unlock_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        adapter->unlock_orientation(capability_table::success_as(true, done));
    };
    bindings.push_back(std::move(unlock_binding));

    CapabilityBinding get_binding;
    get_binding.contract.name = "screenOrientation.get";
    get_binding.contract.platform_support = platform::all_os_families();
    get_binding.contract.result_shape = capability_contract::ResultShape::Orientation;
    get_binding.contract.argument_schema = capability_table::make_object_schema(json::object());
    get_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        adapter->get_orientation(std::move(done));
    };
    bindings.push_back(std::move(get_binding));
}

} // namespace cap_screen_orientation
