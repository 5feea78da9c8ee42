#include "capabilities/capability_table.hpp"

// Each cap_*.cpp defines its own namespace with an append_bindings() function.

namespace cap_clipboard { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }
namespace cap_share { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }
namespace cap_notification { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }
namespace cap_geolocation { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }
namespace cap_vibrate { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }
namespace cap_device_status { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }
namespace cap_screen_orientation { void append_bindings(const capability_table::CapabilityContext &context, std::vector<capability_table::CapabilityBinding> &bindings); }

namespace capability_table {

std::vector<CapabilityBinding> build_bindings(const CapabilityContext &context) {
    std::vector<CapabilityBinding> bindings;
    cap_clipboard::append_bindings(context, bindings);
    cap_share::append_bindings(context, bindings);
    cap_notification::append_bindings(context, bindings);
    cap_geolocation::append_bindings(context, bindings);
    cap_vibrate::append_bindings(context, bindings);
    cap_device_status::append_bindings(context, bindings);
    cap_screen_orientation::append_bindings(context, bindings);
    return bindings;
}

std::shared_ptr<const capability_registry::CapabilityRegistry> build_registry(platform::OsFamily running_os,
                                                                              const CapabilityContext &context) {
    auto registry = std::make_shared<capability_registry::CapabilityRegistry>(running_os);
    for (auto &binding : build_bindings(context)) {
        registry->register_capability(binding.contract, std::move(binding.handler));
    }
    return registry;
}

json make_object_schema(const json &properties, const std::vector<std::string> &required) {
    json schema;
    schema["type"] = "object";
    schema["properties"] = properties.is_null() ? json::object() : properties;
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

platform::OutcomeCallback success_as(json value, platform::OutcomeCallback done) {
    return [value, done](const platform::AdapterOutcome &outcome) {
        if (outcome.success) {
            done(platform::make_success(value));
        } else {
            done(outcome);
        }
    };
}

std::string string_argument(const json &arguments, const std::string &name, const std::string &fallback) {
    if (arguments.is_object() && arguments.contains(name) && arguments[name].is_string()) {
        return arguments[name].get<std::string>();
    }
    return fallback;
}

} // namespace capability_table
