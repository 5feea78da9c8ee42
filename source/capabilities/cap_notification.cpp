#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using capability_contract::PermissionKind;
using capability_contract::PermissionState;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

// Explicit request: the only path from denied back to granted.
static void handle_request_permission(const std::shared_ptr<permission_gate::PermissionGate> &gate,
                                      platform::OutcomeCallback done) {
    gate->request(PermissionKind::Notifications, [done](PermissionState state) {
        done(platform::make_success(capability_contract::web_permission_string(state)));
    });
}

static void handle_show_notification(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                                     const json &arguments, platform::OutcomeCallback done) {
    platform::NotificationRequest request;
    request.title = capability_table::string_argument(arguments, "title", "Notification");
    request.body = capability_table::string_argument(arguments, "body");
    request.icon = capability_table::string_argument(arguments, "icon");
    request.tag = capability_table::string_argument(arguments, "tag");

    log_sink::debug("notification.show invoked: " + request.title);
    adapter->show_notification(request, capability_table::success_as(true, done));
}

namespace cap_notification {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;
    std::shared_ptr<permission_gate::PermissionGate> gate = context.gate;

    CapabilityBinding request_binding;
    request_binding.contract.name = "notification.requestPermission";
    request_binding.contract.platform_support = platform::all_os_families();
    request_binding.contract.result_shape = capability_contract::ResultShape::PermissionStatus;
    request_binding.contract.interactive = true;
    request_binding.contract.argument_schema = capability_table::make_object_schema(json::object());
    request_binding.handler = [gate](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        handle_request_permission(gate, std::move(done));
    };
    bindings.push_back(std::move(request_binding));

    CapabilityBinding show_binding;
    show_binding.contract.name = "notification.show";
    show_binding.contract.required_permission = PermissionKind::Notifications;
    show_binding.contract.platform_support = platform::all_os_families();
    show_binding.contract.result_shape = capability_contract::ResultShape::Boolean;
    show_binding.contract.argument_schema = capability_table::make_object_schema(
        {
            {"title", {{"type", "string"}}},
            {"body", {{"type", "string"}}},
            {"icon", {{"type", "string"}}},
            {"tag", {{"type", "string"}}},
        },
        {"title"});
    show_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        handle_show_notification(adapter, arguments, std::move(done));
    };
    bindings.push_back(std::move(show_binding));
}

} // namespace cap_notification
