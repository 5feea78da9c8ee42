#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>

using json = nlohmann::json;
using capability_contract::PermissionKind;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

// Durations are stored as int milliseconds.
static constexpr int MAX_DURATION_MILLISECONDS = std::numeric_limits<int>::max();
// Largest integer a script number holds exactly.
static constexpr uint64_t MAX_WATCH_ID = 9007199254740991ULL;

static json position_options_schema() {
    return capability_table::make_object_schema({
        {"enableHighAccuracy", {{"type", "boolean"}}},
        {"timeout", {{"type", "number"}, {"minimum", 0}, {"maximum", MAX_DURATION_MILLISECONDS}}},
        {"maximumAge", {{"type", "number"}, {"minimum", 0}, {"maximum", MAX_DURATION_MILLISECONDS}}},
    });
}

static platform::PositionOptions parse_position_options(const json &arguments) {
    platform::PositionOptions options;
    if (arguments.contains("enableHighAccuracy")) {
        options.enable_high_accuracy = arguments["enableHighAccuracy"].get<bool>();
    }
    if (arguments.contains("timeout")) {
        options.timeout_milliseconds = static_cast<int>(arguments["timeout"].get<double>());
    }
    if (arguments.contains("maximumAge")) {
        options.maximum_age_milliseconds = static_cast<int>(arguments["maximumAge"].get<double>());
    }
    return options;
}

static void handle_get_current_position(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                                        const json &arguments, platform::OutcomeCallback done) {
    log_sink::debug("geolocation.getCurrentPosition invoked");
    adapter->get_current_position(parse_position_options(arguments), std::move(done));
}

static void handle_watch_position(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                                  const std::shared_ptr<subscription_manager::SubscriptionManager> &subscriptions,
                                  const json &arguments, platform::OutcomeCallback done) {
    platform::PositionOptions options = parse_position_options(arguments);
    std::optional<subscription_manager::SubscriptionId> watch_id = subscriptions->start(
        "geolocation.watchPosition", [adapter, options](platform::OutcomeCallback on_event) {
            return adapter->watch_position(options, std::move(on_event));
        });

    if (!watch_id) {
        done(platform::make_failure(bridge_error::ErrorKind::BridgeDisposed,
                                    "bridge instance is tearing down, watch not started"));
        return;
    }

    json value;
    value["watchId"] = *watch_id;
    done(platform::make_success(value));
}

static void handle_clear_watch(const std::shared_ptr<subscription_manager::SubscriptionManager> &subscriptions,
                               const json &arguments, platform::OutcomeCallback done) {
    subscriptions->cancel(arguments["watchId"].get<subscription_manager::SubscriptionId>());
    done(platform::make_success(nullptr));
}

namespace cap_geolocation {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;
    std::shared_ptr<subscription_manager::SubscriptionManager> subscriptions = context.subscriptions;

    CapabilityBinding current_binding;
    current_binding.contract.name = "geolocation.getCurrentPosition";
    current_binding.contract.required_permission = PermissionKind::Location;
    current_binding.contract.platform_support = platform::all_os_families();
    current_binding.contract.result_shape = capability_contract::ResultShape::Position;
    current_binding.contract.argument_schema = position_options_schema();
    current_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        handle_get_current_position(adapter, arguments, std::move(done));
    };
    bindings.push_back(std::move(current_binding));

    CapabilityBinding watch_binding;
    watch_binding.contract.name = "geolocation.watchPosition";
    watch_binding.contract.required_permission = PermissionKind::Location;
    watch_binding.contract.platform_support = platform::all_os_families();
    watch_binding.contract.result_shape = capability_contract::ResultShape::WatchHandle;
    watch_binding.contract.call_kind = capability_contract::CallKind::Watch;
    watch_binding.contract.argument_schema = position_options_schema();
    watch_binding.handler = [adapter, subscriptions](const json &arguments, platform::OutcomeCallback done) {
        handle_watch_position(adapter, subscriptions, arguments, std::move(done));
    };
    bindings.push_back(std::move(watch_binding));

    // Not gated: clearing a watch must work even after the permission is revoked.
    CapabilityBinding clear_binding;
    clear_binding.contract.name = "geolocation.clearWatch";
    clear_binding.contract.platform_support = platform::all_os_families();
    clear_binding.contract.result_shape = capability_contract::ResultShape::Null;
    clear_binding.contract.argument_schema = capability_table::make_object_schema(
        {{"watchId", {{"type", "integer"}, {"minimum", 0}, {"maximum", MAX_WATCH_ID}}}}, {"watchId"});
    clear_binding.handler = [subscriptions](const json &arguments, platform::OutcomeCallback done) {
        handle_clear_watch(subscriptions, arguments, std::move(done));
    };
    bindings.push_back(std::move(clear_binding));
}

} // namespace cap_geolocation
