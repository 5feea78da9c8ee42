#include "bridge/bridge_instance.hpp"
#include "capabilities/capability_table.hpp"
#include "facade/script_facade.hpp"
#include "utils/log_sink.hpp"
#include "utils/utf8_sanitize.hpp"

#include <atomic>
#include <chrono>

namespace bridge_instance {

static std::atomic<uint64_t> next_bridge_id{1};

static log_sink::LogLevel console_level_to_log_level(const std::string &level) {
    if (level == "error") {
        return log_sink::LogLevel::Error;
    }
    if (level == "warn") {
        return log_sink::LogLevel::Warning;
    }
    return log_sink::LogLevel::Info;
}

BridgeInstance::BridgeInstance(std::shared_ptr<platform::PlatformAdapter> adapter,
                               std::shared_ptr<permission_gate::PermissionGate> gate,
                               const bridge_config::BridgeConfig &config,
                               OutboundChannel channel)
    : id_(next_bridge_id.fetch_add(1)),
      binding_name_(config.binding_name) {
    subscriptions_ = std::make_shared<subscription_manager::SubscriptionManager>(channel.deliver_event, id_);

    capability_table::CapabilityContext context;
    context.adapter = adapter;
    context.gate = gate;
    context.subscriptions = subscriptions_;
    registry_ = capability_table::build_registry(adapter->os_family(), context);

    call_dispatcher::DispatcherOptions options;
    options.call_timeout = std::chrono::milliseconds(config.call_timeout_milliseconds);
    options.bridge_id = id_;
    dispatcher_ = std::make_shared<call_dispatcher::CallDispatcher>(registry_, gate, channel.deliver_result, options);

    log_sink::info("bridge " + std::to_string(id_) + " created on " + platform::os_family_name(adapter->os_family()) +
                   " with " + std::to_string(registry_->available_names().size()) + " available capabilities");
}

BridgeInstance::~BridgeInstance() {
    dispose();
}

uint64_t BridgeInstance::id() const {
    return id_;
}

void BridgeInstance::handle_call(const call_dispatcher::CallRequest &request) {
    log_sink::debug("bridge " + std::to_string(id_) + " call " + std::to_string(request.correlation_id) + " " +
                    request.capability);
    dispatcher_->dispatch(request);
}

void BridgeInstance::handle_console(const std::string &level, const std::string &text) {
    log_sink::log(console_level_to_log_level(level), "console: " + utf8_sanitize::sanitize(text));
}

void BridgeInstance::dispose() {
    if (dispatcher_->is_disposed()) {
        return;
    }
    // Calls first, so a watchPosition still waiting on a prompt cannot start
    // a subscription after the table is closed.
    dispatcher_->dispose();
    subscriptions_->dispose_all();
    log_sink::info("bridge " + std::to_string(id_) + " disposed");
}

bool BridgeInstance::is_disposed() const {
    return dispatcher_->is_disposed();
}

std::string BridgeInstance::facade_script() const {
    script_facade::FacadeOptions options;
    options.binding_name = binding_name_;
    options.capabilities = registry_->available_names();
    return script_facade::build_facade_script(options);
}

const capability_registry::CapabilityRegistry &BridgeInstance::registry() const {
    return *registry_;
}

subscription_manager::SubscriptionManager &BridgeInstance::subscriptions() {
    return *subscriptions_;
}

size_t BridgeInstance::outstanding_calls() const {
    return dispatcher_->outstanding_count();
}

} // namespace bridge_instance
