#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

// Longest single pulse or pause accepted, in milliseconds.
static constexpr int MAX_PATTERN_ENTRY_MILLISECONDS = 10000;

static void handle_vibrate(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                           const json &arguments, platform::OutcomeCallback done) {
    const json &pattern_argument = arguments["pattern"];
    std::vector<int> pattern;
    if (pattern_argument.is_array()) {
        for (const auto &entry : pattern_argument) {
            pattern.push_back(static_cast<int>(entry.get<double>()));
        }
    } else {
        pattern.push_back(static_cast<int>(pattern_argument.get<double>()));
    }

    log_sink::debug("vibrate invoked with " + std::to_string(pattern.size()) + " step(s)");
    adapter->vibrate(pattern, capability_table::success_as(true, done));
}

namespace cap_vibrate {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;

    json step_schema = {{"type", "number"}, {"minimum", 0}, {"maximum", MAX_PATTERN_ENTRY_MILLISECONDS}};

    CapabilityBinding binding;
    binding.contract.name = "vibrate";
    // Desktop adapters answer with a no-op success.
    binding.contract.platform_support = platform::all_os_families();
    binding.contract.result_shape = capability_contract::ResultShape::Boolean;
    binding.contract.argument_schema = capability_table::make_object_schema(
        {{"pattern", {{"type", json::array({"number", "array"})}, {"minimum", 0},
                      {"maximum", MAX_PATTERN_ENTRY_MILLISECONDS}, {"items", step_schema}}}},
        {"pattern"});
    binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        handle_vibrate(adapter, arguments, std::move(done));
    };
    bindings.push_back(std::move(binding));
}

} // namespace cap_vibrate
