#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

static void handle_clipboard_write(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                                   const json &arguments, platform::OutcomeCallback done) {
    std::string text = utf8_sanitize::sanitize(arguments["text"].get<std::string>());
    log_sink::debug("clipboard.write invoked (" + std::to_string(text.size()) + " bytes)");
    adapter->clipboard_write(text, capability_table::success_as(true, done));
}

static void handle_clipboard_read(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                                  platform::OutcomeCallback done) {
    log_sink::debug("clipboard.read invoked");
    adapter->clipboard_read([done](const platform::AdapterOutcome &outcome) {
        if (!outcome.success) {
            done(outcome);
            return;
        }
        // An empty clipboard reads as "" like navigator.clipboard.readText().
        std::string text;
        if (outcome.value.is_string()) {
            text = utf8_sanitize::sanitize(outcome.value.get<std::string>());
        }
        done(platform::make_success(text));
    });
}

namespace cap_clipboard {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;

    CapabilityBinding write_binding;
    write_binding.contract.name = "clipboard.write";
    write_binding.contract.platform_support = platform::all_os_families();
    write_binding.contract.result_shape = capability_contract::ResultShape::Boolean;
    write_binding.contract.argument_schema = capability_table::make_object_schema(
        {{"text", {{"type", "string"}, {"description", "Text to place on the clipboard."}}}}, {"text"});
    write_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        handle_clipboard_write(adapter, arguments, std::move(done));
    };
    bindings.push_back(std::move(write_binding));

    CapabilityBinding read_binding;
    read_binding.contract.name = "clipboard.read";
    read_binding.contract.platform_support = platform::all_os_families();
    read_binding.contract.result_shape = capability_contract::ResultShape::Text;
    read_binding.contract.argument_schema = capability_table::make_object_schema(json::object());
    read_binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        (void)arguments;
        handle_clipboard_read(adapter, std::move(done));
    };
    bindings.push_back(std::move(read_binding));
}

} // namespace cap_clipboard
