#include "capabilities/capability_table.hpp"
#include "utils/log_sink.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using capability_table::CapabilityBinding;
using capability_table::CapabilityContext;

static void handle_share(const std::shared_ptr<platform::PlatformAdapter> &adapter,
                         const json &arguments, platform::OutcomeCallback done) {
    platform::ShareRequest request;
    request.title = capability_table::string_argument(arguments, "title");
    request.text = capability_table::string_argument(arguments, "text");
    request.url = capability_table::string_argument(arguments, "url");

    if (platform::build_share_text(request).empty()) {
        done(platform::make_failure(bridge_error::ErrorKind::InvalidArguments,
                                    "share requires a non-empty title, text or url"));
        return;
    }

    log_sink::debug("share invoked");
    adapter->share(request, capability_table::success_as(true, done));
}

namespace cap_share {

void append_bindings(const CapabilityContext &context, std::vector<CapabilityBinding> &bindings) {
    std::shared_ptr<platform::PlatformAdapter> adapter = context.adapter;

    CapabilityBinding binding;
    binding.contract.name = "share";
    // No share sheet on Linux desktops.
    binding.contract.platform_support = {platform::OsFamily::Android, platform::OsFamily::Ios,
                                         platform::OsFamily::Macos, platform::OsFamily::Windows};
    binding.contract.result_shape = capability_contract::ResultShape::Boolean;
    binding.contract.interactive = true;
    json schema = capability_table::make_object_schema({
        {"title", {{"type", "string"}}},
        {"text", {{"type", "string"}}},
        {"url", {{"type", "string"}}},
    });
    schema["minProperties"] = 1;
    binding.contract.argument_schema = schema;
    binding.handler = [adapter](const json &arguments, platform::OutcomeCallback done) {
        handle_share(adapter, arguments, std::move(done));
    };
    bindings.push_back(std::move(binding));
}

} // namespace cap_share
