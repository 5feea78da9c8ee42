#ifndef CAPBRIDGE_SCRIPT_FACADE_HPP
#define CAPBRIDGE_SCRIPT_FACADE_HPP

// Script facade: the JavaScript installed into every content load.
// It defines window.__capbridge (call/resolve/event), polyfills the web APIs
// backed by the capabilities of the bridge instance, and forwards console output.
// Calls leave through window[<binding name>](jsonString); the host answers by
// evaluating the delivery expressions below.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace script_facade {

using json = nlohmann::json;

struct FacadeOptions {
    std::string binding_name = "__capbridgeCall";
    // Capability names served by the bridge instance. Others are not polyfilled.
    std::vector<std::string> capabilities;
    bool forward_console = true;
};

// Complete facade script. Installing it twice in one document is a no-op.
std::string build_facade_script(const FacadeOptions &options);

// Expression handing an encoded result message to the facade.
std::string build_result_delivery(const json &result_message);

// Expression handing an encoded event message to the facade.
std::string build_event_delivery(const json &event_message);

} // namespace script_facade

#endif // CAPBRIDGE_SCRIPT_FACADE_HPP
