#ifndef CAPBRIDGE_CDP_RENDERER_HPP
#define CAPBRIDGE_CDP_RENDERER_HPP

// Embedded renderer host over the Chrome DevTools Protocol.
// Manages the WebSocket connection to Chrome (libwebsockets), attaches to one
// page target and wires it to a bridge instance:
//   Runtime.addBinding                      script -> bridge (call / console messages)
//   Page.addScriptToEvaluateOnNewDocument   facade installed on every content load
//   Runtime.evaluate                        bridge -> script (results and events)
// A main-frame navigation replaces the bridge instance; closing the page ends the host.
//
// Everything except queue_delivery() runs on the thread that calls run().

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "bridge/permission_gate.hpp"
#include "platform/platform_adapter.hpp"
#include "utils/bridge_config.hpp"

namespace cdp_renderer {

using json = nlohmann::json;

enum class EventKind {
    BindingCalled,      // payload holds the message text
    MainFrameNavigated, // url holds the new document URL
    TargetGone,
    Ignored
};

struct ClassifiedEvent {
    EventKind kind = EventKind::Ignored;
    std::string payload;
    std::string url;
};

// Classify one CDP event (a message without "id") for the attached page.
// Events of other sessions, targets or bindings are Ignored.
ClassifiedEvent classify_event(const json &message, const std::string &binding_name,
                               const std::string &session_id, const std::string &target_id);

struct OpenResult {
    bool success = false;
    std::string error_detail;
};

// Connect to Chrome (reusing one already running on the profile, otherwise
// launching it), attach to a page target and register the binding.
OpenResult open_renderer(const bridge_config::BridgeConfig &config);

// Install the facade for future documents and evaluate it in the current one.
bool install_facade(const std::string &script);

bool navigate(const std::string &url);

// Queue a script expression for delivery on behalf of a bridge generation.
// Safe from any thread; wakes the service loop.
void queue_delivery(uint64_t generation, const std::string &expression);

// Send queued deliveries of current_generation; drop those of replaced bridges.
void flush_deliveries(uint64_t current_generation);

// Close the WebSocket and stop Chrome if this process launched it.
void disconnect();

// Open the renderer and serve it until the page closes or stop_requested.
// Returns the process exit code.
int run(const bridge_config::BridgeConfig &config,
        std::shared_ptr<platform::PlatformAdapter> adapter,
        std::shared_ptr<permission_gate::PermissionGate> gate,
        const std::atomic<bool> &stop_requested);

} // namespace cdp_renderer

#endif // CAPBRIDGE_CDP_RENDERER_HPP
