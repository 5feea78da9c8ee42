#include "host/cdp/cdp_renderer.hpp"
#include "host/cdp/cdp_chrome_launch.hpp"
#include "bridge/bridge_instance.hpp"
#include "facade/script_facade.hpp"
#include "platform/system_calls.hpp"
#include "protocol/wire_protocol.hpp"
#include "utils/log_sink.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace cdp_renderer {

static const int CONNECT_TIMEOUT_MILLISECONDS = 20000;
static const int COMMAND_TIMEOUT_MILLISECONDS = 10000;
static const int SERVICE_INTERVAL_MILLISECONDS = 50;

// Module-level connection state (not a class instance; global singleton).
struct RendererState {
    bool connected = false;
    bool connection_failed = false;
    bool closed = false;
    struct lws_context *websocket_context = nullptr;
    struct lws *websocket_connection = nullptr;

    // Set when this process launched Chrome.
    int chrome_process_id = -1;

    int next_message_id = 1;
    std::string target_id;
    std::string session_id;
    std::string binding_name;

    // Responses for send_command() callers; ids not in awaited_ids are dropped.
    std::set<int> awaited_ids;
    std::map<int, json> responses;

    // Events in arrival order, drained by the run loop.
    std::deque<json> events;

    std::string receive_buffer;

    // Filled from any thread, drained by flush_deliveries().
    std::mutex delivery_mutex;
    std::deque<std::pair<uint64_t, std::string>> deliveries;
};

static RendererState global_state;

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static void handle_incoming(const json &message) {
    if (message.contains("id") && message["id"].is_number_integer()) {
        int message_id = message["id"].get<int>();
        if (global_state.awaited_ids.erase(message_id) > 0) {
            global_state.responses[message_id] = message;
        } else if (message.contains("error") || (message.contains("result") && message["result"].contains("exceptionDetails"))) {
            log_sink::debug("CDP command " + std::to_string(message_id) + " failed: " + message.dump().substr(0, 300));
        }
        return;
    }
    if (message.contains("method")) {
        global_state.events.push_back(message);
    }
}

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        global_state.connected = true;
        log_sink::debug("CDP WebSocket connected.");
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        const char *data_pointer = static_cast<const char *>(incoming_data);
        global_state.receive_buffer.append(data_pointer, incoming_length);

        if (lws_is_final_fragment(websocket_instance)) {
            try {
                json message = json::parse(global_state.receive_buffer);
                global_state.receive_buffer.clear();
                handle_incoming(message);
            } catch (const json::parse_error &parse_error) {
                log_sink::warning(std::string("Failed to parse CDP message: ") + parse_error.what() +
                                  ", buffer content: " + global_state.receive_buffer.substr(0, 200));
                global_state.receive_buffer.clear();
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        log_sink::error(std::string("CDP WebSocket connection error: ") + error_message);
        global_state.connected = false;
        global_state.connection_failed = true;
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        log_sink::info("CDP WebSocket closed.");
        global_state.connected = false;
        global_state.closed = true;
        break;

    default:
        break;
    }

    return 0;
}

static void destroy_context() {
    struct lws_context *context = nullptr;
    {
        std::lock_guard<std::mutex> lock(global_state.delivery_mutex);
        context = global_state.websocket_context;
        global_state.websocket_context = nullptr;
        global_state.deliveries.clear();
    }
    if (context != nullptr) {
        lws_context_destroy(context);
    }
    global_state.websocket_connection = nullptr;
    global_state.connected = false;
}

static bool connect(const std::string &websocket_url) {
    log_sink::debug("connect() URL=" + websocket_url);

    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.substr(0, 5) == "ws://") {
        url_without_scheme = url_without_scheme.substr(5);
    }

    // Split host:port from path.
    std::string host_and_port;
    std::string path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }

    std::string host = "127.0.0.1";
    int port = 9222;
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        host = host_and_port.substr(0, colon_position);
        try {
            port = std::stoi(host_and_port.substr(colon_position + 1));
        } catch (const std::exception &) {
            log_sink::error("Failed to parse port from WebSocket URL " + websocket_url);
            return false;
        }
    }

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        log_sink::error("Failed to create libwebsockets context.");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(global_state.delivery_mutex);
        global_state.websocket_context = context;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    global_state.connection_failed = false;
    global_state.closed = false;
    global_state.websocket_connection = lws_client_connect_via_info(&connect_info);
    if (global_state.websocket_connection == nullptr) {
        log_sink::error("Failed to initiate CDP WebSocket connection to " + websocket_url);
        destroy_context();
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!global_state.connected) {
        lws_service(context, SERVICE_INTERVAL_MILLISECONDS);

        if (global_state.connection_failed) {
            destroy_context();
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > CONNECT_TIMEOUT_MILLISECONDS) {
            log_sink::error("Timed out connecting to CDP WebSocket " + websocket_url);
            destroy_context();
            return false;
        }
    }

    return true;
}

static bool write_text(const std::string &text) {
    if (!global_state.connected || global_state.websocket_connection == nullptr) {
        return false;
    }
    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + text.size());
    memcpy(send_buffer.data() + LWS_PRE, text.data(), text.size());
    int bytes_written = lws_write(global_state.websocket_connection, send_buffer.data() + LWS_PRE,
                                  text.size(), LWS_WRITE_TEXT);
    return bytes_written >= 0;
}

static json build_command(int message_id, const std::string &method, const json &params,
                          const std::string &session_id) {
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }
    return command;
}

// Send without waiting; the response is dropped (failures are logged at debug level).
static bool post_command(const std::string &method, const json &params, const std::string &session_id) {
    int message_id = global_state.next_message_id++;
    std::string serialized = build_command(message_id, method, params, session_id)
                                 .dump(-1, ' ', false, json::error_handler_t::replace);
    return write_text(serialized);
}

// Send and service the socket until the matching response arrives.
// Events received meanwhile are queued for the run loop.
static json send_command(const std::string &method, const json &params, const std::string &session_id = "") {
    json error_response;
    int message_id = global_state.next_message_id++;
    std::string serialized = build_command(message_id, method, params, session_id)
                                 .dump(-1, ' ', false, json::error_handler_t::replace);

    global_state.awaited_ids.insert(message_id);
    if (!write_text(serialized)) {
        global_state.awaited_ids.erase(message_id);
        error_response["error"] = "Failed to send CDP command " + method;
        return error_response;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!global_state.closed) {
        lws_service(global_state.websocket_context, 10);

        auto response_iterator = global_state.responses.find(message_id);
        if (response_iterator != global_state.responses.end()) {
            json response = response_iterator->second;
            global_state.responses.erase(response_iterator);
            return response;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > COMMAND_TIMEOUT_MILLISECONDS) {
            break;
        }
    }

    global_state.awaited_ids.erase(message_id);
    error_response["error"] = "No CDP response to method: " + method;
    return error_response;
}

static bool command_failed(const json &response, const std::string &method) {
    if (response.contains("error")) {
        log_sink::error(method + " failed: " + response["error"].dump());
        return true;
    }
    return false;
}

static std::string string_field(const json &object, const std::string &key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

ClassifiedEvent classify_event(const json &message, const std::string &binding_name,
                               const std::string &session_id, const std::string &target_id) {
    ClassifiedEvent classified;
    std::string method = string_field(message, "method");
    const json params = message.contains("params") ? message["params"] : json::object();

    // Browser-level target events carry no sessionId.
    if (method == "Target.targetDestroyed") {
        if (!target_id.empty() && string_field(params, "targetId") == target_id) {
            classified.kind = EventKind::TargetGone;
        }
        return classified;
    }
    if (method == "Target.detachedFromTarget") {
        if (!session_id.empty() && string_field(params, "sessionId") == session_id) {
            classified.kind = EventKind::TargetGone;
        }
        return classified;
    }

    if (string_field(message, "sessionId") != session_id) {
        return classified;
    }

    if (method == "Runtime.bindingCalled") {
        if (string_field(params, "name") == binding_name) {
            classified.kind = EventKind::BindingCalled;
            classified.payload = string_field(params, "payload");
        }
        return classified;
    }
    if (method == "Page.frameNavigated" && params.contains("frame")) {
        const json &frame = params["frame"];
        // Subframes carry a parentId.
        if (!frame.contains("parentId")) {
            classified.kind = EventKind::MainFrameNavigated;
            classified.url = string_field(frame, "url");
        }
    }
    return classified;
}

OpenResult open_renderer(const bridge_config::BridgeConfig &config) {
    OpenResult result;
    global_state.binding_name = config.binding_name;

    bool connected = false;
    std::string existing_url = cdp_chrome_launch::try_get_existing_websocket_url(config.chrome_profile_directory);
    if (!existing_url.empty()) {
        log_sink::debug("open_renderer: found existing Chrome, trying " + existing_url);
        connected = connect(existing_url);
        if (!connected) {
            log_sink::debug("open_renderer: existing Chrome did not answer, launching a new one.");
        }
    }

    if (!connected) {
        cdp_chrome_launch::LaunchOptions launch_options;
        launch_options.user_data_directory = config.chrome_profile_directory;
        launch_options.headless = config.headless;
        cdp_chrome_launch::ChromeLaunchResult launch_result = cdp_chrome_launch::launch_chrome(launch_options);
        if (!launch_result.success) {
            result.error_detail = launch_result.error_message;
            return result;
        }
        global_state.chrome_process_id = launch_result.process_id;

        if (!connect(launch_result.websocket_debugger_url)) {
            result.error_detail = "Could not establish WebSocket connection to: " + launch_result.websocket_debugger_url;
            platform::kill_process(global_state.chrome_process_id);
            global_state.chrome_process_id = -1;
            return result;
        }
    }

    json discover_params;
    discover_params["discover"] = true;
    command_failed(send_command("Target.setDiscoverTargets", discover_params), "Target.setDiscoverTargets");

    std::string chosen_target_id;
    json targets_response = send_command("Target.getTargets", json::object());
    if (targets_response.contains("result") && targets_response["result"].contains("targetInfos")) {
        for (const auto &target_info : targets_response["result"]["targetInfos"]) {
            if (string_field(target_info, "type") == "page") {
                chosen_target_id = string_field(target_info, "targetId");
                break;
            }
        }
    }

    if (chosen_target_id.empty()) {
        json create_params;
        create_params["url"] = "about:blank";
        json create_response = send_command("Target.createTarget", create_params);
        if (command_failed(create_response, "Target.createTarget") || !create_response.contains("result")) {
            result.error_detail = "Target.createTarget failed: " + create_response.dump();
            return result;
        }
        chosen_target_id = string_field(create_response["result"], "targetId");
    }

    json attach_params;
    attach_params["targetId"] = chosen_target_id;
    attach_params["flatten"] = true;
    json attach_response = send_command("Target.attachToTarget", attach_params);
    if (command_failed(attach_response, "Target.attachToTarget") || !attach_response.contains("result") ||
        string_field(attach_response["result"], "sessionId").empty()) {
        result.error_detail = "Target.attachToTarget failed: " + attach_response.dump();
        return result;
    }
    global_state.target_id = chosen_target_id;
    global_state.session_id = string_field(attach_response["result"], "sessionId");
    log_sink::debug("Attached to target id=" + global_state.target_id + " session=" + global_state.session_id);

    if (command_failed(send_command("Page.enable", json::object(), global_state.session_id), "Page.enable") ||
        command_failed(send_command("Runtime.enable", json::object(), global_state.session_id), "Runtime.enable")) {
        result.error_detail = "Could not enable Page/Runtime domains on the page session.";
        return result;
    }

    json binding_params;
    binding_params["name"] = config.binding_name;
    if (command_failed(send_command("Runtime.addBinding", binding_params, global_state.session_id),
                       "Runtime.addBinding")) {
        result.error_detail = "Runtime.addBinding failed for " + config.binding_name;
        return result;
    }

    result.success = true;
    return result;
}

bool install_facade(const std::string &script) {
    json new_document_params;
    new_document_params["source"] = script;
    if (command_failed(send_command("Page.addScriptToEvaluateOnNewDocument", new_document_params,
                                    global_state.session_id),
                       "Page.addScriptToEvaluateOnNewDocument")) {
        return false;
    }

    // The document already loaded never sees the new-document script.
    json evaluate_params;
    evaluate_params["expression"] = script;
    return !command_failed(send_command("Runtime.evaluate", evaluate_params, global_state.session_id),
                           "Runtime.evaluate");
}

bool navigate(const std::string &url) {
    json navigate_params;
    navigate_params["url"] = url;
    json response = send_command("Page.navigate", navigate_params, global_state.session_id);
    if (command_failed(response, "Page.navigate")) {
        return false;
    }
    if (response.contains("result") && !string_field(response["result"], "errorText").empty()) {
        log_sink::error("Page.navigate to " + url + " failed: " + string_field(response["result"], "errorText"));
        return false;
    }
    return true;
}

void queue_delivery(uint64_t generation, const std::string &expression) {
    std::lock_guard<std::mutex> lock(global_state.delivery_mutex);
    global_state.deliveries.emplace_back(generation, expression);
    if (global_state.websocket_context != nullptr) {
        lws_cancel_service(global_state.websocket_context);
    }
}

void flush_deliveries(uint64_t current_generation) {
    std::deque<std::pair<uint64_t, std::string>> deliveries;
    {
        std::lock_guard<std::mutex> lock(global_state.delivery_mutex);
        deliveries.swap(global_state.deliveries);
    }
    for (const auto &delivery : deliveries) {
        if (delivery.first != current_generation) {
            log_sink::debug("dropping delivery for a replaced document");
            continue;
        }
        json evaluate_params;
        evaluate_params["expression"] = delivery.second;
        if (!post_command("Runtime.evaluate", evaluate_params, global_state.session_id)) {
            log_sink::warning("could not deliver to the page, connection is down");
            return;
        }
    }
}

void disconnect() {
    destroy_context();

    if (global_state.chrome_process_id > 0) {
        log_sink::debug("disconnect(): killing Chrome process id=" + std::to_string(global_state.chrome_process_id));
        platform::kill_process(global_state.chrome_process_id);
    }
    global_state.chrome_process_id = -1;
}

static std::unique_ptr<bridge_instance::BridgeInstance> create_bridge(
    const bridge_config::BridgeConfig &config, const std::shared_ptr<platform::PlatformAdapter> &adapter,
    const std::shared_ptr<permission_gate::PermissionGate> &gate, uint64_t generation) {
    bridge_instance::OutboundChannel channel;
    channel.deliver_result = [generation](const call_dispatcher::CallResult &result) {
        queue_delivery(generation, script_facade::build_result_delivery(wire_protocol::encode_result(result)));
    };
    channel.deliver_event = [generation](const subscription_manager::SubscriptionEvent &event) {
        queue_delivery(generation, script_facade::build_event_delivery(wire_protocol::encode_event(event)));
    };
    return std::make_unique<bridge_instance::BridgeInstance>(adapter, gate, config, channel);
}

// Binding payloads come from untrusted content: only calls and console output are accepted.
static void handle_binding_payload(bridge_instance::BridgeInstance &bridge, uint64_t generation,
                                   const std::string &payload) {
    wire_protocol::DecodeResult decoded = wire_protocol::decode_inbound(payload);
    if (!decoded.success) {
        log_sink::warning("rejected message from the page: " + decoded.error_detail);
        if (decoded.correlation_id) {
            queue_delivery(generation, script_facade::build_result_delivery(wire_protocol::encode_rejection(
                                           *decoded.correlation_id, bridge_error::ErrorKind::InvalidArguments,
                                           decoded.error_detail)));
        }
        return;
    }
    switch (decoded.message.type) {
    case wire_protocol::MessageType::Call:
        bridge.handle_call(decoded.message.call);
        break;
    case wire_protocol::MessageType::Console:
        bridge.handle_console(decoded.message.console_level, decoded.message.console_text);
        break;
    default:
        log_sink::warning("ignoring host-only message sent by the page");
        break;
    }
}

int run(const bridge_config::BridgeConfig &config,
        std::shared_ptr<platform::PlatformAdapter> adapter,
        std::shared_ptr<permission_gate::PermissionGate> gate,
        const std::atomic<bool> &stop_requested) {
    OpenResult opened = open_renderer(config);
    if (!opened.success) {
        log_sink::error("Could not open the renderer: " + opened.error_detail);
        disconnect();
        return 1;
    }

    uint64_t generation = 1;
    std::unique_ptr<bridge_instance::BridgeInstance> bridge = create_bridge(config, adapter, gate, generation);
    if (!install_facade(bridge->facade_script())) {
        bridge->dispose();
        disconnect();
        return 1;
    }
    if (!navigate(config.start_url)) {
        log_sink::warning("staying on the current document");
    }

    bool target_gone = false;
    while (!stop_requested.load() && !global_state.closed && !target_gone) {
        lws_service(global_state.websocket_context, SERVICE_INTERVAL_MILLISECONDS);

        while (!global_state.events.empty() && !target_gone) {
            json event = std::move(global_state.events.front());
            global_state.events.pop_front();

            ClassifiedEvent classified = classify_event(event, global_state.binding_name, global_state.session_id,
                                                        global_state.target_id);
            switch (classified.kind) {
            case EventKind::BindingCalled:
                handle_binding_payload(*bridge, generation, classified.payload);
                break;
            case EventKind::MainFrameNavigated:
                log_sink::info("content load: " + classified.url);
                generation++;
                bridge->dispose();
                bridge = create_bridge(config, adapter, gate, generation);
                break;
            case EventKind::TargetGone:
                log_sink::info("page closed, shutting down");
                target_gone = true;
                break;
            case EventKind::Ignored:
                break;
            }
        }

        flush_deliveries(generation);
    }

    bridge->dispose();
    if (!target_gone && !global_state.closed) {
        flush_deliveries(generation);
        lws_service(global_state.websocket_context, SERVICE_INTERVAL_MILLISECONDS);
    }
    disconnect();
    return 0;
}

} // namespace cdp_renderer
