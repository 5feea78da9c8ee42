#ifndef CAPBRIDGE_WIRE_PROTOCOL_HPP
#define CAPBRIDGE_WIRE_PROTOCOL_HPP

// Bridge wire format between the script facade and the host.
// Uses nlohmann/json for parsing and serialization.
//
// Inbound:  {"type":"call","id":N,"capability":"...","arguments":{...}}
//           {"type":"console","level":"log","args":[...]}
//           {"type":"load","url":"..."}, {"type":"dispose"}, {"type":"facade"}
// Outbound: {"type":"result","id":N,"ok":true,"value":...}
//           {"type":"result","id":N,"ok":false,"error":{"kind":"...","message":"..."}}
//           {"type":"event","subscription":N,"event":...} (or "error" instead of "event")
//           {"type":"facade","script":"..."}

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "bridge/call_dispatcher.hpp"
#include "bridge/subscription_manager.hpp"

namespace wire_protocol {

using json = nlohmann::json;

enum class MessageType {
    Call,
    Console,
    Load,
    Dispose,
    Facade
};

struct InboundMessage {
    MessageType type = MessageType::Call;
    call_dispatcher::CallRequest call;  // Call
    std::string console_level;          // Console
    std::string console_text;           // Console: arguments joined by spaces
    std::string url;                    // Load
};

struct DecodeResult {
    bool success = false;
    InboundMessage message;
    // Set when a malformed call still carried a usable id, so the caller can
    // answer it with InvalidArguments.
    std::optional<uint64_t> correlation_id;
    std::string error_detail;
};

// Parse raw text and decode it.
DecodeResult decode_inbound(const std::string &text);

// Decode an already parsed message.
DecodeResult decode_inbound_json(const json &message);

json encode_result(const call_dispatcher::CallResult &result);
json encode_event(const subscription_manager::SubscriptionEvent &event);
json encode_facade(const std::string &script);

// Failure result for a call that never reached the dispatcher.
json encode_rejection(uint64_t correlation_id, bridge_error::ErrorKind kind, const std::string &message);

// Console arguments as one line: strings verbatim, anything else as JSON.
std::string join_console_arguments(const json &arguments);

} // namespace wire_protocol

#endif // CAPBRIDGE_WIRE_PROTOCOL_HPP
