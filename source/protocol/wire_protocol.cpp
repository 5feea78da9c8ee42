#include "protocol/wire_protocol.hpp"

namespace wire_protocol {

static DecodeResult decode_failure(const std::string &detail) {
    DecodeResult result;
    result.success = false;
    result.error_detail = detail;
    return result;
}

static std::string get_string(const json &message, const std::string &key) {
    if (message.contains(key) && message[key].is_string()) {
        return message[key].get<std::string>();
    }
    return "";
}

static std::optional<uint64_t> get_correlation_id(const json &message) {
    if (!message.contains("id")) {
        return std::nullopt;
    }
    const json &id = message["id"];
    if (id.is_number_unsigned()) {
        return id.get<uint64_t>();
    }
    if (id.is_number_integer() && id.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(id.get<int64_t>());
    }
    // Script numbers arrive as doubles from some serializers.
    if (id.is_number_float()) {
        double value = id.get<double>();
        if (value >= 0 && value <= 9007199254740991.0 && static_cast<double>(static_cast<uint64_t>(value)) == value) {
            return static_cast<uint64_t>(value);
        }
    }
    return std::nullopt;
}

static DecodeResult decode_call(const json &message) {
    DecodeResult result;
    std::optional<uint64_t> correlation_id = get_correlation_id(message);
    if (!correlation_id) {
        return decode_failure("call message without a non-negative integer id");
    }
    result.correlation_id = correlation_id;

    std::string capability = get_string(message, "capability");
    if (capability.empty()) {
        result.error_detail = "call message without a capability name";
        return result;
    }

    result.message.type = MessageType::Call;
    result.message.call.correlation_id = *correlation_id;
    result.message.call.capability = capability;
    if (message.contains("arguments") && !message["arguments"].is_null()) {
        result.message.call.arguments = message["arguments"];
    }
    result.success = true;
    return result;
}

DecodeResult decode_inbound_json(const json &message) {
    if (!message.is_object()) {
        return decode_failure("message is not a JSON object");
    }

    // A message without a type is a call.
    std::string type = message.contains("type") ? get_string(message, "type") : "call";

    if (type == "call") {
        return decode_call(message);
    }

    DecodeResult result;
    result.success = true;
    if (type == "console") {
        result.message.type = MessageType::Console;
        result.message.console_level = get_string(message, "level");
        if (message.contains("args")) {
            result.message.console_text = join_console_arguments(message["args"]);
        }
    } else if (type == "load") {
        result.message.type = MessageType::Load;
        result.message.url = get_string(message, "url");
    } else if (type == "dispose") {
        result.message.type = MessageType::Dispose;
    } else if (type == "facade") {
        result.message.type = MessageType::Facade;
    } else {
        return decode_failure("unknown message type '" + type + "'");
    }
    return result;
}

DecodeResult decode_inbound(const std::string &text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error &error) {
        return decode_failure("parse error: " + std::string(error.what()));
    }
    return decode_inbound_json(parsed);
}

json encode_result(const call_dispatcher::CallResult &result) {
    json message;
    message["type"] = "result";
    message["id"] = result.correlation_id;
    message["ok"] = result.success;
    if (result.success) {
        message["value"] = result.value;
    } else {
        message["error"]["kind"] = bridge_error::kind_name(result.error_kind);
        message["error"]["message"] = result.error_message;
    }
    return message;
}

json encode_event(const subscription_manager::SubscriptionEvent &event) {
    json message;
    message["type"] = "event";
    message["subscription"] = event.subscription_id;
    if (event.outcome.success) {
        message["event"] = event.outcome.value;
    } else {
        message["error"]["kind"] = bridge_error::kind_name(event.outcome.error_kind);
        message["error"]["message"] = event.outcome.error_detail;
    }
    return message;
}

json encode_facade(const std::string &script) {
    json message;
    message["type"] = "facade";
    message["script"] = script;
    return message;
}

json encode_rejection(uint64_t correlation_id, bridge_error::ErrorKind kind, const std::string &message) {
    call_dispatcher::CallResult result;
    result.correlation_id = correlation_id;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return encode_result(result);
}

std::string join_console_arguments(const json &arguments) {
    if (arguments.is_string()) {
        return arguments.get<std::string>();
    }
    if (!arguments.is_array()) {
        return arguments.dump();
    }
    std::string joined;
    for (const auto &argument : arguments) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += argument.is_string() ? argument.get<std::string>() : argument.dump();
    }
    return joined;
}

} // namespace wire_protocol
