#include "host/host_stdio.hpp"
#include "bridge/bridge_instance.hpp"
#include "protocol/wire_protocol.hpp"
#include "utils/log_sink.hpp"

#include <istream>
#include <ostream>

namespace host_stdio {

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            // Ignore anything before the first '{' (whitespace, newlines, etc.)
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

MessageWriter::MessageWriter(std::ostream &output) : output_(output) {}

void MessageWriter::write_message(const json &message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    output_ << serialized << "\n";
    output_.flush();
}

// Binds one bridge instance to the writer. Deliveries of an instance that has
// been replaced by a load are dropped: the new document restarts its ids.
struct Session {
    std::shared_ptr<MessageWriter> writer;
    std::shared_ptr<std::atomic<uint64_t>> current_generation;
    std::unique_ptr<bridge_instance::BridgeInstance> bridge;
};

static std::unique_ptr<bridge_instance::BridgeInstance> create_bridge(
    const bridge_config::BridgeConfig &config, const std::shared_ptr<platform::PlatformAdapter> &adapter,
    const std::shared_ptr<permission_gate::PermissionGate> &gate, const Session &session, uint64_t generation) {
    std::shared_ptr<MessageWriter> writer = session.writer;
    std::shared_ptr<std::atomic<uint64_t>> current_generation = session.current_generation;

    bridge_instance::OutboundChannel channel;
    channel.deliver_result = [writer, current_generation, generation](const call_dispatcher::CallResult &result) {
        if (current_generation->load() != generation) {
            log_sink::debug("dropping result " + std::to_string(result.correlation_id) + " of a replaced document");
            return;
        }
        writer->write_message(wire_protocol::encode_result(result));
    };
    channel.deliver_event = [writer, current_generation,
                             generation](const subscription_manager::SubscriptionEvent &event) {
        if (current_generation->load() != generation) {
            return;
        }
        writer->write_message(wire_protocol::encode_event(event));
    };
    return std::make_unique<bridge_instance::BridgeInstance>(adapter, gate, config, channel);
}

int run(const bridge_config::BridgeConfig &config,
        std::shared_ptr<platform::PlatformAdapter> adapter,
        std::shared_ptr<permission_gate::PermissionGate> gate,
        std::istream &input,
        std::ostream &output,
        const std::atomic<bool> &stop_requested) {
    Session session;
    session.writer = std::make_shared<MessageWriter>(output);
    session.current_generation = std::make_shared<std::atomic<uint64_t>>(1);
    session.bridge = create_bridge(config, adapter, gate, session, 1);

    log_sink::info("stdio host ready, waiting for messages on stdin");

    while (!stop_requested.load()) {
        std::string raw_message = read_message(input);
        if (raw_message.empty()) {
            log_sink::info("EOF on stdin, shutting down");
            break;
        }

        wire_protocol::DecodeResult decoded = wire_protocol::decode_inbound(raw_message);
        if (!decoded.success) {
            log_sink::warning("rejected inbound message: " + decoded.error_detail);
            if (decoded.correlation_id) {
                session.writer->write_message(wire_protocol::encode_rejection(
                    *decoded.correlation_id, bridge_error::ErrorKind::InvalidArguments, decoded.error_detail));
            }
            continue;
        }

        const wire_protocol::InboundMessage &message = decoded.message;
        switch (message.type) {
        case wire_protocol::MessageType::Call:
            session.bridge->handle_call(message.call);
            break;
        case wire_protocol::MessageType::Console:
            session.bridge->handle_console(message.console_level, message.console_text);
            break;
        case wire_protocol::MessageType::Facade:
            session.writer->write_message(wire_protocol::encode_facade(session.bridge->facade_script()));
            break;
        case wire_protocol::MessageType::Dispose:
            session.bridge->dispose();
            break;
        case wire_protocol::MessageType::Load: {
            log_sink::info("content load" + (message.url.empty() ? std::string() : ": " + message.url));
            uint64_t generation = session.current_generation->fetch_add(1) + 1;
            session.bridge->dispose();
            session.bridge = create_bridge(config, adapter, gate, session, generation);
            session.writer->write_message(wire_protocol::encode_facade(session.bridge->facade_script()));
            break;
        }
        }
    }

    session.bridge->dispose();
    return 0;
}

} // namespace host_stdio
