#ifndef CAPBRIDGE_HOST_STDIO_HPP
#define CAPBRIDGE_HOST_STDIO_HPP

// Stdio host: the embedder talks to one bridge instance over stdin/stdout.
// Framing uses brace-counting with string/escape awareness, so it works both
// with newline-delimited and streamed JSON.

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "bridge/permission_gate.hpp"
#include "platform/platform_adapter.hpp"
#include "utils/bridge_config.hpp"

namespace host_stdio {

using json = nlohmann::json;

// Read a single complete JSON object from input.
// Returns the raw JSON text, or empty string on EOF.
std::string read_message(std::istream &input);

// Serialises messages onto one output stream; callable from any thread.
// Each message is written as one line.
class MessageWriter {
public:
    explicit MessageWriter(std::ostream &output);

    void write_message(const json &message);

private:
    std::mutex mutex_;
    std::ostream &output_;
};

// Serve messages until EOF, a dispose-and-EOF sequence, or stop_requested.
// Returns the process exit code.
int run(const bridge_config::BridgeConfig &config,
        std::shared_ptr<platform::PlatformAdapter> adapter,
        std::shared_ptr<permission_gate::PermissionGate> gate,
        std::istream &input,
        std::ostream &output,
        const std::atomic<bool> &stop_requested);

} // namespace host_stdio

#endif // CAPBRIDGE_HOST_STDIO_HPP
