#ifndef CAPBRIDGE_BRIDGE_CONFIG_HPP
#define CAPBRIDGE_BRIDGE_CONFIG_HPP

// Runtime configuration: defaults, CAPBRIDGE_* environment overrides and
// --flag=value command-line overrides (applied in that order).

#include <optional>
#include <string>
#include <vector>

namespace bridge_config {

enum class Transport {
    Stdio,
    Cdp
};

// How the Linux adapter answers permission prompts.
enum class PermissionPolicy {
    Ask,   // zenity dialog
    Grant,
    Deny
};

// Fixed position reported by adapters without a real location provider.
struct FixedLocation {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy = 0.0;
};

struct BridgeConfig {
    int call_timeout_milliseconds = 10000;
    int watch_interval_milliseconds = 1000;
    Transport transport = Transport::Stdio;
    std::string start_url = "about:blank";
    std::optional<FixedLocation> fixed_location;
    PermissionPolicy permission_policy = PermissionPolicy::Ask;
    std::string binding_name = "__capbridgeCall";
    // cdp transport only.
    bool headless = false;
    std::string chrome_profile_directory = "/tmp/capbridge_chrome_profile";
};

// Apply one setting by key ("call-timeout-ms", "watch-interval-ms", "transport",
// "url", "location", "permission-policy", "binding-name", "headless", "chrome-profile").
// Returns false (and leaves config untouched) for unknown keys or invalid values.
bool apply_setting(BridgeConfig &config, const std::string &key, const std::string &value);

// Overlay CAPBRIDGE_* environment variables onto config.
void apply_environment(BridgeConfig &config);

// Overlay --key=value arguments (argv without the program name).
// Unknown or malformed arguments are reported as warnings and skipped.
void apply_command_line(BridgeConfig &config, const std::vector<std::string> &arguments);

// Defaults + environment.
BridgeConfig load_from_environment();

// Parse "lat,lon[,accuracy]". Returns empty on malformed or out-of-range input.
std::optional<FixedLocation> parse_fixed_location(const std::string &text);

} // namespace bridge_config

#endif // CAPBRIDGE_BRIDGE_CONFIG_HPP
