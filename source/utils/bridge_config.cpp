#include "utils/bridge_config.hpp"
#include "utils/log_sink.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace bridge_config {

// Environment variable name for each setting key.
struct EnvironmentBinding {
    const char *variable;
    const char *key;
};

static const EnvironmentBinding ENVIRONMENT_BINDINGS[] = {
    {"CAPBRIDGE_CALL_TIMEOUT_MS", "call-timeout-ms"},
    {"CAPBRIDGE_WATCH_INTERVAL_MS", "watch-interval-ms"},
    {"CAPBRIDGE_TRANSPORT", "transport"},
    {"CAPBRIDGE_START_URL", "url"},
    {"CAPBRIDGE_LOCATION", "location"},
    {"CAPBRIDGE_PERMISSION_POLICY", "permission-policy"},
    {"CAPBRIDGE_BINDING_NAME", "binding-name"},
    {"CAPBRIDGE_HEADLESS", "headless"},
    {"CAPBRIDGE_CHROME_PROFILE", "chrome-profile"},
};

static bool parse_positive_int(const std::string &text, int &output) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value <= 0) {
            return false;
        }
        output = value;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

static bool parse_flag(const std::string &text, bool &output) {
    if (text == "1" || text == "true" || text == "yes") {
        output = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "no") {
        output = false;
        return true;
    }
    return false;
}

static bool parse_double(const std::string &text, double &output) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value)) {
            return false;
        }
        output = value;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

// JS identifiers only; the name is spliced into the facade script.
static bool is_identifier(const std::string &text) {
    if (text.empty()) {
        return false;
    }
    for (size_t index = 0; index < text.size(); ++index) {
        char character = text[index];
        bool letter = (character >= 'a' && character <= 'z') || (character >= 'A' && character <= 'Z') ||
                      character == '_' || character == '$';
        bool digit = (character >= '0' && character <= '9');
        if (!letter && !(digit && index > 0)) {
            return false;
        }
    }
    return true;
}

std::optional<FixedLocation> parse_fixed_location(const std::string &text) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (std::getline(stream, part, ',')) {
        parts.push_back(part);
    }
    if (parts.size() != 2 && parts.size() != 3) {
        return std::nullopt;
    }

    FixedLocation location;
    if (!parse_double(parts[0], location.latitude) || !parse_double(parts[1], location.longitude)) {
        return std::nullopt;
    }
    if (parts.size() == 3 && !parse_double(parts[2], location.accuracy)) {
        return std::nullopt;
    }
    if (location.latitude < -90.0 || location.latitude > 90.0 ||
        location.longitude < -180.0 || location.longitude > 180.0 || location.accuracy < 0.0) {
        return std::nullopt;
    }
    return location;
}

bool apply_setting(BridgeConfig &config, const std::string &key, const std::string &value) {
    if (key == "call-timeout-ms") {
        return parse_positive_int(value, config.call_timeout_milliseconds);
    }
    if (key == "watch-interval-ms") {
        return parse_positive_int(value, config.watch_interval_milliseconds);
    }
    if (key == "transport") {
        if (value == "stdio") {
            config.transport = Transport::Stdio;
            return true;
        }
        if (value == "cdp") {
            config.transport = Transport::Cdp;
            return true;
        }
        return false;
    }
    if (key == "url") {
        if (value.empty()) {
            return false;
        }
        config.start_url = value;
        return true;
    }
    if (key == "location") {
        std::optional<FixedLocation> location = parse_fixed_location(value);
        if (!location) {
            return false;
        }
        config.fixed_location = location;
        return true;
    }
    if (key == "permission-policy") {
        if (value == "ask") {
            config.permission_policy = PermissionPolicy::Ask;
        } else if (value == "grant") {
            config.permission_policy = PermissionPolicy::Grant;
        } else if (value == "deny") {
            config.permission_policy = PermissionPolicy::Deny;
        } else {
            return false;
        }
        return true;
    }
    if (key == "binding-name") {
        if (!is_identifier(value)) {
            return false;
        }
        config.binding_name = value;
        return true;
    }
    if (key == "headless") {
        return parse_flag(value, config.headless);
    }
    if (key == "chrome-profile") {
        if (value.empty() || value[0] != '/') {
            return false;
        }
        config.chrome_profile_directory = value;
        return true;
    }
    return false;
}

void apply_environment(BridgeConfig &config) {
    for (const auto &binding : ENVIRONMENT_BINDINGS) {
        const char *value = std::getenv(binding.variable);
        if (value == nullptr || value[0] == '\0') {
            continue;
        }
        if (!apply_setting(config, binding.key, value)) {
            log_sink::warning(std::string("Ignoring invalid ") + binding.variable + "=" + value);
        }
    }
}

void apply_command_line(BridgeConfig &config, const std::vector<std::string> &arguments) {
    for (const auto &argument : arguments) {
        if (argument.rfind("--", 0) != 0) {
            log_sink::warning("Ignoring unexpected argument: " + argument);
            continue;
        }
        auto equals_position = argument.find('=');
        if (equals_position == std::string::npos) {
            log_sink::warning("Ignoring argument without value: " + argument);
            continue;
        }
        std::string key = argument.substr(2, equals_position - 2);
        std::string value = argument.substr(equals_position + 1);
        if (!apply_setting(config, key, value)) {
            log_sink::warning("Ignoring invalid argument: " + argument);
        }
    }
}

BridgeConfig load_from_environment() {
    BridgeConfig config;
    apply_environment(config);
    return config;
}

} // namespace bridge_config
