#include "platform/linux/linux_sysfs.hpp"
#include "platform/system_calls.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace linux_sysfs {

namespace fs = std::filesystem;

// First line of a sysfs attribute, trailing whitespace removed.
static std::optional<std::string> read_attribute(const fs::path &path) {
    std::string contents;
    if (!platform::read_file_contents(path.string(), contents)) {
        return std::nullopt;
    }
    size_t newline = contents.find('\n');
    if (newline != std::string::npos) {
        contents.erase(newline);
    }
    while (!contents.empty() && (contents.back() == ' ' || contents.back() == '\r' || contents.back() == '\t')) {
        contents.pop_back();
    }
    return contents;
}

static std::optional<double> read_number(const fs::path &path) {
    std::optional<std::string> text = read_attribute(path);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    double value = std::strtod(text->c_str(), &end);
    if (end == text->c_str()) {
        return std::nullopt;
    }
    return value;
}

// capacity (percent), else energy_now/energy_full, else charge_now/charge_full.
static std::optional<double> read_level(const fs::path &supply) {
    if (std::optional<double> capacity = read_number(supply / "capacity")) {
        return std::clamp(*capacity / 100.0, 0.0, 1.0);
    }
    const char *pairs[][2] = {{"energy_now", "energy_full"}, {"charge_now", "charge_full"}};
    for (const auto &pair : pairs) {
        std::optional<double> now = read_number(supply / pair[0]);
        std::optional<double> full = read_number(supply / pair[1]);
        if (now && full && *full > 0) {
            return std::clamp(*now / *full, 0.0, 1.0);
        }
    }
    return std::nullopt;
}

static std::vector<fs::path> sorted_entries(const std::string &root) {
    std::vector<fs::path> entries;
    std::error_code error;
    fs::directory_iterator iterator(root, error);
    if (error) {
        return entries;
    }
    for (const auto &entry : iterator) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

platform::ChargingState parse_charging_state(const std::string &status_text) {
    if (status_text == "Charging") {
        return platform::ChargingState::Charging;
    }
    if (status_text == "Discharging") {
        return platform::ChargingState::Discharging;
    }
    if (status_text == "Full") {
        return platform::ChargingState::Full;
    }
    return platform::ChargingState::Unknown;
}

std::optional<platform::BatteryStatus> read_battery(const std::string &root) {
    for (const auto &supply : sorted_entries(root)) {
        std::optional<std::string> type = read_attribute(supply / "type");
        if (!type || *type != "Battery") {
            continue;
        }
        std::optional<double> level = read_level(supply);
        if (!level) {
            continue;
        }
        platform::BatteryStatus status;
        status.level = *level;
        std::optional<std::string> status_text = read_attribute(supply / "status");
        status.state = status_text ? parse_charging_state(*status_text) : platform::ChargingState::Unknown;
        return status;
    }
    return std::nullopt;
}

static bool interface_is_up(const fs::path &interface) {
    std::optional<std::string> state = read_attribute(interface / "operstate");
    if (state && *state == "up") {
        return true;
    }
    // Some drivers report "unknown" while the link carries traffic.
    if (state && *state == "unknown") {
        std::optional<std::string> carrier = read_attribute(interface / "carrier");
        return carrier && *carrier == "1";
    }
    return false;
}

static platform::ConnectionType classify_interface(const fs::path &interface) {
    std::error_code error;
    std::string name = interface.filename().string();
    if (fs::exists(interface / "wireless", error) || fs::exists(interface / "phy80211", error)) {
        return platform::ConnectionType::Wifi;
    }
    if (name.rfind("wwan", 0) == 0 || name.rfind("rmnet", 0) == 0 || name.rfind("ccmni", 0) == 0) {
        return platform::ConnectionType::Cellular;
    }
    // Bridges, tunnels and other virtual links have no backing device.
    if (fs::exists(interface / "device", error)) {
        return platform::ConnectionType::Ethernet;
    }
    return platform::ConnectionType::Unknown;
}

static int connection_rank(platform::ConnectionType connection) {
    switch (connection) {
    case platform::ConnectionType::Ethernet:
        return 3;
    case platform::ConnectionType::Wifi:
        return 2;
    case platform::ConnectionType::Cellular:
        return 1;
    default:
        return 0;
    }
}

platform::ConnectionType read_connection_type(const std::string &root) {
    std::error_code error;
    if (!fs::is_directory(root, error)) {
        return platform::ConnectionType::Unknown;
    }

    platform::ConnectionType best = platform::ConnectionType::None;
    bool any_up = false;
    for (const auto &interface : sorted_entries(root)) {
        if (interface.filename() == "lo" || !interface_is_up(interface)) {
            continue;
        }
        any_up = true;
        platform::ConnectionType connection = classify_interface(interface);
        if (connection_rank(connection) > connection_rank(best)) {
            best = connection;
        }
    }
    if (any_up && best == platform::ConnectionType::None) {
        // Only virtual links are up (VPN, container bridge).
        return platform::ConnectionType::Unknown;
    }
    return best;
}

} // namespace linux_sysfs
