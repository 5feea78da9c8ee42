#ifndef CAPBRIDGE_PAYLOADS_HPP
#define CAPBRIDGE_PAYLOADS_HPP

// Typed requests and readings exchanged with platform adapters, and the
// builders that turn readings into the JSON values script content sees.
// Every adapter goes through these builders so result shapes match across OSes.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace platform {

using json = nlohmann::json;

struct PositionOptions {
    bool enable_high_accuracy = false;
    int timeout_milliseconds = 0;     // 0 = adapter default
    int maximum_age_milliseconds = 0;
};

struct Position {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy = 0.0;
    std::optional<double> altitude;
    std::optional<double> altitude_accuracy;
    std::optional<double> heading;
    std::optional<double> speed;
    int64_t timestamp_ms = 0;
};

struct ShareRequest {
    std::string title;
    std::string text;
    std::string url;
};

struct NotificationRequest {
    std::string title;
    std::string body;
    std::string icon;
    std::string tag;
};

enum class ChargingState {
    Charging,
    Discharging,
    Full,
    Unknown
};

struct BatteryStatus {
    double level = 1.0; // 0.0 .. 1.0
    ChargingState state = ChargingState::Unknown;
};

enum class ConnectionType {
    Wifi,
    Ethernet,
    Cellular,
    None,
    Unknown
};

struct OrientationInfo {
    std::string type = "portrait-primary";
    int angle = 0;
};

// {coords:{latitude, longitude, accuracy, altitude, altitudeAccuracy, heading, speed}, timestamp}
json build_position_value(const Position &position);

// {level, charging, chargingTime, dischargingTime, state}. Unknown times are null.
json build_battery_value(const BatteryStatus &status);

// {type, effectiveType, downlink, rtt, saveData}
json build_network_value(ConnectionType connection);

// {type, angle}
json build_orientation_value(const OrientationInfo &orientation);

// Non-empty title, text and url joined by newlines.
std::string build_share_text(const ShareRequest &request);

const char *charging_state_name(ChargingState state);
const char *connection_type_name(ConnectionType connection);

int64_t now_epoch_milliseconds();

} // namespace platform

#endif // CAPBRIDGE_PAYLOADS_HPP
