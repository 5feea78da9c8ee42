#include "platform/payloads.hpp"

#include <chrono>

namespace platform {

static json optional_number(const std::optional<double> &value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

json build_position_value(const Position &position) {
    json coords;
    coords["latitude"] = position.latitude;
    coords["longitude"] = position.longitude;
    coords["accuracy"] = position.accuracy;
    coords["altitude"] = optional_number(position.altitude);
    coords["altitudeAccuracy"] = optional_number(position.altitude_accuracy);
    coords["heading"] = optional_number(position.heading);
    coords["speed"] = optional_number(position.speed);

    json value;
    value["coords"] = coords;
    value["timestamp"] = position.timestamp_ms;
    return value;
}

json build_battery_value(const BatteryStatus &status) {
    double level = status.level;
    if (level < 0.0) {
        level = 0.0;
    } else if (level > 1.0) {
        level = 1.0;
    }

    json value;
    value["level"] = level;
    value["charging"] = (status.state == ChargingState::Charging || status.state == ChargingState::Full);
    // Infinity is not representable in JSON; null stands for "unknown / never".
    value["chargingTime"] = (status.state == ChargingState::Full) ? json(0.0) : json(nullptr);
    value["dischargingTime"] = nullptr;
    value["state"] = charging_state_name(status.state);
    return value;
}

json build_network_value(ConnectionType connection) {
    std::string effective_type = "4g";
    double downlink = 10.0;

    switch (connection) {
    case ConnectionType::Wifi:
        downlink = 50.0;
        break;
    case ConnectionType::Ethernet:
        downlink = 100.0;
        break;
    case ConnectionType::Cellular:
        downlink = 10.0;
        break;
    case ConnectionType::None:
        effective_type = "slow-2g";
        downlink = 0.0;
        break;
    case ConnectionType::Unknown:
        break;
    }

    json value;
    value["type"] = connection_type_name(connection);
    value["effectiveType"] = effective_type;
    value["downlink"] = downlink;
    value["rtt"] = 50;
    value["saveData"] = false;
    return value;
}

json build_orientation_value(const OrientationInfo &orientation) {
    json value;
    value["type"] = orientation.type;
    value["angle"] = orientation.angle;
    return value;
}

std::string build_share_text(const ShareRequest &request) {
    std::string text;
    for (const std::string *part : {&request.title, &request.text, &request.url}) {
        if (part->empty()) {
            continue;
        }
        if (!text.empty()) {
            text += "\n";
        }
        text += *part;
    }
    return text;
}

const char *charging_state_name(ChargingState state) {
    switch (state) {
    case ChargingState::Charging:
        return "charging";
    case ChargingState::Discharging:
        return "discharging";
    case ChargingState::Full:
        return "full";
    case ChargingState::Unknown:
        return "unknown";
    }
    return "unknown";
}

const char *connection_type_name(ConnectionType connection) {
    switch (connection) {
    case ConnectionType::Wifi:
        return "wifi";
    case ConnectionType::Ethernet:
        return "ethernet";
    case ConnectionType::Cellular:
        return "cellular";
    case ConnectionType::None:
        return "none";
    case ConnectionType::Unknown:
        return "unknown";
    }
    return "unknown";
}

int64_t now_epoch_milliseconds() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::system_clock::now().time_since_epoch())
                                    .count());
}

} // namespace platform
