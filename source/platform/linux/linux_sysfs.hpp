#ifndef CAPBRIDGE_LINUX_SYSFS_HPP
#define CAPBRIDGE_LINUX_SYSFS_HPP

// Battery and network readings from sysfs. The root directory is a parameter
// so tests can point these at a fake tree.

#include <optional>
#include <string>

#include "platform/payloads.hpp"

namespace linux_sysfs {

static const char DEFAULT_POWER_SUPPLY_ROOT[] = "/sys/class/power_supply";
static const char DEFAULT_NET_ROOT[] = "/sys/class/net";

// First supply of type "Battery" under root. Empty when there is none
// (desktop machines) or its charge cannot be read.
std::optional<platform::BatteryStatus> read_battery(const std::string &root = DEFAULT_POWER_SUPPLY_ROOT);

// Best active connection under root: ethernet over wifi over cellular.
// None when no interface is up, Unknown when root cannot be read.
platform::ConnectionType read_connection_type(const std::string &root = DEFAULT_NET_ROOT);

// "Charging", "Discharging", "Full", anything else -> Unknown.
platform::ChargingState parse_charging_state(const std::string &status_text);

} // namespace linux_sysfs

#endif // CAPBRIDGE_LINUX_SYSFS_HPP
