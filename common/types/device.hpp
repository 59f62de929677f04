#pragma once

#include "battery.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace btbatt {

enum class AddressKind {
    Classic,
    Ble,  // BLE addresses are not reported (randomized for privacy)
};

struct DeviceAddress {
    AddressKind kind = AddressKind::Ble;
    std::string mac;  // Classic only

    static DeviceAddress classic(std::string mac) { return {AddressKind::Classic, std::move(mac)}; }
    static DeviceAddress ble() { return {AddressKind::Ble, {}}; }

    std::string to_string() const { return kind == AddressKind::Ble ? "BLE" : mac; }
};

// A device with battery information, ready for output
struct Device {
    std::string name;
    DeviceAddress address;
    BatteryReadings battery{};

    bool has_battery_info() const { return battery.any(); }
};

// Raw record from the classic (paired device) source.
// Battery bytes are 0 or 255 when the device does not report them.
struct ClassicDevice {
    std::string name;
    std::string address;
    bool connected = false;

    uint8_t battery_single = 0;
    uint8_t battery_left = 0;
    uint8_t battery_right = 0;
    uint8_t battery_case = 0;
};

} // namespace btbatt
