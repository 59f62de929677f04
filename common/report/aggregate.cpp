#include "aggregate.hpp"
#include <log.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace btbatt::report {

static std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string format_level(const std::optional<BatteryLevel>& level) {
    return level ? level->to_string() : "-";
}

bool name_matches(std::string_view name, const std::optional<std::string>& filter) {
    if (!filter) return true;
    return to_lower(name).find(to_lower(*filter)) != std::string::npos;
}

std::vector<Device> gatt_devices(const gatt::BatteryMap& levels,
                                 const std::optional<std::string>& filter) {
    std::vector<Device> devices;

    for (const auto& [name, raw] : levels) {
        if (!name_matches(name, filter)) {
            continue;
        }

        auto level = BatteryLevel::from_raw(raw);
        if (!level) {
            log::debug() << "report: invalid battery level " << static_cast<int>(raw)
                         << " from GATT device " << name;
            continue;
        }

        log::info() << "report: found GATT device " << name << " " << level->to_string();

        Device device;
        device.name = name;
        device.address = DeviceAddress::ble();
        device.battery.single = level;
        devices.push_back(std::move(device));
    }

    return devices;
}

std::vector<Device> classic_devices(const std::vector<ClassicDevice>& classic,
                                    const std::optional<std::string>& filter,
                                    const std::vector<Device>& seen) {
    std::unordered_set<std::string> seen_names;
    for (const auto& d : seen) {
        seen_names.insert(d.name);
    }

    std::vector<Device> devices;

    for (const auto& c : classic) {
        if (!c.connected) {
            continue;
        }

        if (seen_names.count(c.name)) {
            log::debug() << "report: skipping " << c.name << ", already found via GATT";
            continue;
        }

        if (!name_matches(c.name, filter)) {
            continue;
        }

        log::debug() << "report: classic battery values for " << c.name
                     << ": single=" << static_cast<int>(c.battery_single)
                     << " left=" << static_cast<int>(c.battery_left)
                     << " right=" << static_cast<int>(c.battery_right)
                     << " case=" << static_cast<int>(c.battery_case);

        Device device;
        device.name = c.name;
        device.address = DeviceAddress::classic(c.address);
        device.battery.single = BatteryLevel::from_raw(c.battery_single);
        device.battery.left = BatteryLevel::from_raw(c.battery_left);
        device.battery.right = BatteryLevel::from_raw(c.battery_right);
        device.battery.case_ = BatteryLevel::from_raw(c.battery_case);

        if (!device.has_battery_info()) {
            log::debug() << "report: no battery info for " << c.name;
            continue;
        }

        log::info() << "report: found classic device " << c.name
                    << " single=" << format_level(device.battery.single)
                    << " left=" << format_level(device.battery.left)
                    << " right=" << format_level(device.battery.right)
                    << " case=" << format_level(device.battery.case_);

        seen_names.insert(c.name);
        devices.push_back(std::move(device));
    }

    return devices;
}

std::vector<Device> merge_devices(const gatt::BatteryMap& levels,
                                  const std::vector<ClassicDevice>& classic,
                                  const std::optional<std::string>& filter) {
    auto devices = gatt_devices(levels, filter);
    auto others = classic_devices(classic, filter, devices);

    devices.insert(devices.end(),
                   std::make_move_iterator(others.begin()),
                   std::make_move_iterator(others.end()));
    return devices;
}

} // namespace btbatt::report
