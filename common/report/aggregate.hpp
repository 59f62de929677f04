#pragma once

#include <gatt/coordinator.hpp>
#include <types/device.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace btbatt::report {

// Case-insensitive substring match; no filter matches everything
bool name_matches(std::string_view name, const std::optional<std::string>& filter);

// BLE devices from the GATT read, dropping raw levels outside 1-100
std::vector<Device> gatt_devices(const gatt::BatteryMap& levels,
                                 const std::optional<std::string>& filter);

// Connected classic devices with at least one valid reading, skipping
// names already reported over GATT
std::vector<Device> classic_devices(const std::vector<ClassicDevice>& classic,
                                    const std::optional<std::string>& filter,
                                    const std::vector<Device>& seen);

// GATT devices first, then classic ones not already seen by name
std::vector<Device> merge_devices(const gatt::BatteryMap& levels,
                                  const std::vector<ClassicDevice>& classic,
                                  const std::optional<std::string>& filter);

} // namespace btbatt::report
