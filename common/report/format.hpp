#pragma once

#include <types/device.hpp>
#include <string>
#include <vector>

namespace btbatt::report {

// "Keyboard: 76%" or "AirPods Pro: L:80% R:90% Case:100%"
std::string format_device(const Device& device);

// Pretty-printed JSON array, readings omitted when unavailable
std::string to_json(const std::vector<Device>& devices);

} // namespace btbatt::report
