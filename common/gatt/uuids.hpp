#pragma once

namespace btbatt::gatt {

// Battery Service (0x180F)
constexpr const char* BATTERY_SERVICE_UUID = "180F";

// Battery Level characteristic (0x2A19), one byte, percent
constexpr const char* BATTERY_LEVEL_UUID = "2A19";

} // namespace btbatt::gatt
