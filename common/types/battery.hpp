#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace btbatt {

// Battery percentage as reported to the user (1-100).
// Raw readings of 0 or above 100 mean "unavailable" and never
// produce a BatteryLevel.
class BatteryLevel {
public:
    static constexpr uint8_t MIN = 1;
    static constexpr uint8_t MAX = 100;

    static std::optional<BatteryLevel> from_raw(uint8_t raw) {
        if (raw < MIN || raw > MAX) {
            return std::nullopt;
        }
        return BatteryLevel(raw);
    }

    uint8_t percentage() const { return value_; }

    // "75%"
    std::string to_string() const { return std::to_string(value_) + "%"; }

    bool operator==(const BatteryLevel& other) const = default;

private:
    explicit BatteryLevel(uint8_t value) : value_(value) {}

    uint8_t value_;
};

// Readings for one device. Single-cell devices use `single`,
// earbuds report left/right/case separately.
struct BatteryReadings {
    std::optional<BatteryLevel> single;
    std::optional<BatteryLevel> left;
    std::optional<BatteryLevel> right;
    std::optional<BatteryLevel> case_;

    bool any() const { return single || left || right || case_; }
};

} // namespace btbatt
