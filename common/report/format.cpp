#include "format.hpp"
#include <nlohmann/json.hpp>

namespace btbatt::report {

std::string format_device(const Device& device) {
    const auto& b = device.battery;
    if (b.single) {
        return device.name + ": " + b.single->to_string();
    }

    std::string parts;
    auto append = [&parts](const char* label, const std::optional<BatteryLevel>& level) {
        if (!level) return;
        if (!parts.empty()) parts += ' ';
        parts += label;
        parts += level->to_string();
    };
    append("L:", b.left);
    append("R:", b.right);
    append("Case:", b.case_);

    return device.name + ": " + parts;
}

static nlohmann::ordered_json device_to_json(const Device& device) {
    nlohmann::ordered_json j;
    j["name"] = device.name;
    j["address"] = device.address.to_string();

    const auto& b = device.battery;
    if (b.single) j["battery_level"] = b.single->percentage();
    if (b.left) j["battery_left"] = b.left->percentage();
    if (b.right) j["battery_right"] = b.right->percentage();
    if (b.case_) j["battery_case"] = b.case_->percentage();
    return j;
}

std::string to_json(const std::vector<Device>& devices) {
    auto out = nlohmann::ordered_json::array();
    for (const auto& d : devices) {
        out.push_back(device_to_json(d));
    }
    return out.dump(2);
}

} // namespace btbatt::report
