#pragma once

#include "central.hpp"
#include "coordinator.hpp"
#include <chrono>
#include <functional>

namespace btbatt::gatt {

// Upper bound for one discovery run
constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_TIMEOUT{2000};

// Time given to the event pump per iteration
constexpr std::chrono::milliseconds PUMP_SLICE{100};

struct DiscoveryOptions {
    std::chrono::milliseconds timeout = DEFAULT_DISCOVERY_TIMEOUT;
    std::chrono::milliseconds slice = PUMP_SLICE;
};

// Monotonic time source, steady_clock::now when empty
using Clock = std::function<std::chrono::steady_clock::time_point()>;

// Read the Battery Level of every connected peripheral that exposes the
// Battery Service. Never fails: an unavailable radio, a denied permission
// or a timeout all yield whatever was collected so far (possibly nothing).
BatteryMap discover_battery_levels(Central& central, EventPump& pump,
                                   const DiscoveryOptions& options = {},
                                   const Clock& now = {});

// Same, with a caller-owned Coordinator so its final state can be inspected
BatteryMap run_discovery(Coordinator& coordinator, Central& central, EventPump& pump,
                         const DiscoveryOptions& options = {}, const Clock& now = {});

} // namespace btbatt::gatt
