#include "controller.hpp"
#include <log.hpp>

namespace btbatt::gatt {

BatteryMap discover_battery_levels(Central& central, EventPump& pump,
                                   const DiscoveryOptions& options, const Clock& now) {
    Coordinator coordinator(central);
    return run_discovery(coordinator, central, pump, options, now);
}

BatteryMap run_discovery(Coordinator& coordinator, Central& central, EventPump& pump,
                         const DiscoveryOptions& options, const Clock& now) {
    using namespace std::chrono;

    auto clock = now ? now : Clock([] { return steady_clock::now(); });

    Callbacks callbacks;
    callbacks.on_manager_state = [&](ManagerState state) {
        coordinator.on_manager_state(state);
    };
    callbacks.on_connected = [&](PeripheralId id, const std::optional<std::string>& name) {
        coordinator.on_connected(id, name);
    };
    callbacks.on_connect_failed = [&](PeripheralId id, const std::string& error) {
        coordinator.on_connect_failed(id, error);
    };
    callbacks.on_services_discovered = [&](PeripheralId id,
                                           const std::vector<std::string>& services,
                                           const std::optional<std::string>& error) {
        coordinator.on_services_discovered(id, services, error);
    };
    callbacks.on_characteristics_discovered = [&](PeripheralId id, const std::string& service,
                                                  const std::vector<std::string>& characteristics,
                                                  const std::optional<std::string>& error) {
        coordinator.on_characteristics_discovered(id, service, characteristics, error);
    };
    callbacks.on_value_updated = [&](PeripheralId id, const std::string& characteristic,
                                     const std::vector<uint8_t>& value,
                                     const std::optional<std::string>& error) {
        coordinator.on_value_updated(id, characteristic, value, error);
    };

    central.set_callbacks(&callbacks);

    const auto start = clock();
    central.start();

    while (!coordinator.is_done() && clock() - start < options.timeout) {
        pump.advance(options.slice);
    }

    if (!coordinator.is_done()) {
        auto elapsed = duration_cast<milliseconds>(clock() - start);
        log::warn() << "gatt: timeout waiting for battery levels after " << elapsed.count()
                    << "ms (" << coordinator.pending() << " pending)";
    }

    // Replies still in flight are dropped from here on
    central.set_callbacks(nullptr);

    return coordinator.take_results();
}

} // namespace btbatt::gatt
