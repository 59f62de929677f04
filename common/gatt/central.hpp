#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace btbatt::gatt {

// Index of a peripheral session, assigned by the Coordinator at registration
using PeripheralId = std::size_t;

enum class ManagerState {
    Unknown,
    PoweredOff,
    PoweredOn,
    Unauthorized,
    Unsupported,
};

std::string_view to_string(ManagerState state);

// Connected peripheral as reported by the platform
struct PeripheralInfo {
    std::string handle;               // opaque platform handle (BlueZ object path)
    std::optional<std::string> name;  // may not be known yet
};

// Inbound events from the platform. All of them are invoked on the thread
// that drives the EventPump (or synchronously from Central::start()).
// `error` is set when the platform reported a failure for the request.
struct Callbacks {
    std::function<void(ManagerState)> on_manager_state;
    std::function<void(PeripheralId, const std::optional<std::string>& name)> on_connected;
    std::function<void(PeripheralId, const std::string& error)> on_connect_failed;
    std::function<void(PeripheralId, const std::vector<std::string>& services,
                       const std::optional<std::string>& error)> on_services_discovered;
    std::function<void(PeripheralId, const std::string& service,
                       const std::vector<std::string>& characteristics,
                       const std::optional<std::string>& error)> on_characteristics_discovered;
    std::function<void(PeripheralId, const std::string& characteristic,
                       const std::vector<uint8_t>& value,
                       const std::optional<std::string>& error)> on_value_updated;
};

// Outbound requests to the platform's GATT central role.
// Requests never block on the remote device; completion is reported
// through Callbacks while the EventPump is advanced.
class Central {
public:
    virtual ~Central() = default;

    // Callbacks must outlive the Central or be replaced before destruction
    virtual void set_callbacks(const Callbacks* callbacks) = 0;

    // Begin reporting radio state via on_manager_state
    virtual void start() = 0;

    // Already-connected peripherals exposing `service_uuid`
    virtual std::vector<PeripheralInfo> connected_peripherals(std::string_view service_uuid) = 0;

    virtual void connect(PeripheralId id, const std::string& handle) = 0;

    virtual void discover_services(PeripheralId id, const std::string& handle,
                                   std::string_view service_uuid) = 0;

    virtual void discover_characteristics(PeripheralId id, const std::string& service,
                                          std::string_view characteristic_uuid) = 0;

    virtual void read_value(PeripheralId id, const std::string& characteristic) = 0;
};

// Cooperative run-loop primitive: lets queued platform callbacks run on the
// calling thread for at most `max`. It cannot be told to stop early.
class EventPump {
public:
    virtual ~EventPump() = default;

    virtual void advance(std::chrono::milliseconds max) = 0;
};

} // namespace btbatt::gatt
