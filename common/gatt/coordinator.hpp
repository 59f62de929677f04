#pragma once

#include "central.hpp"
#include "session.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace btbatt::gatt {

// Device name -> raw Battery Level byte (not range checked)
using BatteryMap = std::map<std::string, uint8_t>;

// Drives one discovery run: one PeripheralSession per connected
// peripheral, each walking connect -> services -> characteristics -> read.
//
// Not thread safe. Every on_* handler must be called on the thread that
// advances the EventPump.
class Coordinator {
public:
    explicit Coordinator(Central& central);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Create one session per peripheral (ids are their indices),
    // seed pending with the count and clear done
    std::vector<PeripheralId> register_peripherals(const std::vector<PeripheralInfo>& peripherals);

    bool is_done() const { return done_; }
    std::size_t pending() const { return pending_; }

    // Hands over the collected levels; a second call returns an empty map
    BatteryMap take_results();

    // Clamped at zero; the only place a peripheral completion sets done
    void decrement_pending();

    const PeripheralSession* session(PeripheralId id) const;
    const std::vector<PeripheralSession>& sessions() const { return sessions_; }

    // Protocol events
    void on_manager_state(ManagerState state);
    void on_connected(PeripheralId id, const std::optional<std::string>& name);
    void on_connect_failed(PeripheralId id, const std::string& error);
    void on_services_discovered(PeripheralId id, const std::vector<std::string>& services,
                                const std::optional<std::string>& error);
    void on_characteristics_discovered(PeripheralId id, const std::string& service,
                                       const std::vector<std::string>& characteristics,
                                       const std::optional<std::string>& error);
    void on_value_updated(PeripheralId id, const std::string& characteristic,
                          const std::vector<uint8_t>& value,
                          const std::optional<std::string>& error);

private:
    // Session in `expected` stage, or nullptr (late or unknown callback)
    PeripheralSession* session_at(PeripheralId id, Stage expected, const char* event);

    void fail(PeripheralSession& session, FailureReason reason, const std::string& detail);
    void start_discovery();

    Central& central_;
    std::vector<PeripheralSession> sessions_;
    std::size_t pending_ = 0;
    bool done_ = false;
    bool started_ = false;
    BatteryMap results_;
};

} // namespace btbatt::gatt
