#include "coordinator.hpp"
#include "uuids.hpp"
#include <log.hpp>

namespace btbatt::gatt {

std::string_view to_string(ManagerState state) {
    switch (state) {
        case ManagerState::Unknown: return "unknown";
        case ManagerState::PoweredOff: return "powered_off";
        case ManagerState::PoweredOn: return "powered_on";
        case ManagerState::Unauthorized: return "unauthorized";
        case ManagerState::Unsupported: return "unsupported";
    }
    return "unknown";
}

std::string_view to_string(Stage stage) {
    switch (stage) {
        case Stage::Connecting: return "connecting";
        case Stage::DiscoveringServices: return "discovering_services";
        case Stage::DiscoveringCharacteristics: return "discovering_characteristics";
        case Stage::ReadingValue: return "reading_value";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
    }
    return "unknown";
}

std::string_view to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::ConnectFailed: return "connect_failed";
        case FailureReason::ServiceDiscoveryError: return "service_discovery_error";
        case FailureReason::NoBatteryService: return "no_battery_service";
        case FailureReason::CharacteristicDiscoveryError: return "characteristic_discovery_error";
        case FailureReason::NoBatteryLevel: return "no_battery_level";
        case FailureReason::ReadError: return "read_error";
        case FailureReason::EmptyValue: return "empty_value";
    }
    return "unknown";
}

Coordinator::Coordinator(Central& central) : central_(central) {}

std::vector<PeripheralId> Coordinator::register_peripherals(
        const std::vector<PeripheralInfo>& peripherals) {
    sessions_.clear();
    results_.clear();

    std::vector<PeripheralId> ids;
    ids.reserve(peripherals.size());
    for (const auto& info : peripherals) {
        PeripheralSession session;
        session.id = sessions_.size();
        session.handle = info.handle;
        session.name = info.name;
        ids.push_back(session.id);
        sessions_.push_back(std::move(session));
    }

    pending_ = sessions_.size();
    done_ = false;
    return ids;
}

BatteryMap Coordinator::take_results() {
    BatteryMap out;
    out.swap(results_);
    return out;
}

void Coordinator::decrement_pending() {
    if (pending_ > 0) {
        --pending_;
    }
    if (pending_ == 0) {
        done_ = true;
    }
}

const PeripheralSession* Coordinator::session(PeripheralId id) const {
    return id < sessions_.size() ? &sessions_[id] : nullptr;
}

PeripheralSession* Coordinator::session_at(PeripheralId id, Stage expected, const char* event) {
    if (id >= sessions_.size()) {
        log::debug() << "gatt: " << event << " for unknown peripheral " << id;
        return nullptr;
    }
    auto& s = sessions_[id];
    if (s.stage != expected) {
        // Duplicate or late callback, e.g. a second read after the first finished
        log::debug() << "gatt: ignoring " << event << " for " << s.display_name()
                     << " in stage " << to_string(s.stage);
        return nullptr;
    }
    return &s;
}

void Coordinator::fail(PeripheralSession& session, FailureReason reason, const std::string& detail) {
    session.stage = Stage::Failed;
    session.failure = reason;
    log::warn() << "gatt: " << session.display_name() << ": " << to_string(reason)
                << (detail.empty() ? "" : ": ") << detail;
    decrement_pending();
}

void Coordinator::on_manager_state(ManagerState state) {
    log::debug() << "gatt: central manager state " << to_string(state);

    switch (state) {
        case ManagerState::PoweredOn:
            if (!started_) {
                started_ = true;
                start_discovery();
            }
            break;
        case ManagerState::Unauthorized:
        case ManagerState::Unsupported:
            log::warn() << "gatt: Bluetooth not available (" << to_string(state) << ")";
            done_ = true;
            break;
        case ManagerState::Unknown:
        case ManagerState::PoweredOff:
            // Wait for a later state change; the caller's deadline ends the run
            break;
    }
}

void Coordinator::start_discovery() {
    auto peripherals = central_.connected_peripherals(BATTERY_SERVICE_UUID);
    log::debug() << "gatt: found " << peripherals.size()
                 << " connected peripherals with Battery Service";

    if (peripherals.empty()) {
        done_ = true;
        return;
    }

    register_peripherals(peripherals);

    for (std::size_t i = 0; i < sessions_.size(); ++i) {
        std::string handle = sessions_[i].handle;
        log::debug() << "gatt: connecting to " << sessions_[i].display_name()
                     << " (" << handle << ")";
        central_.connect(i, handle);
    }
}

void Coordinator::on_connected(PeripheralId id, const std::optional<std::string>& name) {
    auto* s = session_at(id, Stage::Connecting, "connect");
    if (!s) return;

    if (name) {
        s->name = name;
    }
    log::debug() << "gatt: connected to " << s->display_name();

    s->stage = Stage::DiscoveringServices;
    std::string handle = s->handle;
    central_.discover_services(id, handle, BATTERY_SERVICE_UUID);
}

void Coordinator::on_connect_failed(PeripheralId id, const std::string& error) {
    auto* s = session_at(id, Stage::Connecting, "connect failure");
    if (!s) return;

    fail(*s, FailureReason::ConnectFailed, error);
}

void Coordinator::on_services_discovered(PeripheralId id,
                                         const std::vector<std::string>& services,
                                         const std::optional<std::string>& error) {
    auto* s = session_at(id, Stage::DiscoveringServices, "services");
    if (!s) return;

    if (error) {
        fail(*s, FailureReason::ServiceDiscoveryError, *error);
        return;
    }
    if (services.empty()) {
        fail(*s, FailureReason::NoBatteryService, {});
        return;
    }

    s->stage = Stage::DiscoveringCharacteristics;
    for (const auto& service : services) {
        log::debug() << "gatt: found service " << service;
        central_.discover_characteristics(id, service, BATTERY_LEVEL_UUID);
        if (sessions_[id].stage != Stage::DiscoveringCharacteristics) {
            break;
        }
    }
}

void Coordinator::on_characteristics_discovered(PeripheralId id, const std::string& service,
                                                const std::vector<std::string>& characteristics,
                                                const std::optional<std::string>& error) {
    auto* s = session_at(id, Stage::DiscoveringCharacteristics, "characteristics");
    if (!s) return;

    if (error) {
        fail(*s, FailureReason::CharacteristicDiscoveryError, *error);
        return;
    }
    if (characteristics.empty()) {
        fail(*s, FailureReason::NoBatteryLevel, service);
        return;
    }

    s->stage = Stage::ReadingValue;
    for (const auto& characteristic : characteristics) {
        log::debug() << "gatt: found characteristic " << characteristic;
        central_.read_value(id, characteristic);
        if (sessions_[id].stage != Stage::ReadingValue) {
            break;
        }
    }
}

void Coordinator::on_value_updated(PeripheralId id, const std::string& characteristic,
                                   const std::vector<uint8_t>& value,
                                   const std::optional<std::string>& error) {
    auto* s = session_at(id, Stage::ReadingValue, "value");
    if (!s) return;

    if (error) {
        fail(*s, FailureReason::ReadError, *error);
        return;
    }
    if (value.empty()) {
        fail(*s, FailureReason::EmptyValue, characteristic);
        return;
    }

    uint8_t level = value[0];
    std::string name = s->display_name();
    log::debug() << "gatt: read battery level " << static_cast<int>(level)
                 << " from " << name;

    auto [it, inserted] = results_.emplace(name, level);
    if (!inserted) {
        log::debug() << "gatt: keeping earlier level " << static_cast<int>(it->second)
                     << " for " << name;
    }

    s->stage = Stage::Done;
    decrement_pending();
}

} // namespace btbatt::gatt
