#pragma once

#include "central.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace btbatt::gatt {

enum class Stage {
    Connecting,
    DiscoveringServices,
    DiscoveringCharacteristics,
    ReadingValue,
    Done,
    Failed,
};

enum class FailureReason {
    None,
    ConnectFailed,
    ServiceDiscoveryError,
    NoBatteryService,
    CharacteristicDiscoveryError,
    NoBatteryLevel,
    ReadError,
    EmptyValue,
};

std::string_view to_string(Stage stage);
std::string_view to_string(FailureReason reason);

struct PeripheralSession {
    PeripheralId id = 0;
    std::string handle;
    std::optional<std::string> name;

    Stage stage = Stage::Connecting;
    FailureReason failure = FailureReason::None;

    bool is_terminal() const { return stage == Stage::Done || stage == Stage::Failed; }

    // Name used as the result key
    std::string display_name() const { return name.value_or("Unknown"); }
};

} // namespace btbatt::gatt
