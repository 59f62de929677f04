#pragma once

#include <types/device.hpp>
#include <dbus/dbus.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bluez {

constexpr const char* SERVICE = "org.bluez";
constexpr const char* ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_IFACE = "org.bluez.Device1";
constexpr const char* BATTERY_IFACE = "org.bluez.Battery1";
constexpr const char* GATT_SERVICE_IFACE = "org.bluez.GattService1";
constexpr const char* GATT_CHARACTERISTIC_IFACE = "org.bluez.GattCharacteristic1";

// org.bluez.Device1 (+ org.bluez.Battery1 on the same object)
struct DeviceInfo {
    std::string path;       // D-Bus object path
    std::string address;    // MAC address
    std::optional<std::string> name;
    std::optional<std::string> alias;
    bool connected = false;
    bool paired = false;
    bool services_resolved = false;
    std::vector<std::string> uuids;
    std::optional<uint8_t> battery_percentage;

    // Name, falling back to the alias bluetoothd derives
    std::optional<std::string> display_name() const { return name ? name : alias; }
};

struct GattServiceInfo {
    std::string path;
    std::string uuid;
    std::string device;     // owning device path
};

struct GattCharacteristicInfo {
    std::string path;
    std::string uuid;
    std::string service;    // owning service path
};

// Snapshot of ObjectManager.GetManagedObjects
struct ManagedObjects {
    std::vector<std::string> adapters;
    std::vector<DeviceInfo> devices;
    std::vector<GattServiceInfo> services;
    std::vector<GattCharacteristicInfo> characteristics;

    const DeviceInfo* find_device(std::string_view path) const;
};

// Parse a GetManagedObjects reply (a{oa{sa{sv}}})
std::optional<ManagedObjects> parse_managed_objects(DBusMessage* reply);

// Blocking GetManagedObjects
std::optional<ManagedObjects> get_managed_objects(DBusConnection* conn);

// Get adapter path (usually /org/bluez/hci0)
std::optional<std::string> get_adapter_path(DBusConnection* conn);

// Expand a 16-bit UUID ("180F") onto the Bluetooth base UUID, lower case.
// Full 128-bit UUIDs are returned lower-cased.
std::string expand_uuid(std::string_view uuid);

// Case-insensitive 128-bit comparison after expansion
bool uuid_equals(std::string_view a, std::string_view b);

// Services of `device_path` with the given UUID
std::vector<std::string> find_services(const ManagedObjects& objects,
                                       std::string_view device_path, std::string_view uuid);

// Characteristics of `service_path` with the given UUID
std::vector<std::string> find_characteristics(const ManagedObjects& objects,
                                              std::string_view service_path, std::string_view uuid);

// Paired devices (connected or not) as classic battery records
std::vector<btbatt::ClassicDevice> classic_devices(const ManagedObjects& objects);

// Same, read from bluetoothd. Empty on any error.
std::vector<btbatt::ClassicDevice> find_paired_devices(DBusConnection* conn);

} // namespace bluez
