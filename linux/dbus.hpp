#pragma once

#include <gatt/central.hpp>
#include <dbus/dbus.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dbus {

// Default timeout for blocking calls to bluetoothd
constexpr int CALL_TIMEOUT_MS = 5000;

// Timeout for a single property Get
constexpr int PROPERTY_TIMEOUT_MS = 2000;

// Connect to the system bus, nullptr on failure (error is logged).
// The connection is shared; release it with dbus_connection_unref.
DBusConnection* connect_system_bus();

// Get file descriptor for polling, -1 if unavailable
int get_fd(DBusConnection* conn);

// Dispatch every message already read from the socket
void dispatch_pending(DBusConnection* conn);

// Event pump over one D-Bus connection: waits on the bus fd for at most
// the slice, then dispatches everything that arrived. Pending-call replies
// and filters run on the calling thread.
class Pump : public btbatt::gatt::EventPump {
public:
    explicit Pump(DBusConnection* conn) : conn_(conn) {}

    void advance(std::chrono::milliseconds max) override;

private:
    DBusConnection* conn_;
};

// Variant/basic readers. Each accepts an iterator positioned on a value
// (variants are unwrapped) and returns nullopt on type mismatch.
std::optional<std::string> read_string(DBusMessageIter* iter);
std::optional<bool> read_bool(DBusMessageIter* iter);
std::optional<uint8_t> read_byte(DBusMessageIter* iter);
std::vector<std::string> read_string_array(DBusMessageIter* iter);
std::vector<uint8_t> read_byte_array(DBusMessageIter* iter);

// Result of a property Get. error_name is set when the call failed.
struct PropertyReply {
    DBusMessage* reply = nullptr;  // owned, unref with release()
    std::string error_name;
    std::string error_message;

    bool ok() const { return reply != nullptr; }
    void release();
};

// Blocking org.freedesktop.DBus.Properties.Get
PropertyReply get_property(DBusConnection* conn, const char* dest, const char* path,
                           const char* iface, const char* prop);

std::optional<std::string> get_string_property(DBusConnection* conn, const char* path,
                                               const char* iface, const char* prop);

} // namespace dbus
