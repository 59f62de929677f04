#pragma once

#include "bluez.hpp"
#include <gatt/central.hpp>
#include <dbus/dbus.h>
#include <memory>
#include <string>
#include <vector>

namespace bluez {

// GATT central over the BlueZ D-Bus API. Requests are sent as async method
// calls; replies and PropertiesChanged signals are turned into Callbacks
// when the connection is dispatched (see dbus::Pump).
class BluezCentral : public btbatt::gatt::Central {
public:
    explicit BluezCentral(DBusConnection* conn);
    ~BluezCentral() override;

    BluezCentral(const BluezCentral&) = delete;
    BluezCentral& operator=(const BluezCentral&) = delete;

    void set_callbacks(const btbatt::gatt::Callbacks* callbacks) override;
    void start() override;

    std::vector<btbatt::gatt::PeripheralInfo> connected_peripherals(std::string_view service_uuid) override;

    void connect(btbatt::gatt::PeripheralId id, const std::string& handle) override;
    void discover_services(btbatt::gatt::PeripheralId id, const std::string& handle,
                           std::string_view service_uuid) override;
    void discover_characteristics(btbatt::gatt::PeripheralId id, const std::string& service,
                                  std::string_view characteristic_uuid) override;
    void read_value(btbatt::gatt::PeripheralId id, const std::string& characteristic) override;

    // Process a D-Bus signal, returns true if it was handled
    bool handle_signal(DBusMessage* msg);

protected:
    enum class RequestKind {
        Connect,
        Services,
        Characteristics,
        Read,
    };

    struct Request {
        BluezCentral* self = nullptr;
        RequestKind kind = RequestKind::Connect;
        btbatt::gatt::PeripheralId id = 0;
        std::string path;   // device, service or characteristic
        std::string uuid;   // filter for discovery requests
    };

    // Sends `msg` (consumed) and routes the reply to handle_reply
    virtual void send_async(DBusMessage* msg, int timeout_ms, std::unique_ptr<Request> req);

    // Turns a method return or error reply into Callbacks
    void handle_reply(const Request& req, DBusMessage* reply);

    // Adapter whose Powered changes are reported, set by start()
    std::string adapter_path_;

private:
    static void on_reply(DBusPendingCall* pending, void* data);
    static void free_request(void* data);

    void request_objects(RequestKind kind, btbatt::gatt::PeripheralId id,
                         const std::string& path, std::string_view uuid);

    void handle_objects(const Request& req, const ManagedObjects& objects);
    void fail_request(const Request& req, const std::string& error);

    void on_services_resolved(const std::string& device_path, bool resolved);
    void on_device_disconnected(const std::string& device_path);

    void add_signal_match();
    void remove_signal_match();

    DBusConnection* conn_;
    const btbatt::gatt::Callbacks* callbacks_ = nullptr;
    bool filter_installed_ = false;

    std::vector<DBusPendingCall*> in_flight_;

    // Service discovery waiting for Device1.ServicesResolved
    std::vector<Request> awaiting_resolve_;
};

} // namespace bluez
