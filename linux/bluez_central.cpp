#include "bluez_central.hpp"
#include "dbus.hpp"
#include <log.hpp>

#include <algorithm>
#include <cstring>

namespace bluez {

using btbatt::gatt::ManagerState;
using btbatt::gatt::PeripheralId;
using btbatt::gatt::PeripheralInfo;

// Device1.Connect may page the remote device
constexpr int CONNECT_TIMEOUT_MS = 10000;

constexpr const char* PROPERTIES_CHANGED_MATCH =
    "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged'";

static DBusHandlerResult signal_filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    auto* central = static_cast<BluezCentral*>(data);

    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL) {
        if (central->handle_signal(msg)) {
            return DBUS_HANDLER_RESULT_HANDLED;
        }
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// "Already connected" style errors are success for our purposes
static bool is_already_error(const char* name, const char* message) {
    if (name && strcmp(name, "org.bluez.Error.AlreadyConnected") == 0) return true;
    return message && (strstr(message, "Already") || strstr(message, "already"));
}

BluezCentral::BluezCentral(DBusConnection* conn) : conn_(conn) {}

BluezCentral::~BluezCentral() {
    // Replies that never came are abandoned; cancelling releases their Request
    for (DBusPendingCall* pending : in_flight_) {
        dbus_pending_call_cancel(pending);
        dbus_pending_call_unref(pending);
    }
    in_flight_.clear();

    if (filter_installed_) {
        dbus_connection_remove_filter(conn_, signal_filter, this);
        remove_signal_match();
    }
}

void BluezCentral::set_callbacks(const btbatt::gatt::Callbacks* callbacks) {
    callbacks_ = callbacks;
}

void BluezCentral::add_signal_match() {
    DBusError err;
    dbus_error_init(&err);

    // Device1.ServicesResolved / Connected and Adapter1.Powered changes
    dbus_bus_add_match(conn_, PROPERTIES_CHANGED_MATCH, &err);
    if (dbus_error_is_set(&err)) {
        btbatt::log::warn() << "bluez: failed to add PropertiesChanged match: " << err.message;
        dbus_error_free(&err);
    }
}

void BluezCentral::remove_signal_match() {
    dbus_bus_remove_match(conn_, PROPERTIES_CHANGED_MATCH, nullptr);
}

void BluezCentral::start() {
    auto report = [this](ManagerState state) {
        if (callbacks_ && callbacks_->on_manager_state) {
            callbacks_->on_manager_state(state);
        }
    };

    if (!conn_) {
        report(ManagerState::Unsupported);
        return;
    }

    if (!dbus_bus_name_has_owner(conn_, SERVICE, nullptr)) {
        btbatt::log::warn() << "bluez: bluetoothd is not running";
        report(ManagerState::Unsupported);
        return;
    }

    auto adapter = get_adapter_path(conn_);
    if (!adapter) {
        btbatt::log::warn() << "bluez: no adapter found";
        report(ManagerState::Unsupported);
        return;
    }
    adapter_path_ = *adapter;

    if (!filter_installed_) {
        add_signal_match();
        dbus_connection_add_filter(conn_, signal_filter, this, nullptr);
        filter_installed_ = true;
    }

    auto powered = dbus::get_property(conn_, SERVICE, adapter_path_.c_str(), ADAPTER_IFACE, "Powered");
    if (!powered.ok()) {
        btbatt::log::warn() << "bluez: reading " << adapter_path_ << " Powered failed: "
                            << powered.error_message;
        report(powered.error_name == DBUS_ERROR_ACCESS_DENIED ? ManagerState::Unauthorized
                                                               : ManagerState::Unknown);
        return;
    }

    bool on = false;
    DBusMessageIter iter;
    if (dbus_message_iter_init(powered.reply, &iter)) {
        on = dbus::read_bool(&iter).value_or(false);
    }
    powered.release();

    btbatt::log::debug() << "bluez: adapter " << adapter_path_ << (on ? " powered on" : " powered off");
    report(on ? ManagerState::PoweredOn : ManagerState::PoweredOff);
}

std::vector<PeripheralInfo> BluezCentral::connected_peripherals(std::string_view service_uuid) {
    std::vector<PeripheralInfo> result;

    auto objects = get_managed_objects(conn_);
    if (!objects) {
        return result;
    }

    for (const auto& dev : objects->devices) {
        if (!dev.connected) {
            continue;
        }
        bool has_service = std::any_of(dev.uuids.begin(), dev.uuids.end(),
            [&](const std::string& u) { return uuid_equals(u, service_uuid); });
        if (!has_service) {
            continue;
        }

        btbatt::log::debug() << "bluez: " << dev.path << " exposes " << service_uuid;
        result.push_back({dev.path, dev.display_name()});
    }
    return result;
}

void BluezCentral::connect(PeripheralId id, const std::string& handle) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, handle.c_str(), DEVICE_IFACE, "Connect");

    auto req = std::make_unique<Request>();
    req->kind = RequestKind::Connect;
    req->id = id;
    req->path = handle;

    if (!msg) {
        fail_request(*req, "out of memory");
        return;
    }
    send_async(msg, CONNECT_TIMEOUT_MS, std::move(req));
}

void BluezCentral::discover_services(PeripheralId id, const std::string& handle,
                                     std::string_view service_uuid) {
    request_objects(RequestKind::Services, id, handle, service_uuid);
}

void BluezCentral::discover_characteristics(PeripheralId id, const std::string& service,
                                            std::string_view characteristic_uuid) {
    request_objects(RequestKind::Characteristics, id, service, characteristic_uuid);
}

void BluezCentral::read_value(PeripheralId id, const std::string& characteristic) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, characteristic.c_str(),
        GATT_CHARACTERISTIC_IFACE, "ReadValue");

    auto req = std::make_unique<Request>();
    req->kind = RequestKind::Read;
    req->id = id;
    req->path = characteristic;

    if (!msg) {
        fail_request(*req, "out of memory");
        return;
    }

    // ReadValue(a{sv} options), no options
    DBusMessageIter iter, options;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &options);
    dbus_message_iter_close_container(&iter, &options);

    send_async(msg, dbus::CALL_TIMEOUT_MS, std::move(req));
}

void BluezCentral::request_objects(RequestKind kind, PeripheralId id,
                                   const std::string& path, std::string_view uuid) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");

    auto req = std::make_unique<Request>();
    req->kind = kind;
    req->id = id;
    req->path = path;
    req->uuid = std::string(uuid);

    if (!msg) {
        fail_request(*req, "out of memory");
        return;
    }
    send_async(msg, dbus::CALL_TIMEOUT_MS, std::move(req));
}

void BluezCentral::send_async(DBusMessage* msg, int timeout_ms, std::unique_ptr<Request> req) {
    req->self = this;

    if (!conn_) {
        dbus_message_unref(msg);
        fail_request(*req, "not connected");
        return;
    }

    DBusPendingCall* pending = nullptr;
    bool sent = dbus_connection_send_with_reply(conn_, msg, &pending, timeout_ms);
    dbus_message_unref(msg);

    if (!sent || !pending) {
        fail_request(*req, "failed to send request");
        return;
    }

    Request* data = req.release();
    if (!dbus_pending_call_set_notify(pending, on_reply, data, free_request)) {
        std::unique_ptr<Request> owned(data);
        dbus_pending_call_cancel(pending);
        dbus_pending_call_unref(pending);
        fail_request(*owned, "out of memory");
        return;
    }

    in_flight_.push_back(pending);
}

void BluezCentral::free_request(void* data) {
    delete static_cast<Request*>(data);
}

void BluezCentral::on_reply(DBusPendingCall* pending, void* data) {
    // Copy: the Request is freed together with the pending call
    Request req = *static_cast<Request*>(data);
    BluezCentral* self = req.self;

    DBusMessage* reply = dbus_pending_call_steal_reply(pending);

    auto& calls = self->in_flight_;
    calls.erase(std::remove(calls.begin(), calls.end(), pending), calls.end());
    dbus_pending_call_unref(pending);

    if (!reply) {
        self->fail_request(req, "no reply");
        return;
    }
    self->handle_reply(req, reply);
    dbus_message_unref(reply);
}

void BluezCentral::handle_reply(const Request& req, DBusMessage* reply) {
    if (dbus_message_get_type(reply) == DBUS_MESSAGE_TYPE_ERROR) {
        DBusError err;
        dbus_error_init(&err);
        dbus_set_error_from_message(&err, reply);

        bool already = req.kind == RequestKind::Connect && is_already_error(err.name, err.message);
        std::string error = std::string(err.name ? err.name : "error") + ": " +
                            (err.message ? err.message : "");
        dbus_error_free(&err);

        if (!already) {
            fail_request(req, error);
            return;
        }
    }

    if (!callbacks_) {
        return;
    }

    switch (req.kind) {
        case RequestKind::Connect: {
            auto name = dbus::get_string_property(conn_, req.path.c_str(), DEVICE_IFACE, "Name");
            if (!name) {
                name = dbus::get_string_property(conn_, req.path.c_str(), DEVICE_IFACE, "Alias");
            }
            if (callbacks_->on_connected) {
                callbacks_->on_connected(req.id, name);
            }
            break;
        }

        case RequestKind::Services:
        case RequestKind::Characteristics: {
            auto objects = parse_managed_objects(reply);
            if (!objects) {
                fail_request(req, "invalid GetManagedObjects reply");
                return;
            }
            handle_objects(req, *objects);
            break;
        }

        case RequestKind::Read: {
            std::vector<uint8_t> value;
            DBusMessageIter iter;
            if (dbus_message_iter_init(reply, &iter)) {
                value = dbus::read_byte_array(&iter);
            }
            if (callbacks_->on_value_updated) {
                callbacks_->on_value_updated(req.id, req.path, value, std::nullopt);
            }
            break;
        }
    }
}

void BluezCentral::handle_objects(const Request& req, const ManagedObjects& objects) {
    if (req.kind == RequestKind::Characteristics) {
        auto characteristics = find_characteristics(objects, req.path, req.uuid);
        if (callbacks_->on_characteristics_discovered) {
            callbacks_->on_characteristics_discovered(req.id, req.path, characteristics, std::nullopt);
        }
        return;
    }

    const DeviceInfo* device = objects.find_device(req.path);
    if (!device) {
        fail_request(req, "device " + req.path + " not found");
        return;
    }
    if (!device->connected) {
        fail_request(req, "device " + req.path + " disconnected");
        return;
    }

    if (!device->services_resolved) {
        // bluetoothd is still walking the GATT database
        btbatt::log::debug() << "bluez: waiting for services of " << req.path;
        awaiting_resolve_.push_back(req);
        return;
    }

    auto services = find_services(objects, req.path, req.uuid);
    if (services.empty()) {
        bool advertised = std::any_of(device->uuids.begin(), device->uuids.end(),
            [&](const std::string& u) { return uuid_equals(u, req.uuid); });
        if (advertised) {
            // bluetoothd's battery plugin claims 180F and gatt-client does not export it
            btbatt::log::debug() << "bluez: " << req.path << " lists " << req.uuid
                                 << " but no GattService1 is exported; its level is only"
                                 << " available through " << BATTERY_IFACE;
        }
    }
    if (callbacks_->on_services_discovered) {
        callbacks_->on_services_discovered(req.id, services, std::nullopt);
    }
}

void BluezCentral::fail_request(const Request& req, const std::string& error) {
    btbatt::log::debug() << "bluez: request for " << req.path << " failed: " << error;

    if (!callbacks_) {
        return;
    }

    switch (req.kind) {
        case RequestKind::Connect:
            if (callbacks_->on_connect_failed) {
                callbacks_->on_connect_failed(req.id, error);
            }
            break;
        case RequestKind::Services:
            if (callbacks_->on_services_discovered) {
                callbacks_->on_services_discovered(req.id, {}, error);
            }
            break;
        case RequestKind::Characteristics:
            if (callbacks_->on_characteristics_discovered) {
                callbacks_->on_characteristics_discovered(req.id, req.path, {}, error);
            }
            break;
        case RequestKind::Read:
            if (callbacks_->on_value_updated) {
                callbacks_->on_value_updated(req.id, req.path, {}, error);
            }
            break;
    }
}

void BluezCentral::on_services_resolved(const std::string& device_path, bool resolved) {
    if (!resolved) {
        return;
    }

    std::vector<Request> ready;
    auto it = std::partition(awaiting_resolve_.begin(), awaiting_resolve_.end(),
        [&](const Request& r) { return r.path != device_path; });
    ready.assign(std::make_move_iterator(it), std::make_move_iterator(awaiting_resolve_.end()));
    awaiting_resolve_.erase(it, awaiting_resolve_.end());

    for (const auto& req : ready) {
        btbatt::log::debug() << "bluez: services resolved for " << device_path;
        request_objects(RequestKind::Services, req.id, req.path, req.uuid);
    }
}

void BluezCentral::on_device_disconnected(const std::string& device_path) {
    std::vector<Request> dropped;
    auto it = std::partition(awaiting_resolve_.begin(), awaiting_resolve_.end(),
        [&](const Request& r) { return r.path != device_path; });
    dropped.assign(std::make_move_iterator(it), std::make_move_iterator(awaiting_resolve_.end()));
    awaiting_resolve_.erase(it, awaiting_resolve_.end());

    for (const auto& req : dropped) {
        fail_request(req, "device " + device_path + " disconnected");
    }
}

bool BluezCentral::handle_signal(DBusMessage* msg) {
    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* obj_path = dbus_message_get_path(msg);

    if (!iface || !member || !obj_path) return false;
    if (strcmp(iface, "org.freedesktop.DBus.Properties") != 0 ||
        strcmp(member, "PropertiesChanged") != 0) {
        return false;
    }

    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return false;

    // First arg: interface name
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return false;
    const char* changed_iface;
    dbus_message_iter_get_basic(&iter, &changed_iface);

    bool is_device = strcmp(changed_iface, DEVICE_IFACE) == 0;
    bool is_adapter = strcmp(changed_iface, ADAPTER_IFACE) == 0 && adapter_path_ == obj_path;
    if (!is_device && !is_adapter) return false;

    // Second arg: changed properties dict
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return false;

    DBusMessageIter props;
    dbus_message_iter_recurse(&iter, &props);

    std::string path(obj_path);
    while (dbus_message_iter_get_arg_type(&props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry;
        dbus_message_iter_recurse(&props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        auto value = dbus::read_bool(&prop_entry);
        if (value) {
            if (is_device && strcmp(prop_name, "ServicesResolved") == 0) {
                on_services_resolved(path, *value);
            } else if (is_device && strcmp(prop_name, "Connected") == 0 && !*value) {
                on_device_disconnected(path);
            } else if (is_adapter && strcmp(prop_name, "Powered") == 0) {
                if (callbacks_ && callbacks_->on_manager_state) {
                    callbacks_->on_manager_state(*value ? ManagerState::PoweredOn
                                                        : ManagerState::PoweredOff);
                }
            }
        }
        dbus_message_iter_next(&props);
    }
    return true;
}

} // namespace bluez
