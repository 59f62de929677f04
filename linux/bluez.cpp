#include "bluez.hpp"
#include "dbus.hpp"
#include <log.hpp>

#include <bluetooth/bluetooth.h>
#include <bluetooth/sdp.h>
#include <bluetooth/sdp_lib.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace bluez {

const DeviceInfo* ManagedObjects::find_device(std::string_view path) const {
    for (const auto& d : devices) {
        if (d.path == path) return &d;
    }
    return nullptr;
}

static void parse_device_props(DBusMessageIter* props, DeviceInfo* info) {
    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (strcmp(prop_name, "Address") == 0) {
            info->address = dbus::read_string(&prop_entry).value_or("");
        } else if (strcmp(prop_name, "Name") == 0) {
            info->name = dbus::read_string(&prop_entry);
        } else if (strcmp(prop_name, "Alias") == 0) {
            info->alias = dbus::read_string(&prop_entry);
        } else if (strcmp(prop_name, "Connected") == 0) {
            info->connected = dbus::read_bool(&prop_entry).value_or(false);
        } else if (strcmp(prop_name, "Paired") == 0) {
            info->paired = dbus::read_bool(&prop_entry).value_or(false);
        } else if (strcmp(prop_name, "ServicesResolved") == 0) {
            info->services_resolved = dbus::read_bool(&prop_entry).value_or(false);
        } else if (strcmp(prop_name, "UUIDs") == 0) {
            info->uuids = dbus::read_string_array(&prop_entry);
        }
        dbus_message_iter_next(props);
    }
}

// Reads the UUID and the owner path (`owner_prop`) of a GATT object
static void parse_gatt_props(DBusMessageIter* props, const char* owner_prop,
                             std::string* uuid, std::string* owner) {
    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (strcmp(prop_name, "UUID") == 0) {
            *uuid = dbus::read_string(&prop_entry).value_or("");
        } else if (strcmp(prop_name, owner_prop) == 0) {
            *owner = dbus::read_string(&prop_entry).value_or("");
        }
        dbus_message_iter_next(props);
    }
}

static std::optional<uint8_t> parse_battery_percentage(DBusMessageIter* props) {
    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (strcmp(prop_name, "Percentage") == 0) {
            return dbus::read_byte(&prop_entry);
        }
        dbus_message_iter_next(props);
    }
    return std::nullopt;
}

std::optional<ManagedObjects> parse_managed_objects(DBusMessage* reply) {
    DBusMessageIter iter, dict;
    if (!reply || !dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return std::nullopt;
    }

    ManagedObjects objects;
    dbus_message_iter_recurse(&iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, ifaces;
        dbus_message_iter_recurse(&dict, &entry);

        const char* obj_path;
        dbus_message_iter_get_basic(&entry, &obj_path);
        dbus_message_iter_next(&entry);

        if (dbus_message_iter_get_arg_type(&entry) != DBUS_TYPE_ARRAY) {
            dbus_message_iter_next(&dict);
            continue;
        }
        dbus_message_iter_recurse(&entry, &ifaces);

        std::optional<DeviceInfo> device;
        std::optional<uint8_t> battery;

        while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
            DBusMessageIter iface_entry, props;
            dbus_message_iter_recurse(&ifaces, &iface_entry);

            const char* iface_name;
            dbus_message_iter_get_basic(&iface_entry, &iface_name);
            dbus_message_iter_next(&iface_entry);

            if (dbus_message_iter_get_arg_type(&iface_entry) != DBUS_TYPE_ARRAY) {
                dbus_message_iter_next(&ifaces);
                continue;
            }
            dbus_message_iter_recurse(&iface_entry, &props);

            if (strcmp(iface_name, ADAPTER_IFACE) == 0) {
                objects.adapters.emplace_back(obj_path);
            } else if (strcmp(iface_name, DEVICE_IFACE) == 0) {
                device.emplace();
                device->path = obj_path;
                parse_device_props(&props, &*device);
            } else if (strcmp(iface_name, BATTERY_IFACE) == 0) {
                battery = parse_battery_percentage(&props);
            } else if (strcmp(iface_name, GATT_SERVICE_IFACE) == 0) {
                GattServiceInfo svc;
                svc.path = obj_path;
                parse_gatt_props(&props, "Device", &svc.uuid, &svc.device);
                objects.services.push_back(std::move(svc));
            } else if (strcmp(iface_name, GATT_CHARACTERISTIC_IFACE) == 0) {
                GattCharacteristicInfo chr;
                chr.path = obj_path;
                parse_gatt_props(&props, "Service", &chr.uuid, &chr.service);
                objects.characteristics.push_back(std::move(chr));
            }
            dbus_message_iter_next(&ifaces);
        }

        if (device) {
            device->battery_percentage = battery;
            objects.devices.push_back(std::move(*device));
        }
        dbus_message_iter_next(&dict);
    }

    return objects;
}

std::optional<ManagedObjects> get_managed_objects(DBusConnection* conn) {
    if (!conn) return std::nullopt;

    DBusMessage* msg = dbus_message_new_method_call(SERVICE, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) return std::nullopt;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, dbus::CALL_TIMEOUT_MS, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        btbatt::log::warn() << "bluez: GetManagedObjects failed: " << err.message;
        dbus_error_free(&err);
        return std::nullopt;
    }

    auto objects = parse_managed_objects(reply);
    if (reply) dbus_message_unref(reply);
    return objects;
}

std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    auto objects = get_managed_objects(conn);
    if (!objects || objects->adapters.empty()) {
        return std::nullopt;
    }
    return objects->adapters.front();
}

static std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool parse_hex(std::string_view s, uint32_t* value) {
    uint32_t v = 0;
    for (char c : s) {
        v <<= 4;
        if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    *value = v;
    return true;
}

std::string expand_uuid(std::string_view uuid) {
    if (uuid.size() != 4 && uuid.size() != 8) {
        return lower(uuid);
    }

    uint32_t value;
    if (!parse_hex(uuid, &value)) {
        return lower(uuid);
    }

    uuid_t short_uuid, full_uuid;
    if (uuid.size() == 4) {
        sdp_uuid16_create(&short_uuid, static_cast<uint16_t>(value));
        sdp_uuid16_to_uuid128(&full_uuid, &short_uuid);
    } else {
        sdp_uuid32_create(&short_uuid, value);
        sdp_uuid32_to_uuid128(&full_uuid, &short_uuid);
    }

    char buf[64] = {};
    if (sdp_uuid2strn(&full_uuid, buf, sizeof(buf)) != 0) {
        return lower(uuid);
    }
    return lower(buf);
}

bool uuid_equals(std::string_view a, std::string_view b) {
    return expand_uuid(a) == expand_uuid(b);
}

std::vector<std::string> find_services(const ManagedObjects& objects,
                                       std::string_view device_path, std::string_view uuid) {
    std::vector<std::string> result;
    for (const auto& svc : objects.services) {
        if (svc.device == device_path && uuid_equals(svc.uuid, uuid)) {
            result.push_back(svc.path);
        }
    }
    return result;
}

std::vector<std::string> find_characteristics(const ManagedObjects& objects,
                                              std::string_view service_path, std::string_view uuid) {
    std::vector<std::string> result;
    for (const auto& chr : objects.characteristics) {
        if (chr.service == service_path && uuid_equals(chr.uuid, uuid)) {
            result.push_back(chr.path);
        }
    }
    return result;
}

std::vector<btbatt::ClassicDevice> classic_devices(const ManagedObjects& objects) {
    std::vector<btbatt::ClassicDevice> result;

    for (const auto& dev : objects.devices) {
        if (!dev.paired) {
            continue;
        }

        auto name = dev.display_name();
        if (!name) {
            continue;
        }

        btbatt::ClassicDevice c;
        c.name = *name;
        c.address = bachk(dev.address.c_str()) == 0 ? dev.address : "unknown";
        c.connected = dev.connected;
        c.battery_single = dev.battery_percentage.value_or(0);
        result.push_back(std::move(c));
    }

    btbatt::log::debug() << "bluez: found " << result.size() << " paired devices";
    return result;
}

std::vector<btbatt::ClassicDevice> find_paired_devices(DBusConnection* conn) {
    auto objects = get_managed_objects(conn);
    if (!objects) {
        return {};
    }
    return classic_devices(*objects);
}

} // namespace bluez
