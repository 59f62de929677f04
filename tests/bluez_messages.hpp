#pragma once

#include <dbus/dbus.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// In-memory D-Bus messages shaped like bluetoothd's replies and signals

namespace bluez::messages {

struct ObjectPath {
    std::string path;
};

using Value = std::variant<std::string, ObjectPath, bool, uint8_t, std::vector<std::string>>;
using Properties = std::vector<std::pair<std::string, Value>>;
using Interfaces = std::vector<std::pair<std::string, Properties>>;

// Appends one {sv} entry to an open a{sv} container
inline void append_property(DBusMessageIter* dict, const std::string& key, const Value& value) {
    DBusMessageIter entry, variant;
    const char* k = key.c_str();
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &k);

    if (auto s = std::get_if<std::string>(&value)) {
        const char* v = s->c_str();
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
        dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &v);
    } else if (auto p = std::get_if<ObjectPath>(&value)) {
        const char* v = p->path.c_str();
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "o", &variant);
        dbus_message_iter_append_basic(&variant, DBUS_TYPE_OBJECT_PATH, &v);
    } else if (auto b = std::get_if<bool>(&value)) {
        dbus_bool_t v = *b ? TRUE : FALSE;
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &variant);
        dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &v);
    } else if (auto list = std::get_if<std::vector<std::string>>(&value)) {
        DBusMessageIter array;
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "as", &variant);
        dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
        for (const auto& item : *list) {
            const char* v = item.c_str();
            dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &v);
        }
        dbus_message_iter_close_container(&variant, &array);
    } else {
        uint8_t v = std::get<uint8_t>(value);
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "y", &variant);
        dbus_message_iter_append_basic(&variant, DBUS_TYPE_BYTE, &v);
    }

    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

// Builds an a{oa{sa{sv}}} message the way GetManagedObjects returns it
class ManagedObjectsMessage {
public:
    ManagedObjectsMessage() : msg_(dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN)) {
        dbus_message_iter_init_append(msg_, &root_);
        dbus_message_iter_open_container(&root_, DBUS_TYPE_ARRAY, "{oa{sa{sv}}}", &objects_);
    }

    ~ManagedObjectsMessage() { dbus_message_unref(msg_); }

    ManagedObjectsMessage(const ManagedObjectsMessage&) = delete;
    ManagedObjectsMessage& operator=(const ManagedObjectsMessage&) = delete;

    ManagedObjectsMessage& add(const char* path, const Interfaces& interfaces) {
        DBusMessageIter entry, ifaces;
        dbus_message_iter_open_container(&objects_, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_OBJECT_PATH, &path);
        dbus_message_iter_open_container(&entry, DBUS_TYPE_ARRAY, "{sa{sv}}", &ifaces);

        for (const auto& [iface, props] : interfaces) {
            DBusMessageIter iface_entry, dict;
            const char* name = iface.c_str();
            dbus_message_iter_open_container(&ifaces, DBUS_TYPE_DICT_ENTRY, nullptr, &iface_entry);
            dbus_message_iter_append_basic(&iface_entry, DBUS_TYPE_STRING, &name);
            dbus_message_iter_open_container(&iface_entry, DBUS_TYPE_ARRAY, "{sv}", &dict);
            for (const auto& [key, value] : props) {
                append_property(&dict, key, value);
            }
            dbus_message_iter_close_container(&iface_entry, &dict);
            dbus_message_iter_close_container(&ifaces, &iface_entry);
        }

        dbus_message_iter_close_container(&entry, &ifaces);
        dbus_message_iter_close_container(&objects_, &entry);
        return *this;
    }

    DBusMessage* finish() {
        dbus_message_iter_close_container(&root_, &objects_);
        return msg_;
    }

private:
    DBusMessage* msg_;
    DBusMessageIter root_;
    DBusMessageIter objects_;
};

struct MessageUnref {
    void operator()(DBusMessage* msg) const { dbus_message_unref(msg); }
};

using MessagePtr = std::unique_ptr<DBusMessage, MessageUnref>;

// org.freedesktop.DBus.Properties.PropertiesChanged(s, a{sv}, as) from `path`
inline MessagePtr properties_changed(const char* path, const char* iface, const Properties& changed) {
    MessagePtr msg(dbus_message_new_signal(path, "org.freedesktop.DBus.Properties", "PropertiesChanged"));

    DBusMessageIter iter, dict, invalidated;
    dbus_message_iter_init_append(msg.get(), &iter);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (const auto& [key, value] : changed) {
        append_property(&dict, key, value);
    }
    dbus_message_iter_close_container(&iter, &dict);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);
    return msg;
}

// Error reply as bluetoothd sends it, e.g. org.bluez.Error.Failed
inline MessagePtr error_reply(const char* name, const char* text) {
    MessagePtr call(dbus_message_new_method_call("org.bluez", "/", "org.bluez.Device1", "Connect"));
    dbus_message_set_serial(call.get(), 1);
    return MessagePtr(dbus_message_new_error(call.get(), name, text));
}

inline MessagePtr empty_reply() {
    return MessagePtr(dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN));
}

// GattCharacteristic1.ReadValue reply (ay)
inline MessagePtr value_reply(const std::vector<uint8_t>& value) {
    MessagePtr msg(dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN));

    DBusMessageIter iter, array;
    dbus_message_iter_init_append(msg.get(), &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "y", &array);
    const uint8_t* data = value.data();
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data, static_cast<int>(value.size()));
    dbus_message_iter_close_container(&iter, &array);
    return msg;
}

} // namespace bluez::messages
