#include "dbus.hpp"
#include <log.hpp>

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace dbus {

DBusConnection* connect_system_bus() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        btbatt::log::error() << "dbus: failed to connect to system bus: " << err.message;
        dbus_error_free(&err);
        return nullptr;
    }

    // Shared connection: keep the process alive if bluetoothd goes away
    if (conn) {
        dbus_connection_set_exit_on_disconnect(conn, FALSE);
    }
    return conn;
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!conn || !dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void dispatch_pending(DBusConnection* conn) {
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {}
}

void Pump::advance(std::chrono::milliseconds max) {
    if (!conn_ || !dbus_connection_get_is_connected(conn_)) {
        // Nothing can arrive; use up the slice
        std::this_thread::sleep_for(max);
        return;
    }

    // Push queued requests out before waiting on replies
    dbus_connection_flush(conn_);

    if (dbus_connection_get_dispatch_status(conn_) == DBUS_DISPATCH_DATA_REMAINS) {
        dispatch_pending(conn_);
        return;
    }

    int fd = get_fd(conn_);
    if (fd < 0) {
        dbus_connection_read_write_dispatch(conn_, static_cast<int>(max.count()));
        return;
    }

    pollfd pfd = {};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int ret = poll(&pfd, 1, static_cast<int>(max.count()));
    if (ret < 0) {
        if (errno != EINTR) {
            btbatt::log::error() << "dbus: poll error: " << strerror(errno);
        }
        return;
    }

    if (ret > 0 && (pfd.revents & POLLIN)) {
        dbus_connection_read_write(conn_, 0);
    }
    dispatch_pending(conn_);
}

static void unwrap_variant(DBusMessageIter* iter, DBusMessageIter* out) {
    if (dbus_message_iter_get_arg_type(iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(iter, out);
    } else {
        *out = *iter;
    }
}

std::optional<std::string> read_string(DBusMessageIter* iter) {
    DBusMessageIter value;
    unwrap_variant(iter, &value);

    int type = dbus_message_iter_get_arg_type(&value);
    if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) {
        return std::nullopt;
    }
    const char* s;
    dbus_message_iter_get_basic(&value, &s);
    return std::string(s);
}

std::optional<bool> read_bool(DBusMessageIter* iter) {
    DBusMessageIter value;
    unwrap_variant(iter, &value);

    if (dbus_message_iter_get_arg_type(&value) != DBUS_TYPE_BOOLEAN) {
        return std::nullopt;
    }
    dbus_bool_t b;
    dbus_message_iter_get_basic(&value, &b);
    return b != 0;
}

std::optional<uint8_t> read_byte(DBusMessageIter* iter) {
    DBusMessageIter value;
    unwrap_variant(iter, &value);

    if (dbus_message_iter_get_arg_type(&value) != DBUS_TYPE_BYTE) {
        return std::nullopt;
    }
    uint8_t b;
    dbus_message_iter_get_basic(&value, &b);
    return b;
}

std::vector<std::string> read_string_array(DBusMessageIter* iter) {
    std::vector<std::string> result;

    DBusMessageIter value;
    unwrap_variant(iter, &value);
    if (dbus_message_iter_get_arg_type(&value) != DBUS_TYPE_ARRAY) {
        return result;
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(&value, &array_iter);

    while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_STRING) {
        const char* s;
        dbus_message_iter_get_basic(&array_iter, &s);
        result.emplace_back(s);
        dbus_message_iter_next(&array_iter);
    }
    return result;
}

std::vector<uint8_t> read_byte_array(DBusMessageIter* iter) {
    DBusMessageIter value;
    unwrap_variant(iter, &value);
    if (dbus_message_iter_get_arg_type(&value) != DBUS_TYPE_ARRAY ||
        dbus_message_iter_get_element_type(&value) != DBUS_TYPE_BYTE) {
        return {};
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(&value, &array_iter);

    const uint8_t* bytes = nullptr;
    int len = 0;
    dbus_message_iter_get_fixed_array(&array_iter, &bytes, &len);
    if (!bytes || len <= 0) {
        return {};
    }
    return std::vector<uint8_t>(bytes, bytes + len);
}

void PropertyReply::release() {
    if (reply) {
        dbus_message_unref(reply);
        reply = nullptr;
    }
}

PropertyReply get_property(DBusConnection* conn, const char* dest, const char* path,
                           const char* iface, const char* prop) {
    PropertyReply result;

    if (!conn) {
        result.error_name = DBUS_ERROR_DISCONNECTED;
        result.error_message = "not connected";
        return result;
    }

    DBusMessage* msg = dbus_message_new_method_call(dest, path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) {
        result.error_name = DBUS_ERROR_NO_MEMORY;
        return result;
    }

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, PROPERTY_TIMEOUT_MS, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        result.error_name = err.name;
        result.error_message = err.message ? err.message : "";
        dbus_error_free(&err);
        if (reply) dbus_message_unref(reply);
        return result;
    }

    result.reply = reply;
    return result;
}

std::optional<std::string> get_string_property(DBusConnection* conn, const char* path,
                                               const char* iface, const char* prop) {
    auto r = get_property(conn, "org.bluez", path, iface, prop);
    if (!r.ok()) {
        return std::nullopt;
    }

    std::optional<std::string> result;
    DBusMessageIter iter;
    if (dbus_message_iter_init(r.reply, &iter)) {
        result = read_string(&iter);
    }
    r.release();
    return result;
}

} // namespace dbus
