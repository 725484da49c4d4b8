#include "dbus.hpp"
#include "introspection.hpp"
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

namespace dbus_service {

static Callbacks* g_callbacks = nullptr;
static State* g_state = nullptr;

constexpr const char* PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";
constexpr const char* INTROSPECTABLE_INTERFACE = "org.freedesktop.DBus.Introspectable";

// Exposed properties and the State field behind each
struct Property {
    const char* name;
    std::string State::*field;
};

static constexpr Property PROPERTIES[] = {
    {"ConnectionState", &State::connection_state},
    {"AuthorizationState", &State::authorization_state},
    {"Address", &State::address},
    {"DeviceName", &State::device_name},
    {"Model", &State::model},
    {"LastError", &State::last_error},
};

static const Property* find_property(const char* name) {
    for (const auto& prop : PROPERTIES) {
        if (strcmp(prop.name, name) == 0) return &prop;
    }
    return nullptr;
}

static bool is(const char* value, const char* expected) {
    return value && strcmp(value, expected) == 0;
}

// Leading string arguments of msg; false if there are fewer than count
static bool read_strings(DBusMessage* msg, size_t count, std::vector<std::string>& out) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) {
        return count == 0;
    }

    while (out.size() < count) {
        if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return false;
        const char* value;
        dbus_message_iter_get_basic(&iter, &value);
        out.emplace_back(value);
        if (!dbus_message_iter_next(&iter)) break;
    }
    return out.size() == count;
}

static void append_string_variant(DBusMessageIter* iter, const std::string& value) {
    const char* text = value.c_str();
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &text);
    dbus_message_iter_close_container(iter, &variant);
}

// a{sv} of the given properties
static void append_properties(DBusMessageIter* iter, const State& state,
                              const std::vector<const Property*>& props) {
    DBusMessageIter dict;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (const Property* prop : props) {
        DBusMessageIter entry;
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop->name);
        append_string_variant(&entry, state.*(prop->field));
        dbus_message_iter_close_container(&dict, &entry);
    }
    dbus_message_iter_close_container(iter, &dict);
}

static DBusMessage* invalid_args(DBusMessage* msg, const char* expected) {
    return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, expected);
}

// Method reply, or the callback's error as a com.samsung.TvRemote.Error
static DBusMessage* reply_for(DBusMessage* msg, const std::optional<tvremote::Error>& error) {
    if (!error) {
        return dbus_message_new_method_return(msg);
    }
    std::string text = tvremote::to_string(*error);
    return dbus_message_new_error(msg, ERROR_NAME, text.c_str());
}

template <typename Fn, typename... Args>
static DBusMessage* invoke(DBusMessage* msg, const Fn& callback, Args&&... args) {
    if (!callback) {
        return dbus_message_new_error(msg, DBUS_ERROR_FAILED, "Daemon is not ready");
    }
    return reply_for(msg, callback(std::forward<Args>(args)...));
}

// Properties interface: the first argument names our interface
static DBusMessage* check_interface(DBusMessage* msg, const std::vector<std::string>& args) {
    if (args[0] != INTERFACE_NAME) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }
    return nullptr;
}

static DBusMessage* on_get(DBusMessage* msg) {
    std::vector<std::string> args;
    if (!read_strings(msg, 2, args)) return invalid_args(msg, "Expected interface and property");
    if (DBusMessage* error = check_interface(msg, args)) return error;

    const Property* prop = find_property(args[1].c_str());
    if (!prop) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_string_variant(&iter, (*g_state).*(prop->field));
    return reply;
}

static DBusMessage* on_get_all(DBusMessage* msg) {
    std::vector<std::string> args;
    if (!read_strings(msg, 1, args)) return invalid_args(msg, "Expected interface name");
    if (DBusMessage* error = check_interface(msg, args)) return error;

    std::vector<const Property*> all;
    for (const auto& prop : PROPERTIES) all.push_back(&prop);

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_properties(&iter, *g_state, all);
    return reply;
}

static DBusMessage* on_set(DBusMessage* msg) {
    std::vector<std::string> args;
    if (!read_strings(msg, 1, args)) return invalid_args(msg, "Expected interface name");
    if (DBusMessage* error = check_interface(msg, args)) return error;
    return dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
}

static DBusMessage* on_introspect(DBusMessage* msg) {
    DBusMessage* reply = dbus_message_new_method_return(msg);
    dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    return reply;
}

static DBusMessage* on_connect(DBusMessage* msg) {
    std::cout << "dbus: Connect()" << std::endl;
    return invoke(msg, g_callbacks->on_connect);
}

static DBusMessage* on_disconnect(DBusMessage* msg) {
    std::cout << "dbus: Disconnect()" << std::endl;
    return invoke(msg, g_callbacks->on_disconnect);
}

static DBusMessage* on_send_key(DBusMessage* msg) {
    std::vector<std::string> args;
    if (!read_strings(msg, 2, args)) return invalid_args(msg, "Expected key and action");

    std::cout << "dbus: SendKey(" << args[0] << ", " << args[1] << ")" << std::endl;
    return invoke(msg, g_callbacks->on_send_key, args[0], args[1]);
}

static DBusMessage* on_send_text(DBusMessage* msg) {
    std::vector<std::string> args;
    if (!read_strings(msg, 1, args)) return invalid_args(msg, "Expected text");

    std::cout << "dbus: SendText(" << args[0].size() << " chars)" << std::endl;
    return invoke(msg, g_callbacks->on_send_text, args[0]);
}

struct Method {
    const char* interface;
    const char* member;
    DBusMessage* (*handler)(DBusMessage*);
};

static constexpr Method METHODS[] = {
    {INTROSPECTABLE_INTERFACE, "Introspect", on_introspect},
    {PROPERTIES_INTERFACE, "Get", on_get},
    {PROPERTIES_INTERFACE, "GetAll", on_get_all},
    {PROPERTIES_INTERFACE, "Set", on_set},
    {INTERFACE_NAME, "Connect", on_connect},
    {INTERFACE_NAME, "Disconnect", on_disconnect},
    {INTERFACE_NAME, "SendKey", on_send_key},
    {INTERFACE_NAME, "SendText", on_send_text},
};

static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void*) {
    if (!is(dbus_message_get_path(msg), OBJECT_PATH) || !g_callbacks || !g_state) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    for (const auto& method : METHODS) {
        if (!is(iface, method.interface) || !is(member, method.member)) continue;

        DBusMessage* reply = method.handler(msg);
        if (reply) {
            dbus_connection_send(conn, reply, nullptr);
            dbus_message_unref(reply);
        }
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_callbacks = callbacks;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: session bus unavailable: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: cannot register " << OBJECT_PATH << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: cannot own " << SERVICE_NAME << ": " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: " << SERVICE_NAME << " is owned by another daemon" << std::endl;
        return false;
    }

    std::cout << "dbus: owning " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties) {
    std::vector<const Property*> changed;
    for (int i = 0; i < num_properties; ++i) {
        if (const Property* prop = find_property(property_names[i])) changed.push_back(prop);
    }
    if (changed.empty()) return;

    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, PROPERTIES_INTERFACE, "PropertiesChanged");
    if (!signal) return;

    // (s interface, a{sv} changed, as invalidated)
    DBusMessageIter iter;
    dbus_message_iter_init_append(signal, &iter);
    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
    append_properties(&iter, state, changed);

    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void update_state(DBusConnection* conn, State* state, const State& latest) {
    std::vector<const char*> changed;

    for (const auto& prop : PROPERTIES) {
        std::string& current = (*state).*(prop.field);
        if (current != latest.*(prop.field)) {
            current = latest.*(prop.field);
            changed.push_back(prop.name);
        }
    }

    if (!changed.empty()) {
        emit_properties_changed(conn, *state, changed.data(), static_cast<int>(changed.size()));
    }
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    return dbus_connection_get_unix_fd(conn, &fd) ? fd : -1;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unref(conn);
    }
    g_callbacks = nullptr;
    g_state = nullptr;
}

} // namespace dbus_service
