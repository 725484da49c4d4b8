#pragma once

#include <dbus/dbus.h>
#include <types/error.hpp>
#include <functional>
#include <optional>
#include <string>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "com.samsung.TvRemote";
constexpr const char* OBJECT_PATH = "/com/samsung/TvRemote";
constexpr const char* INTERFACE_NAME = "com.samsung.TvRemote";
constexpr const char* ERROR_NAME = "com.samsung.TvRemote.Error";

// Callbacks for method invocations; a returned error becomes the D-Bus error reply
struct Callbacks {
    std::function<std::optional<tvremote::Error>()> on_connect;
    std::function<std::optional<tvremote::Error>()> on_disconnect;
    std::function<std::optional<tvremote::Error>(const std::string& key, const std::string& action)> on_send_key;
    std::function<std::optional<tvremote::Error>(const std::string& text)> on_send_text;
};

// Current state exposed via D-Bus; every property is a read-only string
struct State {
    std::string connection_state = "disconnected";
    std::string authorization_state = "none";
    std::string address;
    std::string device_name;
    std::string model;
    std::string last_error;
};

// Initialize D-Bus service, returns connection (caller owns)
// Sets up object path and method handlers
DBusConnection* init(Callbacks* callbacks, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties);

// Copy latest into state and emit signals for the properties that changed
void update_state(DBusConnection* conn, State* state, const State& latest);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

// Cleanup
void cleanup(DBusConnection* conn);

} // namespace dbus_service
