#pragma once

namespace dbus_service {

// Returned by org.freedesktop.DBus.Introspectable.Introspect on OBJECT_PATH
inline constexpr const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"com.samsung.TvRemote\">\n"
    "    <method name=\"Connect\"/>\n"
    "    <method name=\"Disconnect\"/>\n"
    "    <method name=\"SendKey\">\n"
    "      <arg name=\"key\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"action\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"SendText\">\n"
    "      <arg name=\"text\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <property name=\"ConnectionState\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"AuthorizationState\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Address\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"DeviceName\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Model\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"LastError\" type=\"s\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Set\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

} // namespace dbus_service
