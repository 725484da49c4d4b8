#include <gtest/gtest.h>

#include "introspection.hpp"

#include <string>

namespace {

// Text of one <interface> element, empty if absent or self-closing
std::string interface_body(const std::string& xml, const std::string& name) {
    auto open = xml.find("<interface name=\"" + name + "\">");
    if (open == std::string::npos) return {};
    auto close = xml.find("</interface>", open);
    if (close == std::string::npos) return {};
    return xml.substr(open, close - open);
}

} // namespace

TEST(IntrospectionTest, RemoteInterface_ListsMethodsAndProperties) {
    auto body = interface_body(dbus_service::INTROSPECT_XML, "com.samsung.TvRemote");
    ASSERT_FALSE(body.empty());

    for (const char* method : {"Connect", "Disconnect", "SendKey", "SendText"}) {
        EXPECT_NE(body.find(std::string("<method name=\"") + method + "\""), std::string::npos) << method;
    }
    for (const char* property : {"ConnectionState", "AuthorizationState", "Address",
                                 "DeviceName", "Model", "LastError"}) {
        EXPECT_NE(body.find(std::string("<property name=\"") + property + "\" type=\"s\" access=\"read\"/>"),
                  std::string::npos) << property;
    }
}

TEST(IntrospectionTest, StandardInterfaces_ListTheirMembers) {
    auto properties = interface_body(dbus_service::INTROSPECT_XML, "org.freedesktop.DBus.Properties");
    ASSERT_FALSE(properties.empty());
    EXPECT_NE(properties.find("<method name=\"Get\">"), std::string::npos);
    EXPECT_NE(properties.find("<method name=\"GetAll\">"), std::string::npos);
    EXPECT_NE(properties.find("<method name=\"Set\">"), std::string::npos);
    EXPECT_NE(properties.find("<signal name=\"PropertiesChanged\">"), std::string::npos);
    EXPECT_NE(properties.find("type=\"a{sv}\" direction=\"out\""), std::string::npos);

    auto introspectable = interface_body(dbus_service::INTROSPECT_XML, "org.freedesktop.DBus.Introspectable");
    ASSERT_FALSE(introspectable.empty());
    EXPECT_NE(introspectable.find("<method name=\"Introspect\">"), std::string::npos);
    EXPECT_NE(introspectable.find("<arg name=\"xml\" type=\"s\" direction=\"out\"/>"), std::string::npos);
}
