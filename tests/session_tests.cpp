#include <gtest/gtest.h>

#include <protocol/endpoints.hpp>
#include <types/session.hpp>

using namespace tvremote;

namespace {

SessionConfig valid_config() {
    SessionConfig config;
    config.address = "192.168.1.20";
    config.app_name = "tvremote";
    return config;
}

} // namespace

// =============================================================================
// Configuration
// =============================================================================

TEST(SessionConfigTest, Defaults) {
    SessionConfig config;
    EXPECT_EQ(config.port, 8002);
    EXPECT_TRUE(config.secure);
    EXPECT_FALSE(config.token.has_value());
    EXPECT_EQ(config.certificate_validator, nullptr);
}

TEST(SessionConfigTest, FromDevice) {
    Device device;
    device.id = "abcd";
    device.address = "10.0.0.5";

    auto config = make_session_config(device, "remote", std::string("tok"));
    EXPECT_EQ(config.address, "10.0.0.5");
    EXPECT_EQ(config.app_name, "remote");
    EXPECT_EQ(config.token, "tok");
    EXPECT_FALSE(validate(config).has_value());
}

TEST(SessionConfigTest, Validate_RejectsUnusableValues) {
    auto check = [](auto mutate) {
        auto config = valid_config();
        mutate(config);
        auto error = validate(config);
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->kind, ErrorKind::InvalidConfiguration);
    };

    check([](SessionConfig& c) { c.address.clear(); });
    check([](SessionConfig& c) { c.address = "10.0.0.5/x"; });
    check([](SessionConfig& c) { c.address = "living room"; });
    check([](SessionConfig& c) { c.app_name.clear(); });
    check([](SessionConfig& c) { c.port = 0; });
    check([](SessionConfig& c) { c.token = ""; });

    // Anything that could split the upgrade request line
    check([](SessionConfig& c) { c.address = "10.0.0.5\r\nX-Injected:1"; });
    check([](SessionConfig& c) { c.address = "10.0.0.5\n"; });
    check([](SessionConfig& c) { c.address = std::string("10.0.0.5\0", 9); });
    check([](SessionConfig& c) { c.address = "user@10.0.0.5"; });
    check([](SessionConfig& c) { c.token = "abc 123\r\nEvil: x"; });
    check([](SessionConfig& c) { c.token = "abc&name=x"; });
    check([](SessionConfig& c) { c.token = "abc%20"; });
}

TEST(SessionConfigTest, Validate_AcceptsDeviceTokens) {
    auto config = valid_config();
    config.token = "12345678";
    EXPECT_FALSE(validate(config).has_value());

    config.token = "a-B_c.d~9";
    EXPECT_FALSE(validate(config).has_value());
}

TEST(SessionConfigTest, Validate_AcceptsHostNames) {
    auto config = valid_config();
    config.address = "tv.local";
    EXPECT_FALSE(validate(config).has_value());
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::AlreadyConnected), "already-connected");
    EXPECT_EQ(to_string(ErrorKind::DiscoveryTimeout), "discovery-timeout");
    EXPECT_EQ(to_string(Error{ErrorKind::Denied, "user said no"}), "denied: user said no");
    EXPECT_EQ(to_string(Error{ErrorKind::FetchFailure, ""}), "fetch-failure");
}

// =============================================================================
// Endpoints
// =============================================================================

TEST(EndpointsTest, ChannelTarget_NameIsBase64) {
    auto config = valid_config();
    EXPECT_EQ(endpoints::channel_target(config),
              "/api/v2/channels/samsung.remote.control?name=dHZyZW1vdGU=");

    config.token = "12345678";
    EXPECT_EQ(endpoints::channel_target(config),
              "/api/v2/channels/samsung.remote.control?name=dHZyZW1vdGU=&token=12345678");
}

TEST(EndpointsTest, ChannelUrl_Scheme) {
    auto config = valid_config();
    EXPECT_EQ(endpoints::channel_url(config),
              "wss://192.168.1.20:8002/api/v2/channels/samsung.remote.control?name=dHZyZW1vdGU=");

    config.secure = false;
    config.port = PLAIN_CHANNEL_PORT;
    EXPECT_EQ(endpoints::channel_url(config),
              "ws://192.168.1.20:8001/api/v2/channels/samsung.remote.control?name=dHZyZW1vdGU=");
}

TEST(EndpointsTest, RestTargets) {
    EXPECT_EQ(endpoints::device_info_target(), "/api/v2/");
    EXPECT_EQ(endpoints::application_target("111299001912"), "/api/v2/applications/111299001912");
}

TEST(EndpointsTest, SsdpSearchRequest) {
    auto request = endpoints::ssdp_search_request(2);

    EXPECT_EQ(request.rfind("M-SEARCH * HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(request.find("HOST: 239.255.255.250:1900\r\n"), std::string::npos);
    EXPECT_NE(request.find("MAN: \"ssdp:discover\"\r\n"), std::string::npos);
    EXPECT_NE(request.find("MX: 2\r\n"), std::string::npos);
    EXPECT_NE(request.find("ST: urn:samsung.com:device:RemoteControlReceiver:1\r\n"), std::string::npos);
    EXPECT_EQ(request.substr(request.size() - 4), "\r\n\r\n");
}
