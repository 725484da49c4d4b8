#pragma once

#include "codec.hpp"
#include "../types/app.hpp"
#include "../types/device.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tvremote::parse {

// Identify inbound channel event
enum class EventType {
    Unknown,
    Authorized,
    Unauthorized,
    AuthorizationTimeout,
    ChannelReady,
    ClientConnect,
    ClientDisconnect,
    RemoteControlAck,
    ImeStart,
    ImeEnd,
    TouchEnable,
    TouchDisable,
    Error,
};

EventType identify_event(const codec::Event& event);

// Token issued with ms.channel.connect (data.token, string or number)
// Returns nullopt when the device does not use token auth
std::optional<std::string> parse_token(const codec::Event& event);

// Human-readable message carried by ms.error
std::string parse_error_message(const codec::Event& event);

// Parse an SSDP M-SEARCH response
// Returns nullopt unless the datagram is a 200 response carrying a uuid USN
// and, when present, the device's search target
std::optional<Device> parse_ssdp_response(std::string_view datagram,
                                          std::string_view sender_address);

// Parse the /api/v2/ document - extracts identity and model metadata
std::optional<Device> parse_device_info(std::string_view body);

// Parse /api/v2/applications/<id>
std::optional<AppStatus> parse_app_status(std::string_view body);

// Host part of an http:// URL ("http://10.0.0.5:7676/x" -> "10.0.0.5")
std::optional<std::string> url_host(std::string_view url);

} // namespace tvremote::parse
