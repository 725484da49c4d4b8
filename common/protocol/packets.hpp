#pragma once

#include <cstdint>

namespace tvremote::packets {

// Control channel endpoint: ws[s]://<address>:<port>/api/v2/channels/samsung.remote.control
constexpr const char* CHANNEL_PATH = "/api/v2/channels/samsung.remote.control";

// REST api served on the plain port
constexpr uint16_t REST_PORT = 8001;
constexpr const char* REST_ROOT = "/api/v2/";
constexpr const char* REST_APPLICATIONS = "/api/v2/applications/";

// Outbound method discriminators
namespace methods {
    constexpr const char* REMOTE_CONTROL = "ms.remote.control";
}

// Inbound event discriminators
namespace events {
    constexpr const char* CHANNEL_CONNECT = "ms.channel.connect";
    constexpr const char* CHANNEL_UNAUTHORIZED = "ms.channel.unauthorized";
    constexpr const char* CHANNEL_TIMEOUT = "ms.channel.timeOut";
    constexpr const char* CHANNEL_READY = "ms.channel.ready";
    constexpr const char* CLIENT_CONNECT = "ms.channel.clientConnect";
    constexpr const char* CLIENT_DISCONNECT = "ms.channel.clientDisconnect";
    constexpr const char* REMOTE_CONTROL = "ms.remote.control";
    constexpr const char* IME_START = "ms.remote.imeStart";
    constexpr const char* IME_END = "ms.remote.imeEnd";
    constexpr const char* TOUCH_ENABLE = "ms.remote.touchEnable";
    constexpr const char* TOUCH_DISABLE = "ms.remote.touchDisable";
    constexpr const char* ERROR_EVENT = "ms.error";
}

// ms.remote.control params
namespace params {
    constexpr const char* CMD = "Cmd";
    constexpr const char* DATA_OF_CMD = "DataOfCmd";
    constexpr const char* OPTION = "Option";
    constexpr const char* TYPE_OF_REMOTE = "TypeOfRemote";

    constexpr const char* SEND_REMOTE_KEY = "SendRemoteKey";
    constexpr const char* SEND_INPUT_STRING = "SendInputString";
    constexpr const char* DATA_BASE64 = "base64";
    constexpr const char* OPTION_FALSE = "false";
}

// SSDP discovery
namespace ssdp {
    constexpr const char* MULTICAST_ADDRESS = "239.255.255.250";
    constexpr uint16_t PORT = 1900;
    constexpr const char* SEARCH_TARGET = "urn:samsung.com:device:RemoteControlReceiver:1";
}

// Wake-on-LAN
namespace wol {
    constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";
    constexpr uint16_t PORT = 9;
}

} // namespace tvremote::packets
