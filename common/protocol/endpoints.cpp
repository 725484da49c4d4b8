#include "endpoints.hpp"
#include "crypto.hpp"
#include "packets.hpp"

namespace tvremote::endpoints {

std::string channel_target(const SessionConfig& config) {
    std::string target = packets::CHANNEL_PATH;
    target += "?name=";
    target += crypto::base64_encode(std::string_view(config.app_name));
    if (config.token) {
        target += "&token=";
        target += *config.token;
    }
    return target;
}

std::string channel_url(const SessionConfig& config) {
    std::string url = config.secure ? "wss://" : "ws://";
    url += config.address;
    url += ":";
    url += std::to_string(config.port);
    url += channel_target(config);
    return url;
}

std::string device_info_target() {
    return packets::REST_ROOT;
}

std::string application_target(std::string_view app_id) {
    std::string target = packets::REST_APPLICATIONS;
    target += app_id;
    return target;
}

std::string ssdp_search_request(int mx) {
    std::string request = "M-SEARCH * HTTP/1.1\r\n";
    request += "HOST: ";
    request += packets::ssdp::MULTICAST_ADDRESS;
    request += ":" + std::to_string(packets::ssdp::PORT) + "\r\n";
    request += "MAN: \"ssdp:discover\"\r\n";
    request += "MX: " + std::to_string(mx) + "\r\n";
    request += "ST: ";
    request += packets::ssdp::SEARCH_TARGET;
    request += "\r\n\r\n";
    return request;
}

} // namespace tvremote::endpoints
