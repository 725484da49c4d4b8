#include "parse.hpp"
#include "packets.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace tvremote::parse {

namespace {

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Header names are case-insensitive; keys are stored upper-cased
std::unordered_map<std::string, std::string> parse_headers(std::string_view datagram,
                                                           std::string_view& status_line) {
    std::unordered_map<std::string, std::string> headers;

    size_t pos = 0;
    bool first = true;
    while (pos < datagram.size()) {
        size_t end = datagram.find('\n', pos);
        if (end == std::string_view::npos) end = datagram.size();

        auto line = trim(datagram.substr(pos, end - pos));
        pos = end + 1;

        if (first) {
            status_line = line;
            first = false;
            continue;
        }
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        headers[to_upper(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }

    return headers;
}

std::string json_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number() || it->is_boolean()) return it->dump();
    return {};
}

bool json_flag(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_string()) return it->get<std::string>() == "true";
    return false;
}

// "uuid:1234-abcd::urn:..." -> "1234-abcd"
std::string strip_uuid(std::string_view value) {
    if (value.rfind("uuid:", 0) == 0) value.remove_prefix(5);
    auto sep = value.find("::");
    if (sep != std::string_view::npos) value = value.substr(0, sep);
    return std::string(value);
}

} // namespace

EventType identify_event(const codec::Event& event) {
    using namespace packets;

    static const std::unordered_map<std::string_view, EventType> event_map = {
        {events::CHANNEL_CONNECT, EventType::Authorized},
        {events::CHANNEL_UNAUTHORIZED, EventType::Unauthorized},
        {events::CHANNEL_TIMEOUT, EventType::AuthorizationTimeout},
        {events::CHANNEL_READY, EventType::ChannelReady},
        {events::CLIENT_CONNECT, EventType::ClientConnect},
        {events::CLIENT_DISCONNECT, EventType::ClientDisconnect},
        {events::REMOTE_CONTROL, EventType::RemoteControlAck},
        {events::IME_START, EventType::ImeStart},
        {events::IME_END, EventType::ImeEnd},
        {events::TOUCH_ENABLE, EventType::TouchEnable},
        {events::TOUCH_DISABLE, EventType::TouchDisable},
        {events::ERROR_EVENT, EventType::Error},
    };

    auto it = event_map.find(event.event);
    return it != event_map.end() ? it->second : EventType::Unknown;
}

std::optional<std::string> parse_token(const codec::Event& event) {
    if (!event.data.is_object()) {
        return std::nullopt;
    }

    auto token = json_string(event.data, "token");
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

std::string parse_error_message(const codec::Event& event) {
    if (event.data.is_string()) {
        return event.data.get<std::string>();
    }
    if (event.data.is_object()) {
        auto message = json_string(event.data, "message");
        if (!message.empty()) return message;
    }
    return event.data.is_null() ? std::string("unspecified device error") : event.data.dump();
}

std::optional<std::string> url_host(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme == std::string_view::npos) {
        return std::nullopt;
    }

    auto rest = url.substr(scheme + 3);
    auto end = rest.find_first_of(":/");
    auto host = rest.substr(0, end);
    if (host.empty()) {
        return std::nullopt;
    }
    return std::string(host);
}

std::optional<Device> parse_ssdp_response(std::string_view datagram,
                                          std::string_view sender_address) {
    // Status: HTTP/1.1 200 OK
    std::string_view status_line;
    auto headers = parse_headers(datagram, status_line);

    auto status = to_upper(status_line);
    if (status.rfind("HTTP/1.1 200", 0) != 0 && status.rfind("HTTP/1.0 200", 0) != 0) {
        return std::nullopt;
    }

    if (auto st = headers.find("ST"); st != headers.end() && st->second != packets::ssdp::SEARCH_TARGET) {
        return std::nullopt;
    }

    auto usn = headers.find("USN");
    if (usn == headers.end() || usn->second.rfind("uuid:", 0) != 0) {
        return std::nullopt;
    }

    Device device;
    device.id = strip_uuid(usn->second);
    if (device.id.empty()) {
        return std::nullopt;
    }

    if (auto location = headers.find("LOCATION"); location != headers.end()) {
        if (auto host = url_host(location->second)) {
            device.address = *host;
        }
    }
    if (device.address.empty()) {
        device.address = std::string(sender_address);
    }
    if (device.address.empty()) {
        return std::nullopt;
    }

    device.name = "Samsung TV (" + device.address + ")";
    return device;
}

std::optional<Device> parse_device_info(std::string_view body) {
    // {"device": {...}, "id": "uuid:...", "name": "...", "uri": "http://ip:8001/api/v2/", ...}
    auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto dev = j.find("device");
    if (dev == j.end() || !dev->is_object()) {
        return std::nullopt;
    }

    Device device;
    device.id = strip_uuid(json_string(*dev, "id"));
    if (device.id.empty()) {
        device.id = strip_uuid(json_string(j, "id"));
    }
    device.name = json_string(*dev, "name");
    if (device.name.empty()) {
        device.name = json_string(j, "name");
    }
    device.address = json_string(*dev, "ip");
    if (device.address.empty()) {
        device.address = url_host(json_string(j, "uri")).value_or("");
    }

    if (device.id.empty()) {
        return std::nullopt;
    }

    DeviceInfo info;
    info.model_name = json_string(*dev, "modelName");
    info.model = json_string(*dev, "model");
    info.firmware_version = json_string(*dev, "firmwareVersion");
    info.os = json_string(*dev, "OS");
    info.resolution = json_string(*dev, "resolution");
    info.power_state = json_string(*dev, "PowerState");
    info.wifi_mac = json_string(*dev, "wifiMac");
    info.network_type = json_string(*dev, "networkType");
    info.country_code = json_string(*dev, "countryCode");
    info.token_auth_support = json_flag(*dev, "TokenAuthSupport");
    device.info = std::move(info);

    return device;
}

std::optional<AppStatus> parse_app_status(std::string_view body) {
    // {"id": "111299001912", "name": "YouTube", "running": false, "version": "...", "visible": false}
    auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    AppStatus status;
    status.id = json_string(j, "id");
    if (status.id.empty()) {
        return std::nullopt;
    }
    status.name = json_string(j, "name");
    status.version = json_string(j, "version");

    if (json_flag(j, "visible")) {
        status.state = AppState::Visible;
    } else if (json_flag(j, "running")) {
        status.state = AppState::Running;
    } else {
        status.state = AppState::Stopped;
    }

    return status;
}

} // namespace tvremote::parse
