#pragma once

#include <optional>
#include <string>

namespace tvremote {

// Model metadata served by http://<address>:8001/api/v2/
struct DeviceInfo {
    std::string model_name;        // e.g. QN55Q6FNA
    std::string model;             // platform code, e.g. 18_KANTM2_QTV
    std::string firmware_version;
    std::string os;
    std::string resolution;
    std::string power_state;
    std::string wifi_mac;
    std::string network_type;
    std::string country_code;
    bool token_auth_support = false;
};

struct Device {
    // Identity
    std::string id;                // uuid assigned by the device
    std::string name;
    std::string address;           // IPv4 address or host name

    std::optional<DeviceInfo> info;
};

} // namespace tvremote
