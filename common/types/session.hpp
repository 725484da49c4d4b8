#pragma once

#include "device.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tvremote {

constexpr uint16_t SECURE_CHANNEL_PORT = 8002;
constexpr uint16_t PLAIN_CHANNEL_PORT = 8001;

// Caller-supplied hook consulted after the TLS handshake.
// Not owned by the session; must outlive any connection using it.
class CertificateValidator {
public:
    virtual ~CertificateValidator() = default;

    // der is the peer's leaf certificate; return false to reject the channel
    virtual bool validate(std::string_view host, std::span<const uint8_t> der) = 0;
};

struct SessionConfig {
    std::string address;
    std::string app_name;
    std::optional<std::string> token;

    uint16_t port = SECURE_CHANNEL_PORT;
    bool secure = true;
    CertificateValidator* certificate_validator = nullptr;
};

inline SessionConfig make_session_config(const Device& device, std::string app_name,
                                         std::optional<std::string> token = std::nullopt) {
    SessionConfig config;
    config.address = device.address;
    config.app_name = std::move(app_name);
    config.token = std::move(token);
    return config;
}

// Host characters that would end up outside the host part of the URL
inline bool is_address_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return !std::isspace(uc) && !std::iscntrl(uc) && c != '/' && c != '?' && c != '#' && c != '@';
}

// RFC 3986 unreserved characters; the token goes into the query unescaped
inline bool is_token_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~';
}

// Returns the first problem found, or nullopt when the config is usable
inline std::optional<Error> validate(const SessionConfig& config) {
    if (config.address.empty()) {
        return Error{ErrorKind::InvalidConfiguration, "empty device address"};
    }
    if (!std::all_of(config.address.begin(), config.address.end(), is_address_char)) {
        return Error{ErrorKind::InvalidConfiguration, "malformed device address"};
    }
    if (config.app_name.empty()) {
        return Error{ErrorKind::InvalidConfiguration, "empty app name"};
    }
    if (config.port == 0) {
        return Error{ErrorKind::InvalidConfiguration, "port must be non-zero"};
    }
    if (config.token && config.token->empty()) {
        return Error{ErrorKind::InvalidConfiguration, "token is present but empty"};
    }
    if (config.token && !std::all_of(config.token->begin(), config.token->end(), is_token_char)) {
        return Error{ErrorKind::InvalidConfiguration, "token contains characters not allowed in a URL"};
    }
    return std::nullopt;
}

} // namespace tvremote
