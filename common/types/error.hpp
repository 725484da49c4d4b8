#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tvremote {

enum class ErrorKind : uint8_t {
    InvalidConfiguration,
    AlreadyConnected,
    AlreadySearching,
    TransportFailure,
    DecodeFailure,
    PreconditionViolation,
    Denied,
    DeviceError,
    DiscoveryTimeout,
    FetchFailure,
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidConfiguration: return "invalid-configuration";
        case ErrorKind::AlreadyConnected: return "already-connected";
        case ErrorKind::AlreadySearching: return "already-searching";
        case ErrorKind::TransportFailure: return "transport-failure";
        case ErrorKind::DecodeFailure: return "decode-failure";
        case ErrorKind::PreconditionViolation: return "precondition-violation";
        case ErrorKind::Denied: return "denied";
        case ErrorKind::DeviceError: return "device-error";
        case ErrorKind::DiscoveryTimeout: return "discovery-timeout";
        case ErrorKind::FetchFailure: return "fetch-failure";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::TransportFailure;
    std::string context;
};

inline std::string to_string(const Error& error) {
    std::string s(to_string(error.kind));
    if (!error.context.empty()) {
        s += ": ";
        s += error.context;
    }
    return s;
}

} // namespace tvremote
