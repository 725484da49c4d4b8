#pragma once

#include <cstdint>
#include <string_view>

namespace tvremote {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Authorizing,
    Ready,
    Closing,
};

inline std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Authorizing: return "authorizing";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Closing: return "closing";
    }
    return "unknown";
}

enum class AuthorizationState : uint8_t {
    None,
    Pending,
    Allowed,
    Denied,
};

inline std::string_view to_string(AuthorizationState state) {
    switch (state) {
        case AuthorizationState::None: return "none";
        case AuthorizationState::Pending: return "pending";
        case AuthorizationState::Allowed: return "allowed";
        case AuthorizationState::Denied: return "denied";
    }
    return "unknown";
}

// Installed application state, as reported by the REST api
enum class AppState : uint8_t {
    NotInstalled,
    Stopped,
    Running,
    Visible,
};

inline std::string_view to_string(AppState state) {
    switch (state) {
        case AppState::NotInstalled: return "not-installed";
        case AppState::Stopped: return "stopped";
        case AppState::Running: return "running";
        case AppState::Visible: return "visible";
    }
    return "unknown";
}

} // namespace tvremote
