#pragma once

#include "transport.hpp"
#include "../protocol/codec.hpp"
#include "../types/command.hpp"
#include "../types/device.hpp"
#include "../types/enums.hpp"
#include "../types/error.hpp"
#include "../types/session.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tvremote {

// Owns one control channel: connection lifecycle, the pairing handshake and
// command dispatch.
//
//   disconnected -> connecting -> connected -> authorizing -> ready
//   closing is entered from any other state on disconnect and ends in
//   disconnected; transport failures go straight to disconnected.
//
// Notifications are queued in the order the underlying events occurred and
// delivered without any internal lock held, so callbacks may call back into
// the manager (including disconnect_from_tv()).
class ConnectionManager {
public:
    struct Callbacks {
        std::function<void(ConnectionState)> on_state_changed;
        std::function<void()> on_connected;
        std::function<void(AuthorizationState, const std::optional<std::string>& token)> on_authorization_changed;
        std::function<void(const RemoteCommand&)> on_command_written;
        std::function<void(const RemoteCommand&)> on_command_acknowledged;
        std::function<void()> on_disconnected;
        std::function<void(const Error&)> on_error;
    };

    ConnectionManager(TransportFactory factory, Callbacks callbacks);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Rejected with already-connected unless disconnected, or with
    // invalid-configuration; returns false in both cases
    bool connect(const SessionConfig& config);
    bool connect(const Device& device, const std::string& app_name,
                 std::optional<std::string> token = std::nullopt);

    // Valid from any state except disconnected, where it reports
    // precondition-violation. Emits exactly one on_disconnected per session.
    bool disconnect_from_tv();

    // Requires ready + allowed, otherwise precondition-violation and no write.
    // Success means the transport accepted the frame, not that the device
    // executed it.
    bool send_remote_command(const RemoteCommand& command);

    ConnectionState state() const;
    AuthorizationState authorization() const;

    // Token to persist; set once the device allows the session
    std::optional<std::string> token() const;

    // Written commands not yet acknowledged by the device
    size_t outstanding_commands() const;

private:
    using Notification = std::function<void()>;

    void handle_open(uint64_t session);
    void handle_message(uint64_t session, const std::string& text);
    void handle_closed(uint64_t session, const std::string& reason);
    void handle_failure(uint64_t session, const std::string& reason);

    // Called with mutex_ held
    std::unique_ptr<Transport> handle_event(const codec::Event& event);
    void set_state(ConnectionState state);
    void set_authorization(AuthorizationState auth, std::optional<std::string> token);
    void report(ErrorKind kind, std::string context);
    void post(Notification notification);
    std::unique_ptr<Transport> teardown(bool orderly);

    // Drain queued notifications on the calling thread
    void deliver();

    TransportFactory factory_;
    Callbacks callbacks_;

    mutable std::mutex mutex_;
    std::recursive_mutex delivery_mutex_;
    std::deque<Notification> pending_;

    ConnectionState state_ = ConnectionState::Disconnected;
    AuthorizationState auth_ = AuthorizationState::None;
    std::optional<std::string> token_;
    SessionConfig config_;
    std::unique_ptr<Transport> transport_;
    std::deque<RemoteCommand> outstanding_;

    // Bumped on every connect/teardown so late transport events are dropped
    uint64_t session_ = 0;
};

} // namespace tvremote
