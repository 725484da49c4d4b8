#include "connection_manager.hpp"
#include "../protocol/commands.hpp"
#include "../protocol/parse.hpp"
#include <iostream>

namespace tvremote {

namespace {

// Keep logged frame excerpts short
std::string excerpt(const std::string& text) {
    constexpr size_t max_len = 80;
    return text.size() <= max_len ? text : text.substr(0, max_len) + "...";
}

} // namespace

ConnectionManager::ConnectionManager(TransportFactory factory, Callbacks callbacks)
    : factory_(std::move(factory)), callbacks_(std::move(callbacks)) {}

ConnectionManager::~ConnectionManager() {
    std::unique_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++session_;
        transport = std::move(transport_);
        pending_.clear();
        state_ = ConnectionState::Disconnected;
    }
    if (transport) {
        transport->close();
    }
}

bool ConnectionManager::connect(const Device& device, const std::string& app_name,
                                std::optional<std::string> token) {
    return connect(make_session_config(device, app_name, std::move(token)));
}

bool ConnectionManager::connect(const SessionConfig& config) {
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != ConnectionState::Disconnected) {
            report(ErrorKind::AlreadyConnected,
                   "connect() while " + std::string(to_string(state_)));
        } else if (auto invalid = validate(config)) {
            report(invalid->kind, invalid->context);
        } else if (auto transport = factory_ ? factory_() : nullptr; !transport) {
            report(ErrorKind::TransportFailure, "no transport available");
        } else {
            config_ = config;
            token_ = config.token;
            auth_ = AuthorizationState::None;
            outstanding_.clear();
            transport_ = std::move(transport);

            const uint64_t session = ++session_;
            set_state(ConnectionState::Connecting);

            std::cout << "manager: connecting to " << config.address << ":" << config.port
                      << (config.token ? " with saved token" : " without token") << std::endl;

            Transport::Callbacks callbacks;
            callbacks.on_open = [this, session]() { handle_open(session); };
            callbacks.on_message = [this, session](const std::string& text) {
                handle_message(session, text);
            };
            callbacks.on_closed = [this, session](const std::string& reason) {
                handle_closed(session, reason);
            };
            callbacks.on_failure = [this, session](const std::string& reason) {
                handle_failure(session, reason);
            };
            transport_->open(config_, std::move(callbacks));
            ok = true;
        }
    }
    deliver();
    return ok;
}

bool ConnectionManager::disconnect_from_tv() {
    std::unique_ptr<Transport> transport;
    bool disconnecting = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Disconnected) {
            report(ErrorKind::PreconditionViolation, "already disconnected");
        } else {
            transport = teardown(true);
            disconnecting = true;
        }
    }

    if (transport) {
        transport->close();
    }
    deliver();
    return disconnecting;
}

bool ConnectionManager::send_remote_command(const RemoteCommand& command) {
    bool ok = false;
    std::unique_ptr<Transport> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != ConnectionState::Ready) {
            report(ErrorKind::PreconditionViolation,
                   "cannot send " + describe(command) + ": connection is " +
                   std::string(to_string(state_)) + ", requires ready");
        } else if (auth_ != AuthorizationState::Allowed) {
            report(ErrorKind::PreconditionViolation,
                   "cannot send " + describe(command) + ": authorization is " +
                   std::string(to_string(auth_)) + ", requires allowed");
        } else if (!transport_->send(commands::encode_frame(command))) {
            report(ErrorKind::TransportFailure, "write failed for " + describe(command));
            failed = teardown(false);
        } else {
            std::cout << "manager: -> " << describe(command) << std::endl;
            outstanding_.push_back(command);
            post([this, command]() {
                if (callbacks_.on_command_written) callbacks_.on_command_written(command);
            });
            ok = true;
        }
    }

    if (failed) {
        failed->close();
    }
    deliver();
    return ok;
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

AuthorizationState ConnectionManager::authorization() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_;
}

std::optional<std::string> ConnectionManager::token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

size_t ConnectionManager::outstanding_commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.size();
}

void ConnectionManager::handle_open(uint64_t session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_ || state_ != ConnectionState::Connecting) {
            return;
        }

        set_state(ConnectionState::Connected);
        post([this]() {
            if (callbacks_.on_connected) callbacks_.on_connected();
        });

        // With a saved token the device answers in one round trip; without
        // one it shows the pairing prompt. Either way wait for its verdict.
        auth_ = AuthorizationState::Pending;
        set_state(ConnectionState::Authorizing);
        std::cout << "manager: waiting for authorization" << std::endl;
    }
    deliver();
}

void ConnectionManager::handle_message(uint64_t session, const std::string& text) {
    std::unique_ptr<Transport> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_) {
            return;
        }

        auto event = codec::decode_event(text);
        if (!event) {
            report(ErrorKind::DecodeFailure, "malformed frame: " + excerpt(text));
        } else {
            closing = handle_event(*event);
        }
    }

    if (closing) {
        closing->close();
    }
    deliver();
}

std::unique_ptr<Transport> ConnectionManager::handle_event(const codec::Event& event) {
    using parse::EventType;

    switch (parse::identify_event(event)) {
        case EventType::Authorized: {
            auto issued = parse::parse_token(event);
            if (state_ == ConnectionState::Authorizing) {
                // Devices without token auth allow the session without issuing one
                set_authorization(AuthorizationState::Allowed, issued ? issued : token_);
                set_state(ConnectionState::Ready);
            } else if (state_ == ConnectionState::Ready && issued && issued != token_) {
                set_authorization(AuthorizationState::Allowed, issued);
            }
            break;
        }

        case EventType::Unauthorized:
            if (state_ == ConnectionState::Authorizing || state_ == ConnectionState::Ready) {
                std::cerr << "manager: authorization denied by device" << std::endl;
                set_authorization(AuthorizationState::Denied, std::nullopt);
                report(ErrorKind::Denied, "device refused authorization for " + config_.app_name);
                return teardown(true);
            }
            break;

        case EventType::AuthorizationTimeout:
            // User has not answered the prompt yet; keep waiting
            if (state_ == ConnectionState::Authorizing) {
                set_authorization(AuthorizationState::None, std::nullopt);
            }
            break;

        case EventType::RemoteControlAck:
            if (state_ == ConnectionState::Ready && !outstanding_.empty()) {
                RemoteCommand acked = std::move(outstanding_.front());
                outstanding_.pop_front();
                post([this, acked]() {
                    if (callbacks_.on_command_acknowledged) callbacks_.on_command_acknowledged(acked);
                });
            }
            break;

        case EventType::Error:
            report(ErrorKind::DeviceError, parse::parse_error_message(event));
            break;

        case EventType::ChannelReady:
        case EventType::ClientConnect:
        case EventType::ClientDisconnect:
        case EventType::ImeStart:
        case EventType::ImeEnd:
        case EventType::TouchEnable:
        case EventType::TouchDisable:
            std::cout << "manager: <- " << event.event << std::endl;
            break;

        case EventType::Unknown:
            std::cout << "manager: ignoring event " << event.event << std::endl;
            break;
    }

    return nullptr;
}

void ConnectionManager::handle_closed(uint64_t session, const std::string& reason) {
    std::unique_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_ || state_ == ConnectionState::Disconnected) {
            return;
        }

        std::cout << "manager: channel closed by device (" << reason << ")" << std::endl;
        if (state_ != ConnectionState::Ready) {
            report(ErrorKind::TransportFailure,
                   "channel closed while " + std::string(to_string(state_)) + ": " + reason);
        }
        transport = teardown(false);
    }

    if (transport) {
        transport->close();
    }
    deliver();
}

void ConnectionManager::handle_failure(uint64_t session, const std::string& reason) {
    std::unique_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session != session_ || state_ == ConnectionState::Disconnected) {
            return;
        }

        std::cerr << "manager: transport failure: " << reason << std::endl;
        report(ErrorKind::TransportFailure, reason);
        transport = teardown(false);
    }

    if (transport) {
        transport->close();
    }
    deliver();
}

void ConnectionManager::set_state(ConnectionState state) {
    if (state_ == state) {
        return;
    }

    std::cout << "manager: " << to_string(state_) << " -> " << to_string(state) << std::endl;
    state_ = state;
    post([this, state]() {
        if (callbacks_.on_state_changed) callbacks_.on_state_changed(state);
    });
}

void ConnectionManager::set_authorization(AuthorizationState auth, std::optional<std::string> token) {
    auth_ = auth;
    if (auth == AuthorizationState::Allowed) {
        token_ = token;
    }

    std::cout << "manager: authorization " << to_string(auth) << std::endl;
    post([this, auth, token = std::move(token)]() {
        if (callbacks_.on_authorization_changed) callbacks_.on_authorization_changed(auth, token);
    });
}

void ConnectionManager::report(ErrorKind kind, std::string context) {
    Error error{kind, std::move(context)};
    std::cerr << "manager: " << to_string(error) << std::endl;
    post([this, error = std::move(error)]() {
        if (callbacks_.on_error) callbacks_.on_error(error);
    });
}

void ConnectionManager::post(Notification notification) {
    pending_.push_back(std::move(notification));
}

std::unique_ptr<Transport> ConnectionManager::teardown(bool orderly) {
    // Late events from the old transport are dropped from here on
    ++session_;

    if (orderly) {
        set_state(ConnectionState::Closing);
    }
    set_state(ConnectionState::Disconnected);
    outstanding_.clear();

    post([this]() {
        if (callbacks_.on_disconnected) callbacks_.on_disconnected();
    });

    return std::move(transport_);
}

void ConnectionManager::deliver() {
    for (;;) {
        std::unique_lock<std::recursive_mutex> delivering(delivery_mutex_, std::try_to_lock);
        if (!delivering.owns_lock()) {
            // Whoever is delivering picks up what we queued
            return;
        }

        for (;;) {
            Notification next;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pending_.empty()) break;
                next = std::move(pending_.front());
                pending_.pop_front();
            }
            next();
        }

        delivering.unlock();

        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.empty()) {
            return;
        }
    }
}

} // namespace tvremote
