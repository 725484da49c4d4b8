#pragma once

#include <core/transport.hpp>
#include <types/session.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

namespace websocket {

// Bounds the TCP connect and the TLS handshake
constexpr std::chrono::seconds CONNECT_TIMEOUT{10};

// Bounds the opening and closing WebSocket handshakes
constexpr std::chrono::seconds HANDSHAKE_TIMEOUT{10};

constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

// Transport running one connection on its own io_context thread.
// wss:// over Beast's ssl_stream when config.secure, ws:// otherwise.
class Transport : public tvremote::Transport {
public:
    Transport() = default;
    ~Transport() override;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    void open(const tvremote::SessionConfig& config, Callbacks callbacks) override;

    // Queues the message; a write that fails later is reported via on_failure
    bool send(const std::string& text) override;

    void close() override;

    struct Session;

private:
    std::shared_ptr<Session> session_;
    std::thread worker_;
};

} // namespace websocket
