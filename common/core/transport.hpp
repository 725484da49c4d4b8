#pragma once

#include "../types/session.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tvremote {

// Message channel to the device's control endpoint
class Transport {
public:
    // Fired on the transport's own thread, in the order the events occurred.
    // Never fired from inside open().
    struct Callbacks {
        std::function<void()> on_open;
        std::function<void(const std::string& text)> on_message;
        // Device closed the channel with a close frame
        std::function<void(const std::string& reason)> on_closed;
        // Connect, TLS, handshake, read or EOF failure
        std::function<void(const std::string& reason)> on_failure;
    };

    virtual ~Transport() = default;

    // Start opening the channel; returns immediately
    virtual void open(const SessionConfig& config, Callbacks callbacks) = 0;

    // Hand one text message to the channel; false if it is not open or the
    // message could not be accepted. A write that fails afterwards is
    // reported through on_failure.
    virtual bool send(const std::string& text) = 0;

    // Close the channel. No callbacks fire once this returns, except when it is
    // called from inside a callback, in which case none fire after that callback.
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

// Best-effort datagram endpoint used by discovery
class DatagramChannel {
public:
    struct Datagram {
        std::string payload;
        std::string sender;     // source IPv4 address
    };

    virtual ~DatagramChannel() = default;

    // Send a request to the discovery group
    virtual bool send(std::string_view payload) = 0;

    // Wait up to timeout_ms for one datagram; nullopt on timeout or error
    virtual std::optional<Datagram> receive(int timeout_ms) = 0;
};

using DatagramChannelFactory = std::function<std::unique_ptr<DatagramChannel>()>;

} // namespace tvremote
