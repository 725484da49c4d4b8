#pragma once

#include <core/transport.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace udp {

struct Socket {
    int fd = -1;

    bool is_open() const { return fd >= 0; }
    void close();

    // Move-only
    Socket() = default;
    explicit Socket(int fd) : fd(fd) {}
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
};

// IPv4 datagram socket bound to an ephemeral port
// broadcast enables SO_BROADCAST; multicast_ttl > 0 sets IP_MULTICAST_TTL
Socket open(bool broadcast, int multicast_ttl = 0);

bool send_to(const Socket& sock, const std::string& address, uint16_t port,
             std::span<const uint8_t> data);

// Wait up to timeout_ms for one datagram
std::optional<tvremote::DatagramChannel::Datagram> recv_from(const Socket& sock, int timeout_ms);

// SSDP search channel: sends to the discovery group, receives unicast replies
class SsdpChannel : public tvremote::DatagramChannel {
public:
    explicit SsdpChannel(Socket sock) : sock_(std::move(sock)) {}

    bool send(std::string_view payload) override;
    std::optional<Datagram> receive(int timeout_ms) override;

private:
    Socket sock_;
};

// nullptr if the socket cannot be opened
std::unique_ptr<tvremote::DatagramChannel> open_ssdp_channel();

} // namespace udp
