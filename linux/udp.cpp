#include "udp.hpp"

#include <protocol/packets.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace udp {

Socket::Socket(Socket&& other) noexcept : fd(other.fd) {
    other.fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

Socket::~Socket() {
    close();
}

void Socket::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

Socket open(bool broadcast, int multicast_ttl) {
    int sock = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        std::cerr << "udp: socket creation failed: " << std::strerror(errno) << std::endl;
        return {};
    }

    Socket result(sock);

    if (broadcast) {
        int one = 1;
        if (setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) < 0) {
            std::cerr << "udp: cannot enable broadcast: " << std::strerror(errno) << std::endl;
            return {};
        }
    }

    if (multicast_ttl > 0) {
        unsigned char ttl = static_cast<unsigned char>(multicast_ttl);
        if (setsockopt(sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
            std::cerr << "udp: cannot set multicast ttl: " << std::strerror(errno) << std::endl;
            return {};
        }
    }

    struct sockaddr_in local = {};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;

    if (bind(sock, reinterpret_cast<struct sockaddr*>(&local), sizeof(local)) < 0) {
        std::cerr << "udp: bind failed: " << std::strerror(errno) << std::endl;
        return {};
    }

    return result;
}

bool send_to(const Socket& sock, const std::string& address, uint16_t port,
             std::span<const uint8_t> data) {
    if (!sock.is_open()) return false;

    struct sockaddr_in remote = {};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &remote.sin_addr) != 1) {
        std::cerr << "udp: invalid IPv4 address: " << address << std::endl;
        return false;
    }

    ssize_t written = sendto(sock.fd, data.data(), data.size(), 0,
                             reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote));
    if (written < 0) {
        std::cerr << "udp: send to " << address << " failed: " << std::strerror(errno) << std::endl;
        return false;
    }

    return static_cast<size_t>(written) == data.size();
}

std::optional<tvremote::DatagramChannel::Datagram> recv_from(const Socket& sock, int timeout_ms) {
    if (!sock.is_open()) return std::nullopt;

    struct pollfd pfd = {};
    pfd.fd = sock.fd;
    pfd.events = POLLIN;

    int ret = poll(&pfd, 1, timeout_ms);
    if (ret <= 0 || !(pfd.revents & POLLIN)) {
        return std::nullopt;
    }

    char buffer[2048];
    struct sockaddr_in sender = {};
    socklen_t sender_len = sizeof(sender);
    ssize_t n = recvfrom(sock.fd, buffer, sizeof(buffer), 0,
                         reinterpret_cast<struct sockaddr*>(&sender), &sender_len);
    if (n < 0) {
        return std::nullopt;
    }

    char addr[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &sender.sin_addr, addr, sizeof(addr));

    tvremote::DatagramChannel::Datagram datagram;
    datagram.payload.assign(buffer, static_cast<size_t>(n));
    datagram.sender = addr;
    return datagram;
}

bool SsdpChannel::send(std::string_view payload) {
    return send_to(sock_, tvremote::packets::ssdp::MULTICAST_ADDRESS, tvremote::packets::ssdp::PORT,
                   std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()));
}

std::optional<tvremote::DatagramChannel::Datagram> SsdpChannel::receive(int timeout_ms) {
    return recv_from(sock_, timeout_ms);
}

std::unique_ptr<tvremote::DatagramChannel> open_ssdp_channel() {
    Socket sock = open(false, 2);
    if (!sock.is_open()) {
        return nullptr;
    }
    return std::make_unique<SsdpChannel>(std::move(sock));
}

} // namespace udp
