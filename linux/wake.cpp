#include "wake.hpp"
#include "udp.hpp"

#include <protocol/wol.hpp>

#include <iostream>

namespace wake {

std::optional<tvremote::Error> send(std::string_view mac, const std::string& broadcast, uint16_t port) {
    auto address = tvremote::wol::parse_mac_address(mac);
    if (!address) {
        return tvremote::Error{tvremote::ErrorKind::InvalidConfiguration,
                               "invalid MAC address: " + std::string(mac)};
    }

    auto packet = tvremote::wol::magic_packet(*address);

    udp::Socket sock = udp::open(true);
    if (!sock.is_open()) {
        return tvremote::Error{tvremote::ErrorKind::TransportFailure, "cannot open broadcast socket"};
    }

    if (!udp::send_to(sock, broadcast, port, packet)) {
        return tvremote::Error{tvremote::ErrorKind::TransportFailure,
                               "failed to send magic packet to " + broadcast};
    }

    std::cout << "wol: magic packet for " << mac << " sent to " << broadcast << ":" << port << std::endl;
    return std::nullopt;
}

} // namespace wake
