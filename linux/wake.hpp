#pragma once

#include <protocol/packets.hpp>
#include <types/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wake {

// Broadcast a Wake-on-LAN magic packet for mac ("AA:BB:CC:DD:EE:FF" or
// "AA-BB-CC-DD-EE-FF"). Returns the error, or nullopt once the packet is sent.
std::optional<tvremote::Error> send(std::string_view mac,
                                    const std::string& broadcast = tvremote::packets::wol::BROADCAST_ADDRESS,
                                    uint16_t port = tvremote::packets::wol::PORT);

} // namespace wake
