#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tvremote::wol {

constexpr size_t MAC_SIZE = 6;
constexpr size_t MAGIC_PACKET_SIZE = 102;

using MagicPacket = std::array<uint8_t, MAGIC_PACKET_SIZE>;

// Parse MAC address string (AA:BB:CC:DD:EE:FF or AA-BB-CC-DD-EE-FF) to bytes
std::optional<std::array<uint8_t, MAC_SIZE>> parse_mac_address(std::string_view address);

// 6 x 0xFF followed by the MAC repeated 16 times
MagicPacket magic_packet(std::span<const uint8_t, MAC_SIZE> mac);

} // namespace tvremote::wol
