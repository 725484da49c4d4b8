#include "wol.hpp"
#include <algorithm>
#include <charconv>

namespace tvremote::wol {

std::optional<std::array<uint8_t, MAC_SIZE>> parse_mac_address(std::string_view address) {
    std::array<uint8_t, MAC_SIZE> result{};

    if (address.size() != 17) {
        return std::nullopt;
    }

    const char separator = address[2];
    if (separator != ':' && separator != '-') {
        return std::nullopt;
    }

    for (size_t byte_idx = 0; byte_idx < MAC_SIZE; ++byte_idx) {
        size_t i = byte_idx * 3;
        if (byte_idx > 0 && address[i - 1] != separator) {
            return std::nullopt;
        }

        auto part = address.substr(i, 2);
        uint8_t value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value, 16);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
        result[byte_idx] = value;
    }

    return result;
}

MagicPacket magic_packet(std::span<const uint8_t, MAC_SIZE> mac) {
    MagicPacket packet{};
    std::fill_n(packet.begin(), MAC_SIZE, 0xFF);

    for (size_t rep = 0; rep < 16; ++rep) {
        std::copy(mac.begin(), mac.end(), packet.begin() + MAC_SIZE * (rep + 1));
    }
    return packet;
}

} // namespace tvremote::wol
