#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tvremote::crypto {

// Standard base64 with padding, no line breaks
std::string base64_encode(std::span<const uint8_t> data);
std::string base64_encode(std::string_view text);

// Strict decode: rejects bad length, characters outside the alphabet and
// misplaced padding
std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded);

} // namespace tvremote::crypto
