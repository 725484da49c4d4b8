#include "crypto.hpp"
#include <openssl/evp.h>

namespace tvremote::crypto {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string base64_encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 chars per 3 input bytes plus a NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string base64_encode(std::string_view text) {
    return base64_encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    // Padding may only appear as the last one or two characters
    size_t padding = 0;
    if (encoded.back() == '=') ++padding;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ++padding;

    for (size_t i = 0; i < encoded.size() - padding; ++i) {
        if (!is_base64_char(encoded[i])) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding bytes as zero output
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace tvremote::crypto
