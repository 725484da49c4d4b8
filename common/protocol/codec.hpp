#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace tvremote::codec {

// Outbound control message: {"method": "...", "params": {...}}
struct Envelope {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// Inbound channel message: {"event": "...", "data": ...}
// data is null when the device omits it
struct Event {
    std::string event;
    nlohmann::json data;
};

std::string encode(const Envelope& envelope);

// Strict inverse of encode(): the frame must be a JSON object with a
// non-empty string "method" and an object "params"
std::optional<Envelope> decode_envelope(std::string_view frame);

// The frame must be a JSON object with a non-empty string "event"
std::optional<Event> decode_event(std::string_view frame);

} // namespace tvremote::codec
