#include "codec.hpp"

namespace tvremote::codec {

namespace {

// Parse without exceptions; discarded values come back as nullopt
std::optional<nlohmann::json> parse_object(std::string_view frame) {
    auto j = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    return j;
}

std::optional<std::string> string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string encode(const Envelope& envelope) {
    nlohmann::json j;
    j["method"] = envelope.method;
    j["params"] = envelope.params.is_null() ? nlohmann::json::object() : envelope.params;
    return j.dump();
}

std::optional<Envelope> decode_envelope(std::string_view frame) {
    auto j = parse_object(frame);
    if (!j) {
        return std::nullopt;
    }

    auto method = string_field(*j, "method");
    if (!method) {
        return std::nullopt;
    }

    auto params = j->find("params");
    if (params == j->end() || !params->is_object()) {
        return std::nullopt;
    }

    return Envelope{std::move(*method), *params};
}

std::optional<Event> decode_event(std::string_view frame) {
    auto j = parse_object(frame);
    if (!j) {
        return std::nullopt;
    }

    auto event = string_field(*j, "event");
    if (!event) {
        return std::nullopt;
    }

    Event result;
    result.event = std::move(*event);
    if (auto data = j->find("data"); data != j->end()) {
        result.data = *data;
    }
    return result;
}

} // namespace tvremote::codec
