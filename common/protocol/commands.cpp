#include "commands.hpp"
#include "crypto.hpp"
#include "packets.hpp"

namespace tvremote::commands {

namespace {

std::optional<std::string> param(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

codec::Envelope key_press(const KeyPress& press) {
    using namespace packets;

    codec::Envelope envelope;
    envelope.method = methods::REMOTE_CONTROL;
    envelope.params[params::CMD] = std::string(to_string(press.action));
    envelope.params[params::DATA_OF_CMD] = std::string(to_key_code(press.key));
    envelope.params[params::OPTION] = params::OPTION_FALSE;
    envelope.params[params::TYPE_OF_REMOTE] = params::SEND_REMOTE_KEY;
    return envelope;
}

codec::Envelope text_input(const TextInput& input) {
    using namespace packets;

    codec::Envelope envelope;
    envelope.method = methods::REMOTE_CONTROL;
    envelope.params[params::CMD] = crypto::base64_encode(std::string_view(input.text));
    envelope.params[params::DATA_OF_CMD] = params::DATA_BASE64;
    envelope.params[params::TYPE_OF_REMOTE] = params::SEND_INPUT_STRING;
    return envelope;
}

codec::Envelope encode(const RemoteCommand& command) {
    if (const auto* press = std::get_if<KeyPress>(&command)) {
        return key_press(*press);
    }
    return text_input(std::get<TextInput>(command));
}

std::string encode_frame(const RemoteCommand& command) {
    return codec::encode(encode(command));
}

std::optional<RemoteCommand> decode(const codec::Envelope& envelope) {
    using namespace packets;

    if (envelope.method != methods::REMOTE_CONTROL) {
        return std::nullopt;
    }

    auto type = param(envelope.params, params::TYPE_OF_REMOTE);
    auto cmd = param(envelope.params, params::CMD);
    auto data = param(envelope.params, params::DATA_OF_CMD);
    if (!type || !cmd || !data) {
        return std::nullopt;
    }

    if (*type == params::SEND_REMOTE_KEY) {
        auto action = key_action_from_string(*cmd);
        auto key = key_from_code(*data);
        if (!action || !key) {
            return std::nullopt;
        }
        return KeyPress{*key, *action};
    }

    if (*type == params::SEND_INPUT_STRING) {
        if (*data != params::DATA_BASE64) {
            return std::nullopt;
        }
        auto bytes = crypto::base64_decode(*cmd);
        if (!bytes) {
            return std::nullopt;
        }
        return TextInput{std::string(bytes->begin(), bytes->end())};
    }

    return std::nullopt;
}

std::optional<RemoteCommand> decode_frame(std::string_view frame) {
    auto envelope = codec::decode_envelope(frame);
    if (!envelope) {
        return std::nullopt;
    }
    return decode(*envelope);
}

} // namespace tvremote::commands
