#pragma once

#include "keys.hpp"
#include <string>
#include <variant>

namespace tvremote {

struct KeyPress {
    RemoteKey key = RemoteKey::Enter;
    KeyAction action = KeyAction::Click;

    bool operator==(const KeyPress&) const = default;
};

// Direct text injection; only devices with IME support accept it
struct TextInput {
    std::string text;

    bool operator==(const TextInput&) const = default;
};

using RemoteCommand = std::variant<KeyPress, TextInput>;

inline RemoteCommand key_command(RemoteKey key, KeyAction action = KeyAction::Click) {
    return KeyPress{key, action};
}

inline RemoteCommand text_command(std::string text) {
    return TextInput{std::move(text)};
}

// Short human-readable label used in logs and notifications
inline std::string describe(const RemoteCommand& command) {
    if (const auto* press = std::get_if<KeyPress>(&command)) {
        std::string label(to_key_code(press->key));
        if (press->action != KeyAction::Click) {
            label += " (";
            label += to_string(press->action);
            label += ")";
        }
        return label;
    }
    return "text[" + std::to_string(std::get<TextInput>(command).text.size()) + "]";
}

} // namespace tvremote
