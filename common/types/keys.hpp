#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tvremote {

enum class RemoteKey : uint8_t {
    Power,
    PowerOff,
    Home,
    Menu,
    Source,
    Guide,
    Tools,
    Info,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Return,
    Exit,
    ChannelList,
    ChannelUp,
    ChannelDown,
    PreviousChannel,
    VolumeUp,
    VolumeDown,
    Mute,
    Num0,
    Num1,
    Num2,
    Num3,
    Num4,
    Num5,
    Num6,
    Num7,
    Num8,
    Num9,
    Play,
    Pause,
    Stop,
    Rewind,
    FastForward,
    Red,
    Green,
    Yellow,
    Blue,
};

// Click is a single press; Press/Release bracket a long press
enum class KeyAction : uint8_t {
    Click,
    Press,
    Release,
};

inline std::string_view to_string(KeyAction action) {
    switch (action) {
        case KeyAction::Click: return "Click";
        case KeyAction::Press: return "Press";
        case KeyAction::Release: return "Release";
    }
    return "Click";
}

inline std::optional<KeyAction> key_action_from_string(std::string_view s) {
    if (s == "Click") return KeyAction::Click;
    if (s == "Press") return KeyAction::Press;
    if (s == "Release") return KeyAction::Release;
    return std::nullopt;
}

// Wire code sent in DataOfCmd
inline std::string_view to_key_code(RemoteKey key) {
    switch (key) {
        case RemoteKey::Power: return "KEY_POWER";
        case RemoteKey::PowerOff: return "KEY_POWEROFF";
        case RemoteKey::Home: return "KEY_HOME";
        case RemoteKey::Menu: return "KEY_MENU";
        case RemoteKey::Source: return "KEY_SOURCE";
        case RemoteKey::Guide: return "KEY_GUIDE";
        case RemoteKey::Tools: return "KEY_TOOLS";
        case RemoteKey::Info: return "KEY_INFO";
        case RemoteKey::Up: return "KEY_UP";
        case RemoteKey::Down: return "KEY_DOWN";
        case RemoteKey::Left: return "KEY_LEFT";
        case RemoteKey::Right: return "KEY_RIGHT";
        case RemoteKey::Enter: return "KEY_ENTER";
        case RemoteKey::Return: return "KEY_RETURN";
        case RemoteKey::Exit: return "KEY_EXIT";
        case RemoteKey::ChannelList: return "KEY_CH_LIST";
        case RemoteKey::ChannelUp: return "KEY_CHUP";
        case RemoteKey::ChannelDown: return "KEY_CHDOWN";
        case RemoteKey::PreviousChannel: return "KEY_PRECH";
        case RemoteKey::VolumeUp: return "KEY_VOLUP";
        case RemoteKey::VolumeDown: return "KEY_VOLDOWN";
        case RemoteKey::Mute: return "KEY_MUTE";
        case RemoteKey::Num0: return "KEY_0";
        case RemoteKey::Num1: return "KEY_1";
        case RemoteKey::Num2: return "KEY_2";
        case RemoteKey::Num3: return "KEY_3";
        case RemoteKey::Num4: return "KEY_4";
        case RemoteKey::Num5: return "KEY_5";
        case RemoteKey::Num6: return "KEY_6";
        case RemoteKey::Num7: return "KEY_7";
        case RemoteKey::Num8: return "KEY_8";
        case RemoteKey::Num9: return "KEY_9";
        case RemoteKey::Play: return "KEY_PLAY";
        case RemoteKey::Pause: return "KEY_PAUSE";
        case RemoteKey::Stop: return "KEY_STOP";
        case RemoteKey::Rewind: return "KEY_REWIND";
        case RemoteKey::FastForward: return "KEY_FF";
        case RemoteKey::Red: return "KEY_RED";
        case RemoteKey::Green: return "KEY_GREEN";
        case RemoteKey::Yellow: return "KEY_YELLOW";
        case RemoteKey::Blue: return "KEY_CYAN";
    }
    return "KEY_ENTER";
}

inline std::optional<RemoteKey> key_from_code(std::string_view code) {
    static const std::unordered_map<std::string_view, RemoteKey> code_map = {
        {"KEY_POWER", RemoteKey::Power},
        {"KEY_POWEROFF", RemoteKey::PowerOff},
        {"KEY_HOME", RemoteKey::Home},
        {"KEY_MENU", RemoteKey::Menu},
        {"KEY_SOURCE", RemoteKey::Source},
        {"KEY_GUIDE", RemoteKey::Guide},
        {"KEY_TOOLS", RemoteKey::Tools},
        {"KEY_INFO", RemoteKey::Info},
        {"KEY_UP", RemoteKey::Up},
        {"KEY_DOWN", RemoteKey::Down},
        {"KEY_LEFT", RemoteKey::Left},
        {"KEY_RIGHT", RemoteKey::Right},
        {"KEY_ENTER", RemoteKey::Enter},
        {"KEY_RETURN", RemoteKey::Return},
        {"KEY_EXIT", RemoteKey::Exit},
        {"KEY_CH_LIST", RemoteKey::ChannelList},
        {"KEY_CHUP", RemoteKey::ChannelUp},
        {"KEY_CHDOWN", RemoteKey::ChannelDown},
        {"KEY_PRECH", RemoteKey::PreviousChannel},
        {"KEY_VOLUP", RemoteKey::VolumeUp},
        {"KEY_VOLDOWN", RemoteKey::VolumeDown},
        {"KEY_MUTE", RemoteKey::Mute},
        {"KEY_0", RemoteKey::Num0},
        {"KEY_1", RemoteKey::Num1},
        {"KEY_2", RemoteKey::Num2},
        {"KEY_3", RemoteKey::Num3},
        {"KEY_4", RemoteKey::Num4},
        {"KEY_5", RemoteKey::Num5},
        {"KEY_6", RemoteKey::Num6},
        {"KEY_7", RemoteKey::Num7},
        {"KEY_8", RemoteKey::Num8},
        {"KEY_9", RemoteKey::Num9},
        {"KEY_PLAY", RemoteKey::Play},
        {"KEY_PAUSE", RemoteKey::Pause},
        {"KEY_STOP", RemoteKey::Stop},
        {"KEY_REWIND", RemoteKey::Rewind},
        {"KEY_FF", RemoteKey::FastForward},
        {"KEY_RED", RemoteKey::Red},
        {"KEY_GREEN", RemoteKey::Green},
        {"KEY_YELLOW", RemoteKey::Yellow},
        {"KEY_CYAN", RemoteKey::Blue},
    };

    auto it = code_map.find(code);
    return it != code_map.end() ? std::optional<RemoteKey>(it->second) : std::nullopt;
}

// Accepts "KEY_VOLUP" as well as the short spelling "volup" / "VolUp"
inline std::optional<RemoteKey> key_from_string(std::string_view s) {
    if (auto key = key_from_code(s)) {
        return key;
    }

    std::string code = "KEY_";
    for (char c : s) {
        code.push_back((c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c);
    }
    return key_from_code(code);
}

} // namespace tvremote
