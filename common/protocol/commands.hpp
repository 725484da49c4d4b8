#pragma once

#include "codec.hpp"
#include "../types/command.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tvremote::commands {

// Key press: {"Cmd": "Click", "DataOfCmd": "KEY_ENTER", "Option": "false",
//             "TypeOfRemote": "SendRemoteKey"}
codec::Envelope key_press(const KeyPress& press);

// Text injection: {"Cmd": "<base64 text>", "DataOfCmd": "base64",
//                  "TypeOfRemote": "SendInputString"}
codec::Envelope text_input(const TextInput& input);

codec::Envelope encode(const RemoteCommand& command);

// Serialized frame ready for the channel
std::string encode_frame(const RemoteCommand& command);

// Inverse of encode(); rejects envelopes that are not ms.remote.control, lack
// the TypeOfRemote discriminator, or carry an unknown key / bad base64
std::optional<RemoteCommand> decode(const codec::Envelope& envelope);

std::optional<RemoteCommand> decode_frame(std::string_view frame);

} // namespace tvremote::commands
