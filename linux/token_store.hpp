#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace token_store {

// $XDG_CONFIG_HOME/tvremote/token, or $HOME/.config/tvremote/token
// nullopt if neither variable is set
std::optional<std::filesystem::path> default_path();

// First line of the file, trimmed; nullopt if missing or empty
std::optional<std::string> load(const std::filesystem::path& path);

// Creates parent directories; file is written with owner-only permissions
bool save(const std::filesystem::path& path, const std::string& token);

} // namespace token_store
