#include "token_store.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace token_store {

std::optional<std::filesystem::path> default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "tvremote" / "token";
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".config" / "tvremote" / "token";
    }

    return std::nullopt;
}

std::optional<std::string> load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    std::string token;
    std::getline(in, token);

    auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

bool save(const std::filesystem::path& path, const std::string& token) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "token: cannot create " << path.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            std::cerr << "token: cannot write " << path << std::endl;
            return false;
        }
        out << token << '\n';
        if (!out) {
            std::cerr << "token: write to " << path << " failed" << std::endl;
            return false;
        }
    }

    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        std::cerr << "token: cannot restrict permissions on " << path << ": " << ec.message() << std::endl;
    }
    return true;
}

} // namespace token_store
