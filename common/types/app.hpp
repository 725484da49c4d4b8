#pragma once

#include "enums.hpp"
#include <string>

namespace tvremote {

struct AppStatus {
    std::string id;
    std::string name;
    std::string version;
    AppState state = AppState::NotInstalled;
};

} // namespace tvremote
