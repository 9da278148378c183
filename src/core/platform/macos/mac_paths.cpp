#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/Library/Application Support/appsense";
}

} // namespace platform
