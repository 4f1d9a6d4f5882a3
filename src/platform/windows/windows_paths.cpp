#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata) + "\\server-locator";
    const char* profile = std::getenv("USERPROFILE");
    if (!profile) return {};
    return std::string(profile) + "\\AppData\\Roaming\\server-locator";
}

} // namespace platform
