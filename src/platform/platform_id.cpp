#include "platform/platform_id.hpp"

namespace platform {

namespace {

constexpr bool is_arm64() {
#if defined(__aarch64__) || defined(_M_ARM64)
    return true;
#else
    return false;
#endif
}

} // namespace

Platform current() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

const char* name(Platform p) {
    switch (p) {
        case Platform::Windows: return "windows";
        case Platform::MacOS: return "macos";
        case Platform::Linux: return "linux";
    }
    return "unknown";
}

std::string default_process_name(Platform p) {
    switch (p) {
        case Platform::Windows:
            return "language_server_windows_x64.exe";
        case Platform::MacOS:
            return is_arm64() ? "language_server_macos_arm" : "language_server_macos_x64";
        case Platform::Linux:
            return is_arm64() ? "language_server_linux_arm" : "language_server_linux_x64";
    }
    return "language_server";
}

} // namespace platform
