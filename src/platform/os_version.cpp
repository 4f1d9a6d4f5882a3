#include "platform/os_version.hpp"

#include <charconv>
#include <format>
#include <sstream>

namespace platform {

namespace {

int leading_number(std::string_view s) {
    int value = 0;
    std::from_chars(s.data(), s.data() + s.size(), value);
    return value;
}

std::string macos_name(int darwin_major) {
    switch (darwin_major) {
        case 24: return "macOS 15 Sequoia";
        case 23: return "macOS 14 Sonoma";
        case 22: return "macOS 13 Ventura";
        case 21: return "macOS 12 Monterey";
        case 20: return "macOS 11 Big Sur";
        case 19: return "macOS 10.15 Catalina";
        case 18: return "macOS 10.14 Mojave";
        default: return {};
    }
}

} // namespace

std::string pretty_name(std::string_view os_release) {
    constexpr std::string_view key = "PRETTY_NAME=";
    std::istringstream in{std::string(os_release)};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.starts_with(key)) continue;
        auto value = line.substr(key.size());
        if (!value.empty() && value.front() == '"') value.erase(0, 1);
        auto quote = value.find('"');
        if (quote != std::string::npos) value.erase(quote);
        return value;
    }
    return {};
}

std::string describe_os(const HostInfo& info) {
    switch (info.os) {
        case Platform::Windows: {
            // release is "major.minor.build"
            auto last_dot = info.release.rfind('.');
            int build = last_dot == std::string::npos
                ? 0 : leading_number(std::string_view(info.release).substr(last_dot + 1));
            if (build >= 22000) return std::format("Windows 11 Build {} ({})", build, info.arch);
            if (build >= 10240) return std::format("Windows 10 Build {} ({})", build, info.arch);
            if (build >= 9200) return std::format("Windows 8.1/8 Build {} ({})", build, info.arch);
            return std::format("Windows (Build {}) ({})", info.release, info.arch);
        }
        case Platform::MacOS: {
            auto name = macos_name(leading_number(info.release));
            if (name.empty()) name = "macOS (Darwin " + info.release + ")";
            return std::format("{} ({})", name, info.arch);
        }
        case Platform::Linux:
            if (!info.distro.empty()) {
                return std::format("{} (Kernel {}, {})", info.distro, info.release, info.arch);
            }
            return std::format("Linux {} ({})", info.release, info.arch);
    }
    return info.release;
}

} // namespace platform
