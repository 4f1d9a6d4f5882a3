#pragma once

#include "platform/platform_id.hpp"

#include <string>
#include <string_view>

namespace platform {

struct HostInfo {
    Platform os = Platform::Linux;
    std::string release; // kernel release, Darwin release or Windows "major.minor.build"
    std::string arch;
    std::string distro;  // PRETTY_NAME from /etc/os-release (Linux only)
};

// Gathered from uname(2) / RtlGetVersion.
HostInfo host_info();

// "Ubuntu 24.04 LTS (Kernel 6.8.0, x86_64)", "macOS 14 Sonoma (arm64)",
// "Windows 11 Build 22631 (x86_64)".
std::string describe_os(const HostInfo& info);

// PRETTY_NAME value of an os-release file, empty when absent.
std::string pretty_name(std::string_view os_release);

} // namespace platform
