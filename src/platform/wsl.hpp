#pragma once

#include "platform/platform_id.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace wsl {

// Linux kernel whose version string carries Microsoft's or WSL's signature.
bool is_wsl_kernel(platform::Platform os, std::string_view proc_version);

// First "nameserver <IPv4>" of a resolv.conf. Under WSL NAT networking this
// is the Windows host as seen from the guest.
std::optional<std::string> first_nameserver(std::string_view resolv_conf);

} // namespace wsl

// Supplies the Windows host address when running inside WSL. The kernel
// check runs once; nothing is read on non-Linux platforms.
class WslBridgeResolver {
public:
    explicit WslBridgeResolver(platform::Platform os,
                               std::string version_path = "/proc/version",
                               std::string resolv_path = "/etc/resolv.conf");

    bool is_wsl();
    std::optional<std::string> host_bridge_address() const;

private:
    platform::Platform os_;
    std::string version_path_;
    std::string resolv_path_;
    std::optional<bool> is_wsl_;
};
