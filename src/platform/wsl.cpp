#include "platform/wsl.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

namespace {

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

namespace wsl {

bool is_wsl_kernel(platform::Platform os, std::string_view proc_version) {
    if (os != platform::Platform::Linux) return false;

    std::string lower(proc_version);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower.find("microsoft") != std::string::npos || lower.find("wsl") != std::string::npos;
}

std::optional<std::string> first_nameserver(std::string_view resolv_conf) {
    static const std::regex re(R"(^\s*nameserver\s+(\d{1,3}(?:\.\d{1,3}){3})\b)");

    std::istringstream in{std::string(resolv_conf)};
    std::string line;
    while (std::getline(in, line)) {
        std::smatch m;
        if (std::regex_search(line, m, re)) return m[1].str();
    }
    return std::nullopt;
}

} // namespace wsl

WslBridgeResolver::WslBridgeResolver(platform::Platform os, std::string version_path,
                                     std::string resolv_path)
    : os_(os), version_path_(std::move(version_path)), resolv_path_(std::move(resolv_path)) {}

bool WslBridgeResolver::is_wsl() {
    if (is_wsl_) return *is_wsl_;
    if (os_ != platform::Platform::Linux) {
        is_wsl_ = false;
        return false;
    }
    auto version = read_file(version_path_);
    is_wsl_ = version && wsl::is_wsl_kernel(os_, *version);
    return *is_wsl_;
}

std::optional<std::string> WslBridgeResolver::host_bridge_address() const {
    auto conf = read_file(resolv_path_);
    if (!conf) return std::nullopt;
    return wsl::first_nameserver(*conf);
}
