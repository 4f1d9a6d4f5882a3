#include "platform/port_tool_cache.hpp"

#include <format>

const char* tool_name(PortTool tool) {
    switch (tool) {
        case PortTool::Lsof: return "lsof";
        case PortTool::Ss: return "ss";
        case PortTool::Netstat: return "netstat";
    }
    return "";
}

PortToolCache::PortToolCache(ShellExecutor& shell, std::chrono::milliseconds probe_timeout)
    : shell_(shell), probe_timeout_(probe_timeout) {}

std::optional<PortTool> PortToolCache::tool() {
    if (probed_) return tool_;
    probed_ = true;

    for (auto candidate : {PortTool::Lsof, PortTool::Ss, PortTool::Netstat}) {
        if (is_available(candidate)) {
            tool_ = candidate;
            break;
        }
    }
    return tool_;
}

bool PortToolCache::is_available(PortTool tool) {
    auto res = shell_.run(std::format("command -v {} >/dev/null 2>&1", tool_name(tool)),
                          probe_timeout_);
    return res.has_value();
}
