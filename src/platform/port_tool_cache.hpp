#pragma once

#include "platform/shell_executor.hpp"

#include <chrono>
#include <optional>

enum class PortTool { Lsof, Ss, Netstat };

const char* tool_name(PortTool tool);

// Which socket-listing tool this machine has. Probed once per instance in
// priority order lsof, ss, netstat; "none found" is remembered too.
class PortToolCache {
public:
    PortToolCache(ShellExecutor& shell, std::chrono::milliseconds probe_timeout);

    std::optional<PortTool> tool();
    bool probed() const { return probed_; }

private:
    bool is_available(PortTool tool);

    ShellExecutor& shell_;
    std::chrono::milliseconds probe_timeout_;
    bool probed_ = false;
    std::optional<PortTool> tool_;
};
