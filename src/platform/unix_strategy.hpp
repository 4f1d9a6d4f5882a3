#pragma once

#include "platform/platform_strategy.hpp"
#include "platform/port_tool_cache.hpp"

// macOS and Linux: ps for processes; lsof, ss or netstat for sockets.
class UnixStrategy : public PlatformStrategy {
public:
    UnixStrategy(platform::Platform os, ShellExecutor& shell,
                 std::chrono::milliseconds tool_probe_timeout);

    std::string list_candidates_command(const std::string& process_name) const override;
    std::string list_signature_command(std::string_view needle) const override;
    std::optional<std::vector<ProcessRecord>>
        parse_candidates(const std::string& raw) const override;
    std::string list_ports_command(int pid) override;
    std::vector<int> parse_ports(const std::string& raw, int pid) const override;

    const PortToolCache& tool_cache() const { return tools_; }

private:
    // `ps | grep '[x]yz'`: the bracket keeps grep from matching its own command line.
    static std::string ps_grep(std::string_view pattern);

    platform::Platform os_;
    PortToolCache tools_;
};
