#pragma once

#include "platform/platform_strategy.hpp"

// Windows: CIM/WMI through PowerShell for processes, Get-NetTCPConnection
// (netstat as fallback) for sockets.
class WindowsStrategy : public PlatformStrategy {
public:
    std::string list_candidates_command(const std::string& process_name) const override;
    std::string list_signature_command(std::string_view needle) const override;
    std::optional<std::vector<ProcessRecord>>
        parse_candidates(const std::string& raw) const override;
    std::string list_ports_command(int pid) override;
    std::vector<int> parse_ports(const std::string& raw, int pid) const override;

    // ConvertTo-Json output, possibly preceded by profile/banner noise.
    static std::optional<std::vector<ProcessRecord>> parse_json(const std::string& raw);

    // WMIC /format:csv output (Node,CommandLine,ParentProcessId,ProcessId).
    static std::optional<std::vector<ProcessRecord>> parse_csv(const std::string& raw);
};
