#pragma once

#include "discovery/types.hpp"
#include "platform/platform_id.hpp"
#include "platform/shell_executor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// OS-specific process and socket introspection. Builds the shell commands
// and parses their output; running them is the caller's job.
class PlatformStrategy {
public:
    virtual ~PlatformStrategy() = default;

    // Processes whose image name matches `process_name`.
    virtual std::string list_candidates_command(const std::string& process_name) const = 0;

    // Every process whose command line contains `needle`, whatever its image name.
    virtual std::string list_signature_command(std::string_view needle) const = 0;

    // nullopt when the output is not in a recognized format.
    virtual std::optional<std::vector<ProcessRecord>>
        parse_candidates(const std::string& raw) const = 0;

    // Listening TCP ports of `pid`. May probe for available tools on first use.
    virtual std::string list_ports_command(int pid) = 0;

    // Deduplicated, ascending, each in (0, 65535].
    virtual std::vector<int> parse_ports(const std::string& raw, int pid) const = 0;
};

// One strategy per discovery session; it owns the session's tool cache.
std::unique_ptr<PlatformStrategy> make_strategy(platform::Platform os, ShellExecutor& shell,
                                                std::chrono::milliseconds tool_probe_timeout);
