#pragma once

#include "discovery/types.hpp"
#include "gateway/gateway_verifier.hpp"
#include "platform/platform_strategy.hpp"
#include "platform/shell_executor.hpp"
#include "platform/wsl.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

inline constexpr const char* kLoopbackHost = "127.0.0.1";

// Port resolution and gateway probing shared by the strict and the ambient
// search. Every probe made is appended to the caller's log.
class EndpointVerifier {
public:
    EndpointVerifier(PlatformStrategy& strategy, ShellExecutor& shell,
                     GatewayVerifier& gateway, WslBridgeResolver& wsl,
                     std::chrono::milliseconds port_list_timeout, bool verbose = false);

    // Listening ports of the candidate's process; empty when none could be found.
    // A port given on the command line is used as-is unless `confirm_known`
    // asks for it to appear in the listening set as well.
    std::vector<int> resolve_ports(const ServerCandidate& candidate, bool confirm_known);

    // Loopback first, then the WSL host bridge, for each port in order.
    std::optional<VerifiedEndpoint> verify(const ServerCandidate& candidate,
                                           const std::vector<int>& ports,
                                           std::vector<ProbeAttempt>& probes);

    // resolve_ports + verify.
    std::optional<VerifiedEndpoint> establish(const ServerCandidate& candidate,
                                              bool confirm_known,
                                              std::vector<ProbeAttempt>& probes);

private:
    std::vector<int> listening_ports(int pid);
    bool try_host(const std::string& host, int port, const std::string& token,
                  std::vector<ProbeAttempt>& probes);
    void log(const std::string& msg);

    PlatformStrategy& strategy_;
    ShellExecutor& shell_;
    GatewayVerifier& gateway_;
    WslBridgeResolver& wsl_;
    std::chrono::milliseconds port_list_timeout_;
    bool verbose_;
};
