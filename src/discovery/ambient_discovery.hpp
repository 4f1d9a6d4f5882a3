#pragma once

#include "config.hpp"
#include "discovery/endpoint_verifier.hpp"
#include "discovery/types.hpp"

#include <vector>

// Signature-only discovery: any process whose arguments carry the CSRF
// token marker, whatever its binary is called and wherever its data lives.
// Single pass; meant to run once after the strict search gives up.
class AmbientDiscovery {
public:
    AmbientDiscovery(Config config, PlatformStrategy& strategy, ShellExecutor& shell,
                     GatewayVerifier& gateway, WslBridgeResolver& wsl, bool verbose = false);

    DiscoveryResult run();

    // Signature matches over all processes; empty when listing or parsing failed.
    std::vector<ServerCandidate> locate();

private:
    void log(const std::string& msg);

    Config config_;
    PlatformStrategy& strategy_;
    ShellExecutor& shell_;
    EndpointVerifier verifier_;
    bool verbose_;
};
