#pragma once

#include "config.hpp"
#include "discovery/endpoint_verifier.hpp"
#include "discovery/signature.hpp"
#include "discovery/types.hpp"

#include <chrono>
#include <functional>
#include <vector>

// Strict discovery: processes selected by image name, signature checked
// against the product's app-data directory, retried with exponential backoff.
class ProcessFinder {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ProcessFinder(Config config, PlatformStrategy& strategy, ShellExecutor& shell,
                  GatewayVerifier& gateway, WslBridgeResolver& wsl, bool verbose = false,
                  Sleeper sleeper = {});

    DiscoveryResult find(const DiscoveryConfig& policy);

    // Candidates from one enumeration; empty when listing or parsing failed.
    std::vector<ServerCandidate> enumerate();

    // base * 2^(attempt-1), capped at max_delay_ms.
    static std::chrono::milliseconds backoff_delay(const DiscoveryConfig& policy, int attempt);

private:
    void log(const std::string& msg);

    Config config_;
    PlatformStrategy& strategy_;
    ShellExecutor& shell_;
    EndpointVerifier verifier_;
    signature::MatchOptions match_;
    bool verbose_;
    Sleeper sleeper_;
};
