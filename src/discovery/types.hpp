#pragma once

#include "gateway/gateway_verifier.hpp"

#include <optional>
#include <string>
#include <vector>

// Raw OS process metadata from one enumeration.
struct ProcessRecord {
    int pid = 0;
    int ppid = 0;
    std::string command_line;
};

// A process whose command line carries the server signature.
// port == 0 means the port has to be resolved from the listening sockets.
struct ServerCandidate {
    int pid = 0;
    int ppid = 0;
    int port = 0;
    std::string token;
    std::optional<std::string> workspace_id;
};

struct VerifiedEndpoint {
    std::string host;
    int port = 0;
    std::string token;
};

// Retry policy for one discovery call.
struct DiscoveryConfig {
    int attempts = 3;
    int base_delay_ms = 1000;
    int max_delay_ms = 8000;
};

struct ProbeAttempt {
    std::string host;
    int port = 0;
    ProbeResult result;
};

struct DiscoveryResult {
    std::optional<VerifiedEndpoint> endpoint;
    std::optional<ServerCandidate> candidate; // the process behind endpoint
    std::vector<ProbeAttempt> probes;
    int attempts = 0;

    bool found() const { return endpoint.has_value(); }
};
