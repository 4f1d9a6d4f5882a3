#include "discovery/endpoint_verifier.hpp"

#include <algorithm>
#include <format>
#include <print>

EndpointVerifier::EndpointVerifier(PlatformStrategy& strategy, ShellExecutor& shell,
                                   GatewayVerifier& gateway, WslBridgeResolver& wsl,
                                   std::chrono::milliseconds port_list_timeout, bool verbose)
    : strategy_(strategy), shell_(shell), gateway_(gateway), wsl_(wsl),
      port_list_timeout_(port_list_timeout), verbose_(verbose) {}

std::vector<int> EndpointVerifier::listening_ports(int pid) {
    auto cmd = strategy_.list_ports_command(pid);
    auto out = shell_.run(cmd, port_list_timeout_);
    if (!out) {
        log(std::format("Port listing for pid {} failed: {}", pid, out.error()));
        return {};
    }
    return strategy_.parse_ports(*out, pid);
}

std::vector<int> EndpointVerifier::resolve_ports(const ServerCandidate& candidate,
                                                 bool confirm_known) {
    if (candidate.port > 0) {
        if (!confirm_known) return {candidate.port};

        auto listening = listening_ports(candidate.pid);
        // A failed listing proves nothing; keep the advertised port.
        if (listening.empty() || std::ranges::contains(listening, candidate.port)) {
            return {candidate.port};
        }
        log(std::format("pid {} is not listening on advertised port {}", candidate.pid,
                        candidate.port));
        return {};
    }

    auto ports = listening_ports(candidate.pid);
    if (ports.empty()) {
        log(std::format("No listening ports for pid {}", candidate.pid));
    }
    return ports;
}

bool EndpointVerifier::try_host(const std::string& host, int port, const std::string& token,
                                std::vector<ProbeAttempt>& probes) {
    auto result = gateway_.probe(host, port, token);
    bool ok = result.success;
    if (!ok) {
        log(std::format("Probe {}:{} failed ({} {}{})", host, port, result.protocol,
                        result.status_code, result.error ? ", " + *result.error : ""));
    }
    probes.push_back({.host = host, .port = port, .result = std::move(result)});
    return ok;
}

std::optional<VerifiedEndpoint> EndpointVerifier::verify(const ServerCandidate& candidate,
                                                         const std::vector<int>& ports,
                                                         std::vector<ProbeAttempt>& probes) {
    for (int port : ports) {
        if (try_host(kLoopbackHost, port, candidate.token, probes)) {
            return VerifiedEndpoint{.host = kLoopbackHost, .port = port, .token = candidate.token};
        }

        if (!wsl_.is_wsl()) continue;
        auto bridge = wsl_.host_bridge_address();
        if (!bridge || *bridge == kLoopbackHost) continue;

        if (try_host(*bridge, port, candidate.token, probes)) {
            return VerifiedEndpoint{.host = *bridge, .port = port, .token = candidate.token};
        }
    }
    return std::nullopt;
}

std::optional<VerifiedEndpoint> EndpointVerifier::establish(const ServerCandidate& candidate,
                                                            bool confirm_known,
                                                            std::vector<ProbeAttempt>& probes) {
    auto ports = resolve_ports(candidate, confirm_known);
    if (ports.empty()) return std::nullopt;
    return verify(candidate, ports, probes);
}

void EndpointVerifier::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[server-locator] {}", msg);
    }
}
