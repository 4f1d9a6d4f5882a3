#include "discovery/ambient_discovery.hpp"

#include "discovery/signature.hpp"

#include <format>
#include <print>

AmbientDiscovery::AmbientDiscovery(Config config, PlatformStrategy& strategy,
                                   ShellExecutor& shell, GatewayVerifier& gateway,
                                   WslBridgeResolver& wsl, bool verbose)
    : config_(std::move(config)), strategy_(strategy), shell_(shell),
      verifier_(strategy, shell, gateway, wsl, config_.shell.port_list_timeout(), verbose),
      verbose_(verbose) {}

std::vector<ServerCandidate> AmbientDiscovery::locate() {
    auto cmd = strategy_.list_signature_command(signature::kAmbientSignature);
    auto out = shell_.run(cmd, config_.shell.process_list_timeout());
    if (!out) {
        log("Signature search returned nothing: " + out.error());
        return {};
    }

    auto records = strategy_.parse_candidates(*out);
    if (!records) {
        log("Signature search output not recognized");
        return {};
    }

    return signature::extract_all(*records, {.strict = false,
                                             .product_name = config_.target.product_name});
}

DiscoveryResult AmbientDiscovery::run() {
    log("Starting signature-based discovery");

    DiscoveryResult result;
    result.attempts = 1;

    auto candidates = locate();
    log(std::format("{} signature match(es)", candidates.size()));

    for (const auto& candidate : candidates) {
        auto endpoint = verifier_.establish(candidate, config_.discovery.confirm_known_ports,
                                            result.probes);
        if (endpoint) {
            log(std::format("Verified server pid {} at {}:{}", candidate.pid, endpoint->host,
                            endpoint->port));
            result.endpoint = std::move(endpoint);
            result.candidate = candidate;
            break;
        }
    }
    return result;
}

void AmbientDiscovery::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[server-locator] {}", msg);
    }
}
