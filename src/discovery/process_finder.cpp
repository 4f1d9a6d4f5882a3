#include "discovery/process_finder.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <thread>

ProcessFinder::ProcessFinder(Config config, PlatformStrategy& strategy, ShellExecutor& shell,
                             GatewayVerifier& gateway, WslBridgeResolver& wsl, bool verbose,
                             Sleeper sleeper)
    : config_(std::move(config)), strategy_(strategy), shell_(shell),
      verifier_(strategy, shell, gateway, wsl, config_.shell.port_list_timeout(), verbose),
      match_{.strict = true, .product_name = config_.target.product_name},
      verbose_(verbose), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds ProcessFinder::backoff_delay(const DiscoveryConfig& policy,
                                                       int attempt) {
    long long delay = std::max(policy.base_delay_ms, 0);
    long long cap = std::max<long long>(policy.max_delay_ms, delay);
    for (int i = 1; i < attempt && delay < cap; i++) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

std::vector<ServerCandidate> ProcessFinder::enumerate() {
    auto cmd = strategy_.list_candidates_command(config_.process_name());
    auto out = shell_.run(cmd, config_.shell.process_list_timeout());
    if (!out) {
        // grep exits 1 when nothing matches, so this is the usual "no process" path
        log("Process listing returned nothing: " + out.error());
        return {};
    }

    auto records = strategy_.parse_candidates(*out);
    if (!records) {
        log("Process listing output not recognized");
        return {};
    }

    auto candidates = signature::extract_all(*records, match_);
    log(std::format("{} process(es) listed, {} candidate(s)", records->size(), candidates.size()));
    return candidates;
}

DiscoveryResult ProcessFinder::find(const DiscoveryConfig& policy) {
    DiscoveryResult result;
    const int attempts = std::max(policy.attempts, 1);

    for (int attempt = 1; attempt <= attempts; attempt++) {
        result.attempts = attempt;
        log(std::format("Discovery attempt {}/{}", attempt, attempts));

        for (const auto& candidate : enumerate()) {
            auto endpoint = verifier_.establish(candidate, config_.discovery.confirm_known_ports,
                                                result.probes);
            if (endpoint) {
                log(std::format("Verified server pid {} at {}:{}", candidate.pid,
                                endpoint->host, endpoint->port));
                result.endpoint = std::move(endpoint);
                result.candidate = candidate;
                return result;
            }
        }

        if (attempt < attempts) {
            auto delay = backoff_delay(policy, attempt);
            log(std::format("No verified server, retrying in {}ms", delay.count()));
            sleeper_(delay);
        }
    }

    log("Strict discovery exhausted");
    return result;
}

void ProcessFinder::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[server-locator] {}", msg);
    }
}
