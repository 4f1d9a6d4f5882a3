#include "discovery/locator.hpp"

#include "discovery/ambient_discovery.hpp"

#include <iterator>
#include <print>

DiscoveryResult locate_server(const Config& config, PlatformStrategy& strategy,
                              ShellExecutor& shell, GatewayVerifier& gateway,
                              WslBridgeResolver& wsl, bool verbose,
                              ProcessFinder::Sleeper sleeper) {
    ProcessFinder finder(config, strategy, shell, gateway, wsl, verbose, std::move(sleeper));
    auto result = finder.find(config.discovery.retry_policy());
    if (result.found() || !config.discovery.ambient_fallback) return result;

    if (verbose) {
        std::println(stderr, "[server-locator] Falling back to ambient discovery");
    }

    AmbientDiscovery ambient(config, strategy, shell, gateway, wsl, verbose);
    auto fallback = ambient.run();
    fallback.attempts += result.attempts;
    fallback.probes.insert(fallback.probes.begin(),
                           std::make_move_iterator(result.probes.begin()),
                           std::make_move_iterator(result.probes.end()));
    return fallback;
}
