#pragma once

#include "config.hpp"
#include "discovery/process_finder.hpp"
#include "discovery/types.hpp"

// Strict search with retries, then (if enabled) one ambient pass.
// Probe logs and attempt counts of both passes are merged into the result.
DiscoveryResult locate_server(const Config& config, PlatformStrategy& strategy,
                              ShellExecutor& shell, GatewayVerifier& gateway,
                              WslBridgeResolver& wsl, bool verbose = false,
                              ProcessFinder::Sleeper sleeper = {});
