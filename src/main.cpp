#include "config.hpp"
#include "discovery/ambient_discovery.hpp"
#include "discovery/locator.hpp"
#include "gateway/curl_gateway_verifier.hpp"
#include "platform/os_version.hpp"
#include "platform/platform_id.hpp"
#include "platform/platform_strategy.hpp"
#include "platform/wsl.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Finds the running language server and prints its endpoint as JSON.");
    std::println("Options:");
    std::println("  -c, --config PATH    Config file path");
    std::println("  -a, --attempts N     Strict discovery attempts (overrides config)");
    std::println("      --no-ambient     Do not fall back to signature-based discovery");
    std::println("      --ambient-only   Skip the strict search");
    std::println("  -v, --verbose        Log discovery steps to stderr");
    std::println("  -h, --help           Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool ambient_only = false;
    bool no_ambient = false;
    int attempts = 0;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--attempts" || arg == "-a") {
            if (i + 1 < argc) {
                std::string value = argv[++i];
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), attempts);
                if (ec != std::errc{} || attempts < 1) {
                    std::println(stderr, "Invalid attempt count: {}", value);
                    return 2;
                }
            }
        } else if (arg == "--no-ambient") {
            no_ambient = true;
        } else if (arg == "--ambient-only") {
            ambient_only = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (attempts > 0) config.discovery.attempts = attempts;
    if (no_ambient) config.discovery.ambient_fallback = false;

    auto os = platform::current();
    if (verbose) {
        std::println(stderr, "[server-locator] Host: {} [{}]",
                     platform::describe_os(platform::host_info()), platform::name(os));
        std::println(stderr, "[server-locator] Looking for {} ({})", config.process_name(),
                     config.target.product_name);
    }

    auto shell = platform::make_shell_executor();
    auto strategy = make_strategy(os, *shell, config.shell.tool_probe_timeout());
    CurlGatewayVerifier gateway(config.probe.endpoint_path,
                                std::chrono::milliseconds(config.probe.timeout_ms));
    WslBridgeResolver wsl(os);

    DiscoveryResult result;
    if (ambient_only) {
        AmbientDiscovery ambient(config, *strategy, *shell, gateway, wsl, verbose);
        result = ambient.run();
    } else {
        result = locate_server(config, *strategy, *shell, gateway, wsl, verbose);
    }

    if (!result.found()) {
        std::println(stderr, "not found ({} attempt(s), {} probe(s))", result.attempts,
                     result.probes.size());
        return 1;
    }

    json out = {
        {"host", result.endpoint->host},
        {"port", result.endpoint->port},
        {"token", result.endpoint->token},
    };
    if (result.candidate) {
        out["pid"] = result.candidate->pid;
        if (result.candidate->workspace_id) out["workspace_id"] = *result.candidate->workspace_id;
    }
    std::println("{}", out.dump());
    return 0;
}
