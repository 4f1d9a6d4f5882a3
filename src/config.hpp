#pragma once

#include "discovery/types.hpp"

#include <chrono>
#include <string>

struct Config {
    struct Discovery {
        int attempts = 3;
        int base_delay_ms = 1000;
        int max_delay_ms = 8000;
        bool ambient_fallback = true;    // run ambient discovery when the strict search fails
        bool confirm_known_ports = false; // check --extension_server_port is actually listening

        DiscoveryConfig retry_policy() const {
            return {.attempts = attempts, .base_delay_ms = base_delay_ms,
                    .max_delay_ms = max_delay_ms};
        }
    } discovery;

    struct Target {
        std::string process_name; // empty: platform default
        std::string product_name = "antigravity";
    } target;

    struct Probe {
        std::string endpoint_path = "/exa.language_server_pb.LanguageServerService/GetUserStatus";
        int timeout_ms = 3000;
    } probe;

    struct Shell {
        int process_list_timeout_ms = 15000;
        int port_list_timeout_ms = 5000;
        int tool_probe_timeout_ms = 1000;

        std::chrono::milliseconds process_list_timeout() const {
            return std::chrono::milliseconds(process_list_timeout_ms);
        }
        std::chrono::milliseconds port_list_timeout() const {
            return std::chrono::milliseconds(port_list_timeout_ms);
        }
        std::chrono::milliseconds tool_probe_timeout() const {
            return std::chrono::milliseconds(tool_probe_timeout_ms);
        }
    } shell;

    // Target process name, falling back to the binary shipped for this OS.
    std::string process_name() const;

    static Config load(const std::string& path);
    static Config load_default();
};
