#include "config.hpp"

#include "platform/platform_id.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Out-of-range values are clamped rather than rejected.
void sanitize(Config& cfg) {
    cfg.discovery.attempts = std::max(cfg.discovery.attempts, 1);
    cfg.discovery.base_delay_ms = std::max(cfg.discovery.base_delay_ms, 0);
    cfg.discovery.max_delay_ms = std::max(cfg.discovery.max_delay_ms, cfg.discovery.base_delay_ms);
    cfg.probe.timeout_ms = std::max(cfg.probe.timeout_ms, 1);
    cfg.shell.process_list_timeout_ms = std::max(cfg.shell.process_list_timeout_ms, 1);
    cfg.shell.port_list_timeout_ms = std::max(cfg.shell.port_list_timeout_ms, 1);
    cfg.shell.tool_probe_timeout_ms = std::max(cfg.shell.tool_probe_timeout_ms, 1);
}

} // namespace

std::string Config::process_name() const {
    if (!target.process_name.empty()) return target.process_name;
    return platform::default_process_name(platform::current());
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("discovery")) {
            auto& d = j["discovery"];
            if (d.contains("attempts")) cfg.discovery.attempts = d["attempts"].get<int>();
            if (d.contains("base_delay_ms")) cfg.discovery.base_delay_ms = d["base_delay_ms"].get<int>();
            if (d.contains("max_delay_ms")) cfg.discovery.max_delay_ms = d["max_delay_ms"].get<int>();
            if (d.contains("ambient_fallback")) cfg.discovery.ambient_fallback = d["ambient_fallback"].get<bool>();
            if (d.contains("confirm_known_ports")) cfg.discovery.confirm_known_ports = d["confirm_known_ports"].get<bool>();
        }

        if (j.contains("target")) {
            auto& t = j["target"];
            if (t.contains("process_name")) cfg.target.process_name = t["process_name"].get<std::string>();
            if (t.contains("product_name")) cfg.target.product_name = t["product_name"].get<std::string>();
        }

        if (j.contains("probe")) {
            auto& p = j["probe"];
            if (p.contains("endpoint_path")) cfg.probe.endpoint_path = p["endpoint_path"].get<std::string>();
            if (p.contains("timeout_ms")) cfg.probe.timeout_ms = p["timeout_ms"].get<int>();
        }

        if (j.contains("shell")) {
            auto& s = j["shell"];
            if (s.contains("process_list_timeout_ms")) cfg.shell.process_list_timeout_ms = s["process_list_timeout_ms"].get<int>();
            if (s.contains("port_list_timeout_ms")) cfg.shell.port_list_timeout_ms = s["port_list_timeout_ms"].get<int>();
            if (s.contains("tool_probe_timeout_ms")) cfg.shell.tool_probe_timeout_ms = s["tool_probe_timeout_ms"].get<int>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    sanitize(cfg);
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
