#include "platform/windows_strategy.hpp"

#include "platform/port_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

// Single-quoted PowerShell literal.
std::string ps_quote(std::string_view s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string powershell(const std::string& script) {
    return "chcp 65001 >nul && powershell -ExecutionPolicy Bypass -NoProfile -Command \"" +
           script + "\"";
}

constexpr std::string_view kSelectAsJson =
    "if ($p) { @($p) | Select-Object ProcessId,ParentProcessId,CommandLine | "
    "ConvertTo-Json -Compress } else { '[]' }";

std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

bool parse_int(std::string_view s, int& out) {
    auto t = trim(s);
    if (t.empty()) return false;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), out);
    return ec == std::errc{} && ptr == t.data() + t.size();
}

std::optional<ProcessRecord> record_from_json(const json& item) {
    if (!item.is_object()) return std::nullopt;

    auto pid_it = item.find("ProcessId");
    auto cmd_it = item.find("CommandLine");
    if (pid_it == item.end() || !pid_it->is_number_integer()) return std::nullopt;
    if (cmd_it == item.end() || !cmd_it->is_string()) return std::nullopt;

    ProcessRecord rec;
    rec.pid = pid_it->get<int>();
    if (auto ppid_it = item.find("ParentProcessId");
        ppid_it != item.end() && ppid_it->is_number_integer()) {
        rec.ppid = ppid_it->get<int>();
    }
    rec.command_line = cmd_it->get<std::string>();
    if (rec.pid <= 0 || rec.command_line.empty()) return std::nullopt;
    return rec;
}

} // namespace

std::string WindowsStrategy::list_candidates_command(const std::string& process_name) const {
    auto script = std::format(
        "[Console]::OutputEncoding = [System.Text.Encoding]::UTF8; "
        "$n = {}; $f = \\\"name='$n'\\\"; "
        "try {{ $p = Get-CimInstance Win32_Process -Filter $f -ErrorAction Stop }} "
        "catch {{ $p = Get-WmiObject Win32_Process -Filter $f }}; {}",
        ps_quote(process_name), kSelectAsJson);
    return powershell(script);
}

std::string WindowsStrategy::list_signature_command(std::string_view needle) const {
    auto script = std::format(
        "[Console]::OutputEncoding = [System.Text.Encoding]::UTF8; "
        "$sign = {}; "
        "$p = Get-CimInstance Win32_Process -ErrorAction SilentlyContinue | "
        "Where-Object {{ $_.CommandLine -match $sign }}; {}",
        ps_quote(needle), kSelectAsJson);
    return powershell(script);
}

std::optional<std::vector<ProcessRecord>>
WindowsStrategy::parse_candidates(const std::string& raw) const {
    if (trim(raw).empty()) return std::vector<ProcessRecord>{};
    if (auto records = parse_json(raw)) return records;
    return parse_csv(raw);
}

std::optional<std::vector<ProcessRecord>> WindowsStrategy::parse_json(const std::string& raw) {
    // Profile scripts can print text (even braces) ahead of the payload, so
    // try each opening bracket until one parses.
    for (auto pos = raw.find_first_of("[{"); pos != std::string::npos;
         pos = raw.find_first_of("[{", pos + 1)) {
        json data;
        try {
            data = json::parse(raw.begin() + static_cast<std::ptrdiff_t>(pos), raw.end());
        } catch (const json::exception&) {
            continue;
        }

        std::vector<ProcessRecord> records;
        if (data.is_array()) {
            for (const auto& item : data) {
                if (auto rec = record_from_json(item)) records.push_back(std::move(*rec));
            }
        } else if (data.is_object()) {
            if (auto rec = record_from_json(data)) records.push_back(std::move(*rec));
        } else {
            continue;
        }
        return records;
    }
    return std::nullopt;
}

std::optional<std::vector<ProcessRecord>> WindowsStrategy::parse_csv(const std::string& raw) {
    std::vector<ProcessRecord> records;
    bool recognized = false;
    bool node_column = false;
    bool seen_data = false;

    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        std::string lower = line;
        std::ranges::transform(lower, lower.begin(),
                               [](unsigned char c) { return std::tolower(c); });
        // Header is the first row only; command lines may mention "processid".
        if (!seen_data && (lower.starts_with("node,") || lower.starts_with("commandline,"))) {
            recognized = true;
            node_column = lower.starts_with("node,");
            continue;
        }

        auto last = line.rfind(',');
        if (last == std::string::npos || last == 0) continue;
        auto prev = line.rfind(',', last - 1);
        if (prev == std::string::npos) continue;

        seen_data = true;
        ProcessRecord rec;
        if (!parse_int(std::string_view(line).substr(last + 1), rec.pid) ||
            !parse_int(std::string_view(line).substr(prev + 1, last - prev - 1), rec.ppid)) {
            continue;
        }

        std::string_view cmd = std::string_view(line).substr(0, prev);
        if (node_column) {
            auto comma = cmd.find(',');
            cmd = comma == std::string_view::npos ? std::string_view{} : cmd.substr(comma + 1);
        }
        recognized = true;
        rec.command_line = trim(cmd);
        if (rec.pid > 0 && !rec.command_line.empty()) records.push_back(std::move(rec));
    }

    if (!recognized) return std::nullopt;
    return records;
}

std::string WindowsStrategy::list_ports_command(int pid) {
    return std::format(
        "powershell -NoProfile -Command \"Get-NetTCPConnection -State Listen -OwningProcess {} "
        "-ErrorAction Stop | Select-Object -ExpandProperty LocalPort\" || "
        "netstat -ano | findstr \"{}\" | findstr \"LISTENING\"",
        pid, pid);
}

std::vector<int> WindowsStrategy::parse_ports(const std::string& raw, int pid) const {
    auto ports = port_parsing::numeric_lines(raw);
    auto from_netstat = port_parsing::windows_netstat(raw, pid);
    ports.insert(ports.end(), from_netstat.begin(), from_netstat.end());
    return port_parsing::normalize(std::move(ports));
}
