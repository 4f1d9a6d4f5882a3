#include "platform/unix_strategy.hpp"

#include "platform/port_parsing.hpp"

#include <charconv>
#include <format>
#include <regex>
#include <sstream>

namespace {

// Wraps `s` in single quotes for /bin/sh.
std::string shell_quote(std::string_view s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string lsof_command(int pid) {
    return std::format("lsof -nP -a -iTCP -sTCP:LISTEN -p {} 2>/dev/null", pid);
}

std::string ss_command(int pid) {
    return std::format("ss -tlnp 2>/dev/null | grep \"pid={},\"", pid);
}

std::string netstat_command(int pid) {
    return std::format("netstat -tulpn 2>/dev/null | grep -w {}", pid);
}

} // namespace

UnixStrategy::UnixStrategy(platform::Platform os, ShellExecutor& shell,
                           std::chrono::milliseconds tool_probe_timeout)
    : os_(os), tools_(shell, tool_probe_timeout) {}

std::string UnixStrategy::ps_grep(std::string_view pattern) {
    std::string grep_pattern(pattern);
    if (!pattern.empty()) {
        grep_pattern = std::format("[{}]{}", pattern.front(), pattern.substr(1));
    }
    return "ps -A -ww -o pid,ppid,args | grep " + shell_quote(grep_pattern);
}

std::string UnixStrategy::list_candidates_command(const std::string& process_name) const {
    return ps_grep(process_name);
}

std::string UnixStrategy::list_signature_command(std::string_view needle) const {
    return ps_grep(needle);
}

std::optional<std::vector<ProcessRecord>>
UnixStrategy::parse_candidates(const std::string& raw) const {
    static const std::regex row(R"(^\s*(\d+)\s+(\d+)\s+(.+)$)");

    std::vector<ProcessRecord> records;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::smatch m;
        if (!std::regex_match(line, m, row)) continue;

        ProcessRecord rec;
        auto pid = m[1].str();
        auto ppid = m[2].str();
        std::from_chars(pid.data(), pid.data() + pid.size(), rec.pid);
        std::from_chars(ppid.data(), ppid.data() + ppid.size(), rec.ppid);
        rec.command_line = m[3].str();
        if (rec.pid > 0) records.push_back(std::move(rec));
    }
    return records;
}

std::string UnixStrategy::list_ports_command(int pid) {
    if (os_ == platform::Platform::MacOS) return lsof_command(pid);

    if (auto tool = tools_.tool()) {
        switch (*tool) {
            case PortTool::Lsof: return lsof_command(pid);
            case PortTool::Ss: return ss_command(pid);
            case PortTool::Netstat: return netstat_command(pid);
        }
    }
    return ss_command(pid) + " || " + lsof_command(pid) + " || " + netstat_command(pid);
}

std::vector<int> UnixStrategy::parse_ports(const std::string& raw, int pid) const {
    auto ports = port_parsing::lsof(raw, pid);
    if (os_ != platform::Platform::MacOS) {
        auto from_ss = port_parsing::ss(raw, pid);
        auto from_netstat = port_parsing::unix_netstat(raw, pid);
        ports.insert(ports.end(), from_ss.begin(), from_ss.end());
        ports.insert(ports.end(), from_netstat.begin(), from_netstat.end());
    }
    return port_parsing::normalize(std::move(ports));
}
