#include "platform/port_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <string>

namespace port_parsing {

namespace {

std::vector<std::string> split_lines(std::string_view raw) {
    std::vector<std::string> lines;
    std::istringstream in{std::string(raw)};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

// -1 for anything that is not a plain decimal number.
long long to_number(std::string_view s) {
    long long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return -1;
    return value;
}

int to_port(const std::string& digits) {
    auto value = to_number(digits);
    if (value <= 0 || value > 65535) return 0;
    return static_cast<int>(value);
}

// Runs `re` over every line; group 1 is the port, group 2 (optional) the owning pid.
std::vector<int> match_lines(std::string_view raw, const std::regex& re, int pid) {
    std::vector<int> ports;
    for (const auto& line : split_lines(raw)) {
        std::smatch m;
        if (!std::regex_search(line, m, re)) continue;
        if (pid > 0 && m.size() > 2 && m[2].matched && to_number(m[2].str()) != pid) continue;
        if (int port = to_port(m[1].str())) ports.push_back(port);
    }
    return ports;
}

} // namespace

std::vector<int> numeric_lines(std::string_view raw) {
    std::vector<int> ports;
    for (auto line : split_lines(raw)) {
        auto first = line.find_first_not_of(" \t");
        auto last = line.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        line = line.substr(first, last - first + 1);
        if (!std::ranges::all_of(line, [](unsigned char c) { return std::isdigit(c); })) continue;
        if (int port = to_port(line)) ports.push_back(port);
    }
    return ports;
}

std::vector<int> windows_netstat(std::string_view raw, int pid) {
    static const std::regex re(R"(^\s*TCP\s+\S+:(\d+)\s+\S+\s+LISTENING\s+(\d+))",
                               std::regex::icase);
    return match_lines(raw, re, pid);
}

std::vector<int> lsof(std::string_view raw, int pid) {
    static const std::regex re(R"(^\S+\s+(?:\d+)\s.*TCP\s+\S*:(\d+)\s+\(LISTEN\))");
    static const std::regex pid_column(R"(^\S+\s+(\d+)\s)");

    std::vector<int> ports;
    for (const auto& line : split_lines(raw)) {
        std::smatch m;
        if (!std::regex_search(line, m, re)) continue;
        std::smatch owner;
        if (pid > 0 && std::regex_search(line, owner, pid_column) &&
            to_number(owner[1].str()) != pid) {
            continue;
        }
        if (int port = to_port(m[1].str())) ports.push_back(port);
    }
    return ports;
}

std::vector<int> ss(std::string_view raw, int pid) {
    static const std::regex re(R"(^\s*LISTEN\s+\d+\s+\d+\s+\S*:(\d+)\s)");
    static const std::regex owner_re(R"(pid=(\d+),)");

    std::vector<int> ports;
    for (const auto& line : split_lines(raw)) {
        std::smatch m;
        if (!std::regex_search(line, m, re)) continue;
        // Without privileges ss omits the users:(...) column for foreign sockets.
        std::smatch owner;
        if (pid > 0 && std::regex_search(line, owner, owner_re) &&
            to_number(owner[1].str()) != pid) {
            continue;
        }
        if (int port = to_port(m[1].str())) ports.push_back(port);
    }
    return ports;
}

std::vector<int> unix_netstat(std::string_view raw, int pid) {
    static const std::regex re(R"(^\s*tcp6?\s+\d+\s+\d+\s+\S*:(\d+)\s+\S+\s+LISTEN\s+(\d+)/)");
    return match_lines(raw, re, pid);
}

std::vector<int> normalize(std::vector<int> ports) {
    std::erase_if(ports, [](int p) { return p <= 0 || p > 65535; });
    std::ranges::sort(ports);
    auto dup = std::ranges::unique(ports);
    ports.erase(dup.begin(), dup.end());
    return ports;
}

} // namespace port_parsing
