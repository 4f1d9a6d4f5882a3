#pragma once

#include <string_view>
#include <vector>

// Parsers for the listening-socket tools. Each returns every port it
// recognizes; normalize() turns the union into the final port set.
namespace port_parsing {

// Bare "45000" lines (PowerShell Get-NetTCPConnection | LocalPort).
std::vector<int> numeric_lines(std::string_view raw);

// Windows `netstat -ano`: "TCP 127.0.0.1:45000 0.0.0.0:0 LISTENING 1234".
std::vector<int> windows_netstat(std::string_view raw, int pid);

// `lsof -nP -iTCP -sTCP:LISTEN`: "cmd 1234 user 10u IPv4 ... TCP 127.0.0.1:45000 (LISTEN)".
std::vector<int> lsof(std::string_view raw, int pid);

// `ss -tlnp`: "LISTEN 0 4096 127.0.0.1:45000 0.0.0.0:* users:(("x",pid=1234,fd=10))".
std::vector<int> ss(std::string_view raw, int pid);

// `netstat -tulpn`: "tcp 0 0 127.0.0.1:45000 0.0.0.0:* LISTEN 1234/x".
std::vector<int> unix_netstat(std::string_view raw, int pid);

// Keeps ports in (0, 65535], deduplicated and sorted ascending.
std::vector<int> normalize(std::vector<int> ports);

} // namespace port_parsing
