#pragma once

#include <optional>
#include <string>

struct ProbeResult {
    bool success = false;
    int status_code = 0;
    std::string protocol = "http"; // "http" or "https"
    std::optional<std::string> error;
};

// Confirms that (host, port, token) reaches an authenticating server.
// Only the status code matters; the response body is never interpreted.
class GatewayVerifier {
public:
    virtual ~GatewayVerifier() = default;
    virtual ProbeResult probe(const std::string& host, int port, const std::string& token) = 0;
};
