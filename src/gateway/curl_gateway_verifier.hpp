#pragma once

#include "gateway_verifier.hpp"

#include <chrono>
#include <expected>
#include <string>

inline constexpr const char* kUserStatusPath =
    "/exa.language_server_pb.LanguageServerService/GetUserStatus";

class CurlGatewayVerifier : public GatewayVerifier {
public:
    explicit CurlGatewayVerifier(std::string endpoint_path = kUserStatusPath,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));
    ~CurlGatewayVerifier() override;

    CurlGatewayVerifier(const CurlGatewayVerifier&) = delete;
    CurlGatewayVerifier& operator=(const CurlGatewayVerifier&) = delete;

    // HTTPS first (the server uses a self-signed certificate), then plain HTTP.
    ProbeResult probe(const std::string& host, int port, const std::string& token) override;

protected:
    // HTTP status code, or the transport error.
    virtual std::expected<long, std::string> post(const std::string& url, const std::string& token);

private:
    std::string endpoint_path_;
    std::chrono::milliseconds timeout_;
};
