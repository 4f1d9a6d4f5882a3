#include "curl_gateway_verifier.hpp"

#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlGatewayVerifier::CurlGatewayVerifier(std::string endpoint_path,
                                         std::chrono::milliseconds timeout)
    : endpoint_path_(std::move(endpoint_path)), timeout_(timeout) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGatewayVerifier::~CurlGatewayVerifier() {
    curl_global_cleanup();
}

ProbeResult CurlGatewayVerifier::probe(const std::string& host, int port,
                                       const std::string& token) {
    ProbeResult result;
    std::string https_error;

    for (std::string scheme : {"https", "http"}) {
        auto url = std::format("{}://{}:{}{}", scheme, host, port, endpoint_path_);
        auto status = post(url, token);
        result.protocol = scheme;

        if (!status) {
            // A plain-HTTP server fails the TLS handshake; retry without TLS.
            if (scheme == "https") {
                https_error = status.error();
                continue;
            }
            result.error = std::format("https: {}; http: {}", https_error, status.error());
            return result;
        }

        result.status_code = static_cast<int>(*status);
        result.success = *status >= 200 && *status < 300;
        if (!result.success) result.error = std::format("HTTP {}", *status);
        return result;
    }
    return result;
}

std::expected<long, std::string> CurlGatewayVerifier::post(const std::string& url,
                                                           const std::string& token) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    const std::string body = json{{"wrapper_data", json::object()}}.dump();
    const std::string token_header = "X-Codeium-Csrf-Token: " + token;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Connect-Protocol-Version: 1");
    headers = curl_slist_append(headers, token_header.c_str());

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Only ever pointed at loopback or the WSL host, with a self-signed cert.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    // Never route a local probe through a configured proxy.
    curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return status;
}
