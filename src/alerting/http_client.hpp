/**
 * @file http_client.hpp
 * @brief Outbound HTTP boundary used by the webhook dispatcher.
 *
 * send() returns an HttpResponse for any status line received, 2xx through
 * 5xx alike. The error arm is reserved for transport failures: timeout,
 * DNS resolution, refused connection, TLS handshake.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace container_pulse {

inline constexpr std::chrono::milliseconds kWebhookTimeout{10'000};

struct HttpRequest {
    HttpMethod method{HttpMethod::Post};
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
    std::chrono::milliseconds timeout{kWebhookTimeout};
};

struct HttpResponse {
    int status_code{0};
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/// libcurl-backed client; safe to share across threads.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();

    Result<HttpResponse> send(const HttpRequest& request) override;
};

}  // namespace container_pulse
