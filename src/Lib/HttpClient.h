//
// Blocking outbound requests over Simple-Web-Server's HTTP and HTTPS clients
//

#ifndef STAGING_GATEWAY_HTTPCLIENT_H
#define STAGING_GATEWAY_HTTPCLIENT_H

#include <client_http.hpp>
#include <string>

struct sServiceUrl {
    bool bHttps = false;

    // "host" or "host:port", as Simple-Web-Server expects it
    std::string hostPort;

    // Path prefix the service is mounted under, without a trailing slash
    std::string basePath;
};

struct sHttpResponse {
    int statusCode = 0;
    std::string body;

    [[nodiscard]] auto isSuccess() const -> bool { return statusCode >= 200 && statusCode < 300; } // NOLINT
};

// Split an http:// or https:// URL into its parts. Throws std::invalid_argument for any other form
auto parseServiceUrl(const std::string& url) -> sServiceUrl;

// Send one request and wait for the whole response. Connection and protocol failures are thrown as eUpstreamError
auto sendHttpRequest(const sServiceUrl& service, const std::string& method, const std::string& pathAndQuery,
                     const std::string& body, const SimpleWeb::CaseInsensitiveMultimap& headers) -> sHttpResponse;

#endif //STAGING_GATEWAY_HTTPCLIENT_H
