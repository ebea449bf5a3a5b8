//
// Blocking outbound requests over Simple-Web-Server's HTTP and HTTPS clients
//

#include "HttpClient.h"
#include "../Settings.h"
#include "Exceptions.h"
#include <boost/algorithm/string/predicate.hpp>
#include <client_https.hpp>
#include <stdexcept>

namespace {
    template<class ClientType>
    auto performRequest(ClientType& client, const std::string& method, const std::string& pathAndQuery,
                        const std::string& body, const SimpleWeb::CaseInsensitiveMultimap& headers) -> sHttpResponse
    {
        client.config.timeout = CLIENT_TIMEOUT_SECONDS;

        try {
            auto response = client.request(method, pathAndQuery, body, headers);
            return {std::stoi(response->status_code), response->content.string()};
        } catch (SimpleWeb::system_error& e) {
            throw eUpstreamError("Request to " + pathAndQuery + " failed: " + e.what());
        } catch (std::invalid_argument&) {
            throw eUpstreamError("Request to " + pathAndQuery + " returned an unreadable status line");
        }
    }
}

auto parseServiceUrl(const std::string& url) -> sServiceUrl
{
    sServiceUrl service;

    std::string remainder;
    if (boost::algorithm::istarts_with(url, "https://")) {
        service.bHttps = true;
        remainder = url.substr(std::string("https://").size());
    } else if (boost::algorithm::istarts_with(url, "http://")) {
        remainder = url.substr(std::string("http://").size());
    } else {
        throw std::invalid_argument("Unsupported service URL: " + url);
    }

    auto pathStart = remainder.find('/');
    service.hostPort = remainder.substr(0, pathStart);
    if (pathStart != std::string::npos) {
        service.basePath = remainder.substr(pathStart);
        while (!service.basePath.empty() && service.basePath.back() == '/') {
            service.basePath.pop_back();
        }
    }

    if (service.hostPort.empty()) {
        throw std::invalid_argument("Service URL has no host: " + url);
    }

    return service;
}

auto sendHttpRequest(const sServiceUrl& service, const std::string& method, const std::string& pathAndQuery,
                     const std::string& body, const SimpleWeb::CaseInsensitiveMultimap& headers) -> sHttpResponse
{
    if (service.bHttps) {
        SimpleWeb::Client<SimpleWeb::HTTPS> client(service.hostPort);
        return performRequest(client, method, service.basePath + pathAndQuery, body, headers);
    }

    SimpleWeb::Client<SimpleWeb::HTTP> client(service.hostPort);
    return performRequest(client, method, service.basePath + pathAndQuery, body, headers);
}
