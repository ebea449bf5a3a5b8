//
// Exchanges legacy credentials for a signed assertion over HTTP
//

#include "IdentityServiceClient.h"
#include "../Lib/Exceptions.h"
#include <boost/algorithm/string/trim.hpp>
#include <iostream>

IdentityServiceClient::IdentityServiceClient(const std::string& identityUrl) : service(parseServiceUrl(identityUrl))
{}

auto IdentityServiceClient::exchange(const sLegacyToken& legacyToken) -> std::string
{
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Authorization", "Basic " + encodeLegacyToken(legacyToken));

    // The exchange endpoint is the base URL itself
    auto response = sendHttpRequest(service, "POST", service.basePath.empty() ? "/" : "", "", headers);

    if (!response.isSuccess()) {
        throw eUpstreamError(
                "Identity service refused the exchange for " + legacyToken.username + " with status " +
                std::to_string(response.statusCode)
        );
    }

    auto assertion = boost::algorithm::trim_copy(response.body);
    if (assertion.empty()) {
        throw eUpstreamError("Identity service returned an empty assertion for " + legacyToken.username);
    }

    std::cout << "Auth: Exchanged credentials for " << legacyToken.username << std::endl;

    return assertion;
}
