//
// Exchanges legacy credentials for a signed assertion over HTTP
//

#ifndef STAGING_GATEWAY_IDENTITYSERVICECLIENT_H
#define STAGING_GATEWAY_IDENTITYSERVICECLIENT_H

#include "../Interfaces/IIdentityService.h"
#include "../Lib/HttpClient.h"

class IdentityServiceClient : public IIdentityService {
public:
    // identityUrl is the full URL of the exchange endpoint
    explicit IdentityServiceClient(const std::string& identityUrl);

    auto exchange(const sLegacyToken& legacyToken) -> std::string override;

private:
    sServiceUrl service;
};

#endif //STAGING_GATEWAY_IDENTITYSERVICECLIENT_H
