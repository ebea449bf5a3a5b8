//
// Uploads bundles to the publishing service's publisher API
//

#ifndef STAGING_GATEWAY_PORTALAPICLIENT_H
#define STAGING_GATEWAY_PORTALAPICLIENT_H

#include "../Interfaces/IPortalClient.h"
#include "../Lib/HttpClient.h"

class PortalApiClient : public IPortalClient {
public:
    explicit PortalApiClient(const std::string& baseUrl);

    auto upload(const Credentials& credentials, const std::string& deploymentName, PublishingType publishingType,
                const std::vector<uint8_t>& bundle) -> std::string override;

private:
    sServiceUrl service;
};

// Build the multipart/form-data body holding the bundle as its only part
auto buildBundleBody(const std::string& boundary, const std::vector<uint8_t>& bundle) -> std::string;

#endif //STAGING_GATEWAY_PORTALAPICLIENT_H
