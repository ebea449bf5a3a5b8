//
// Interface for the downstream publishing service
//

#ifndef STAGING_GATEWAY_I_PORTALCLIENT_H
#define STAGING_GATEWAY_I_PORTALCLIENT_H

#include "../Auth/Credentials.h"
#include "../Publish/PublishingType.h"
#include <cstdint>
#include <string>
#include <vector>

class IPortalClient {
public:
    virtual ~IPortalClient() = default;

    // Upload a finished bundle and return the deployment id the service assigned. Throws eUpstreamError if the
    // service can't be reached or answers with anything but a 2xx
    virtual auto upload(const Credentials& credentials, const std::string& deploymentName,
                        PublishingType publishingType, const std::vector<uint8_t>& bundle) -> std::string = 0;
};

#endif //STAGING_GATEWAY_I_PORTALCLIENT_H
