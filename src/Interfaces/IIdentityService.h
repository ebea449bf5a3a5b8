//
// Interface for the service that trades legacy credentials for a signed assertion
//

#ifndef STAGING_GATEWAY_I_IDENTITYSERVICE_H
#define STAGING_GATEWAY_I_IDENTITYSERVICE_H

#include "../Auth/UserToken.h"
#include <string>

class IIdentityService {
public:
    virtual ~IIdentityService() = default;

    // Returns the signed assertion for the caller. Throws eUpstreamError if the service refuses or can't be reached
    virtual auto exchange(const sLegacyToken& legacyToken) -> std::string = 0;
};

#endif //STAGING_GATEWAY_I_IDENTITYSERVICE_H
