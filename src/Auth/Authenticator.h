//
// Turns an Authorization header into the identity of the caller
//

#ifndef STAGING_GATEWAY_AUTHENTICATOR_H
#define STAGING_GATEWAY_AUTHENTICATOR_H

#include "../Interfaces/IIdentityService.h"
#include "Credentials.h"
#include "JwtVerifier.h"
#include <memory>

class Authenticator {
public:
    // Either collaborator may be null. Without a verifier Bearer assertions are refused, and without an identity
    // service legacy tokens are passed through to the publishing service unchanged
    Authenticator(std::shared_ptr<JwtVerifier> verifier, std::shared_ptr<IIdentityService> identityService);

    // Throws an eAuthenticationError subclass, or eUpstreamError if the identity service fails
    auto authenticate(const std::string& rawHeader) -> sAuthContext;

    [[nodiscard]] auto hasIdentityService() const -> bool { return identityService != nullptr; }

private:
    auto authenticateLegacyToken(const std::string& token) -> sAuthContext;
    auto verifyAssertion(const std::string& assertion) -> sAuthContext;

    std::shared_ptr<JwtVerifier> verifier;
    std::shared_ptr<IIdentityService> identityService;
};

#endif //STAGING_GATEWAY_AUTHENTICATOR_H
