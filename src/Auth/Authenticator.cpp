//
// Turns an Authorization header into the identity of the caller
//

#include "Authenticator.h"
#include "../Lib/Exceptions.h"
#include <utility>

Authenticator::Authenticator(std::shared_ptr<JwtVerifier> verifier, std::shared_ptr<IIdentityService> identityService)
    : verifier(std::move(verifier)), identityService(std::move(identityService))
{}

auto Authenticator::authenticate(const std::string& rawHeader) -> sAuthContext
{
    auto header = parseAuthorizationHeader(rawHeader);

    // Some build tools send the legacy base64 token under the Bearer scheme. A JWT always has '.' separators,
    // which aren't in the base64 alphabet
    if (header.scheme == eAuthorizationScheme::Bearer && header.token.find('.') != std::string::npos) {
        return verifyAssertion(header.token);
    }

    return authenticateLegacyToken(header.token);
}

auto Authenticator::authenticateLegacyToken(const std::string& token) -> sAuthContext
{
    auto legacyToken = decodeLegacyToken(token);

    if (identityService) {
        return verifyAssertion(identityService->exchange(legacyToken));
    }

    // No identity service, so the caller's namespaces are unknown and the publishing service authorizes instead
    return {legacyToken.username, legacyToken.username, {}, legacyToken};
}

auto Authenticator::verifyAssertion(const std::string& assertion) -> sAuthContext
{
    if (!verifier) {
        throw eVerificationFailed("No JWT public key is configured, assertions can't be verified");
    }

    return verifier->verify(assertion);
}
