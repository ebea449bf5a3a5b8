//
// Outbound credentials and the identity attached to an authorized request
//

#ifndef STAGING_GATEWAY_CREDENTIALS_H
#define STAGING_GATEWAY_CREDENTIALS_H

#include "UserToken.h"
#include <string>
#include <variant>
#include <vector>

// A verified assertion issued by the identity service
struct sSignedAssertion {
    std::string token;

    auto operator==(const sSignedAssertion& other) const -> bool = default;
};

using Credentials = std::variant<sLegacyToken, sSignedAssertion>;

// The Authorization header value to forward downstream. Legacy tokens are passed on as the base64
// "username:password" string, assertions verbatim, both under the Bearer scheme
auto bearerAuthHeader(const Credentials& credentials) -> std::string;

struct sAuthContext {
    std::string userId;

    // The name the caller logged in with, used as the owner of any repositories it opens
    std::string username;

    // Namespaces the caller may publish to. Empty when the gateway couldn't learn them (legacy pass-through), in
    // which case the publishing service decides
    std::vector<std::string> namespaces;

    Credentials credentials;
};

#endif //STAGING_GATEWAY_CREDENTIALS_H
