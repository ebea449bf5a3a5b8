//
// Inbound credentials as they arrive on the Authorization header
//

#ifndef STAGING_GATEWAY_USERTOKEN_H
#define STAGING_GATEWAY_USERTOKEN_H

#include <string>

enum class eAuthorizationScheme {
    Basic,
    Bearer
};

struct sAuthorizationHeader {
    eAuthorizationScheme scheme;
    std::string token;
};

// The username and password a legacy client logged in with
struct sLegacyToken {
    std::string username;
    std::string password;

    auto operator==(const sLegacyToken& other) const -> bool = default;
};

// Split the raw header into its scheme and token. Only "Basic " and "Bearer " are recognised, matched case
// sensitively. Throws eInvalidHeader for anything else, including a missing header
auto parseAuthorizationHeader(const std::string& rawHeader) -> sAuthorizationHeader;

// Decode a Basic token into the username and password. The token must be standard padded base64 (eBase64Error),
// decode to UTF-8 (eUtf8Error) and contain a ':' (eMalformedTokenError). Only the first ':' separates the two
auto decodeLegacyToken(const std::string& token) -> sLegacyToken;

// Encode the token back into the base64 "username:password" form
auto encodeLegacyToken(const sLegacyToken& legacyToken) -> std::string;

#endif //STAGING_GATEWAY_USERTOKEN_H
