//
// Inbound credentials as they arrive on the Authorization header
//

#include "UserToken.h"
#include "../Lib/Exceptions.h"
#include "../Lib/GeneralUtils.h"
#include <boost/algorithm/string/predicate.hpp>

namespace {
    const std::string BASIC_PREFIX = "Basic ";
    const std::string BEARER_PREFIX = "Bearer ";
}

auto parseAuthorizationHeader(const std::string& rawHeader) -> sAuthorizationHeader
{
    if (boost::algorithm::starts_with(rawHeader, BASIC_PREFIX)) {
        return {eAuthorizationScheme::Basic, rawHeader.substr(BASIC_PREFIX.size())};
    }

    if (boost::algorithm::starts_with(rawHeader, BEARER_PREFIX)) {
        return {eAuthorizationScheme::Bearer, rawHeader.substr(BEARER_PREFIX.size())};
    }

    if (rawHeader.empty()) {
        throw eInvalidHeader("No Authorization header was provided");
    }

    throw eInvalidHeader("Unsupported Authorization scheme");
}

auto decodeLegacyToken(const std::string& token) -> sLegacyToken
{
    if (!isValidBase64(token)) {
        throw eBase64Error("Authorization token is not valid base64");
    }

    auto decoded = base64Decode(token);
    if (!isValidUtf8(decoded)) {
        throw eUtf8Error("Authorization token is not valid UTF-8");
    }

    auto separator = decoded.find(':');
    if (separator == std::string::npos) {
        throw eMalformedTokenError("Authorization token is not of the form username:password");
    }

    return {decoded.substr(0, separator), decoded.substr(separator + 1)};
}

auto encodeLegacyToken(const sLegacyToken& legacyToken) -> std::string
{
    return base64Encode(legacyToken.username + ":" + legacyToken.password);
}
