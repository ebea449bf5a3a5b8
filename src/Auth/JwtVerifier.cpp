//
// Verifies the RS256 assertions issued by the identity service
//

#include "JwtVerifier.h"
#include "../Lib/Exceptions.h"
#include <boost/filesystem/fstream.hpp>
#include <iostream>
#include <jwt/jwt.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

JwtVerifier::JwtVerifier(std::string publicKeyPem, std::string issuer, std::string audience)
    : publicKeyPem(std::move(publicKeyPem)), issuer(std::move(issuer)), audience(std::move(audience))
{}

auto JwtVerifier::fromKeyFile(const boost::filesystem::path& keyFile, const std::string& issuer,
                              const std::string& audience) -> JwtVerifier
{
    boost::filesystem::ifstream file(keyFile);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open the JWT public key " + keyFile.string());
    }

    std::stringstream publicKey;
    publicKey << file.rdbuf();

    std::cout << "Auth: Loaded the JWT verification key from " << keyFile << std::endl;

    return {publicKey.str(), issuer, audience};
}

auto JwtVerifier::verify(const std::string& assertion) const -> sAuthContext
{
    nlohmann::json claims;
    try {
        std::error_code errorCode;
        auto decodedToken = jwt::decode(
                assertion,
                jwt::params::algorithms({"RS256"}),
                errorCode,
                jwt::params::secret(publicKeyPem),
                jwt::params::issuer(issuer),
                jwt::params::aud(audience),
                jwt::params::verify(true)
        );

        if (errorCode) {
            throw eVerificationFailed("Assertion rejected: " + errorCode.message());
        }

        claims = decodedToken.payload().create_json_obj();
    } catch (eVerificationFailed&) {
        throw;
    } catch (std::exception& e) {
        // cpp-jwt still throws for some malformed input even with an error_code supplied
        throw eVerificationFailed(std::string("Assertion could not be decoded: ") + e.what());
    }

    // The identity service adds these custom claims to every assertion it signs
    for (const auto* claim : {"userId", "nameCode"}) {
        if (!claims.contains(claim) || !claims[claim].is_string()) {
            throw eVerificationFailed(std::string("Assertion is missing the ") + claim + " claim");
        }
    }

    if (!claims.contains("namespaces") || !claims["namespaces"].is_array()) {
        throw eVerificationFailed("Assertion is missing the namespaces claim");
    }

    std::vector<std::string> namespaces;
    for (const auto& namespaceId : claims["namespaces"]) {
        if (!namespaceId.is_string()) {
            throw eVerificationFailed("Assertion has a malformed namespaces claim");
        }
        namespaces.push_back(namespaceId.get<std::string>());
    }

    return {
            claims["userId"].get<std::string>(),
            claims["nameCode"].get<std::string>(),
            namespaces,
            sSignedAssertion{assertion}
    };
}
