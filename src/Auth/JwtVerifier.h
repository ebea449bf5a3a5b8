//
// Verifies the RS256 assertions issued by the identity service
//

#ifndef STAGING_GATEWAY_JWTVERIFIER_H
#define STAGING_GATEWAY_JWTVERIFIER_H

#include "Credentials.h"
#include <boost/filesystem/path.hpp>
#include <string>

class JwtVerifier {
public:
    JwtVerifier(std::string publicKeyPem, std::string issuer, std::string audience);

    // Load the PEM encoded public key from disk. Throws std::runtime_error if the file can't be read
    static auto fromKeyFile(const boost::filesystem::path& keyFile, const std::string& issuer,
                            const std::string& audience) -> JwtVerifier;

    // Check the signature, issuer, audience and expiry of the assertion and build the identity it describes.
    // Throws eVerificationFailed on any mismatch or missing claim
    [[nodiscard]] auto verify(const std::string& assertion) const -> sAuthContext;

private:
    std::string publicKeyPem;
    std::string issuer;
    std::string audience;
};

#endif //STAGING_GATEWAY_JWTVERIFIER_H
