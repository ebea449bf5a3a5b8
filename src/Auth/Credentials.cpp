//
// Outbound credentials and the identity attached to an authorized request
//

#include "Credentials.h"

namespace {
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

auto bearerAuthHeader(const Credentials& credentials) -> std::string
{
    return "Bearer " + std::visit(overloaded{
            [](const sLegacyToken& legacyToken) { return encodeLegacyToken(legacyToken); },
            [](const sSignedAssertion& assertion) { return assertion.token; }
    }, credentials);
}
