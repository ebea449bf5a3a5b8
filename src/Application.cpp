//
// Builds every component of the gateway from the environment and owns them for the life of the process
//

#include "Application.h"
#include "Auth/IdentityServiceClient.h"
#include "Publish/PortalApiClient.h"
#include "Repository/LocalRepository.h"
#include "Settings.h"
#include <iostream>
#include <utility>

Application::Application(std::shared_ptr<IPortalClient> portalClient, std::shared_ptr<IIdentityService> identityService)
        : portalClient(std::move(portalClient)), identityService(std::move(identityService))
{
    // Staging area
    auto stagingRoot = STAGING_ROOT;
    if (stagingRoot.empty()) {
        repository = std::make_shared<LocalRepository>();
    } else {
        repository = std::make_shared<LocalRepository>(boost::filesystem::path(stagingRoot));
    }

    // Credential bridge
    std::shared_ptr<JwtVerifier> verifier;
    auto publicKeyFile = JWT_PUBLIC_KEY_FILE;
    if (!publicKeyFile.empty()) {
        verifier = std::make_shared<JwtVerifier>(JwtVerifier::fromKeyFile(publicKeyFile, JWT_ISSUER, JWT_AUDIENCE));
    }

    auto identityUrl = IDENTITY_URL;
    if (!this->identityService && !identityUrl.empty()) {
        this->identityService = std::make_shared<IdentityServiceClient>(identityUrl);
    }

    if (this->identityService && !verifier) {
        throw std::runtime_error(
                std::string("An identity service needs a key to verify its assertions, set ") +
                JWT_PUBLIC_KEY_FILE_ENV_VARIABLE
        );
    }

    if (!this->identityService) {
        std::cout << "Auth: No identity service configured, passing legacy credentials through" << std::endl;
    }

    authenticator = std::make_shared<Authenticator>(verifier, this->identityService);

    // Publishing
    if (!this->portalClient) {
        this->portalClient = std::make_shared<PortalApiClient>(CENTRAL_URL);
    }

    publisher = std::make_shared<Publisher>(repository, this->portalClient);

    httpServer = std::make_shared<HttpServer>(authenticator, repository, publisher);
}

void Application::run()
{
    httpServer->start();
    httpServer->join();
}

auto createApplication(std::shared_ptr<IPortalClient> portalClient, std::shared_ptr<IIdentityService> identityService)
        -> std::shared_ptr<Application>
{
    return std::make_shared<Application>(std::move(portalClient), std::move(identityService));
}
