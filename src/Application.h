//
// Builds every component of the gateway from the environment and owns them for the life of the process
//

#ifndef STAGING_GATEWAY_APPLICATION_H
#define STAGING_GATEWAY_APPLICATION_H

#include "Auth/Authenticator.h"
#include "HTTP/HttpServer.h"
#include "Interfaces/IIdentityService.h"
#include "Interfaces/IPortalClient.h"
#include "Interfaces/IRepository.h"
#include "Publish/Publisher.h"
#include <memory>

class Application {
public:
    // The portal and identity clients are built from the environment unless they are supplied. Throws
    // std::runtime_error if the configuration is inconsistent
    explicit Application(std::shared_ptr<IPortalClient> portalClient = nullptr,
                         std::shared_ptr<IIdentityService> identityService = nullptr);

    Application(const Application&) = delete;
    auto operator=(const Application&) -> Application& = delete;
    Application(Application&&) = delete;
    auto operator=(Application&&) -> Application& = delete;
    ~Application() = default;

    auto getRepository() -> std::shared_ptr<IRepository> { return repository; }
    auto getAuthenticator() -> std::shared_ptr<Authenticator> { return authenticator; }
    auto getPublisher() -> std::shared_ptr<Publisher> { return publisher; }
    auto getHttpServer() -> std::shared_ptr<HttpServer> { return httpServer; }

    // Serve requests until the server is stopped
    void run();

private:
    std::shared_ptr<IRepository> repository;
    std::shared_ptr<IPortalClient> portalClient;
    std::shared_ptr<IIdentityService> identityService;
    std::shared_ptr<Authenticator> authenticator;
    std::shared_ptr<Publisher> publisher;
    std::shared_ptr<HttpServer> httpServer;
};

auto createApplication(std::shared_ptr<IPortalClient> portalClient = nullptr,
                       std::shared_ptr<IIdentityService> identityService = nullptr) -> std::shared_ptr<Application>;

#endif //STAGING_GATEWAY_APPLICATION_H
