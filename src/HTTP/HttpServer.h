//
// The legacy staging API served over Simple-Web-Server
//

#ifndef STAGING_GATEWAY_HTTPSERVER_H
#define STAGING_GATEWAY_HTTPSERVER_H

#include "../Auth/Authenticator.h"
#include "../Interfaces/IRepository.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/TestingMacros.h"
#include "../Publish/Publisher.h"
#include <iostream>
#include <memory>
#include <server_http.hpp>
#include <thread>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

class eNotAuthorized : public std::exception {
};

class HttpServer {
public:
    HttpServer(const std::shared_ptr<Authenticator>& authenticator, const std::shared_ptr<IRepository>& repository,
               const std::shared_ptr<Publisher>& publisher);

    void start();

    void join();

    void stop();

    auto getServer() -> HttpServerImpl & { return this->server; }

    // Authenticate the request from its Authorization header. Any failure is logged and raised as eNotAuthorized,
    // so callers can't leak why a request was refused
    auto isAuthorized(SimpleWeb::CaseInsensitiveMultimap &headers) -> std::unique_ptr<sAuthContext>;

private:
    HttpServerImpl server;
    std::thread server_thread;
    std::shared_ptr<Authenticator> authenticator;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(authenticator);
};

void StatusApi(const std::string &path, HttpServer *server);
void StagingApi(const std::string &path, HttpServer *server, const std::shared_ptr<IRepository>& repository,
                const std::shared_ptr<Publisher>& publisher);
void ManualApi(const std::string &path, HttpServer *server, const std::shared_ptr<IRepository>& repository,
               const std::shared_ptr<Publisher>& publisher);
void FallbackApi(HttpServer *server);

#endif //STAGING_GATEWAY_HTTPSERVER_H
