//
// The legacy staging API served over Simple-Web-Server
//

#include "HttpServer.h"
#include "../Settings.h"
#include "HttpUtils.h"
#include <iostream>
#include <memory>

HttpServer::HttpServer(const std::shared_ptr<Authenticator>& authenticator,
                       const std::shared_ptr<IRepository>& repository, const std::shared_ptr<Publisher>& publisher)
        : authenticator(authenticator) {
    server.config.port = HTTP_PORT;
    server.config.address = "0.0.0.0";
    server.config.thread_pool_size = HTTP_WORKER_POOL_SIZE;
    server.config.timeout_content = HTTP_CONTENT_TIMEOUT_SECONDS;

    // Add the various API's
    StatusApi("/service/local/status", this);
    StagingApi("/service/local/staging/", this, repository, publisher);
    ManualApi("/manual/upload/", this, repository, publisher);
    FallbackApi(this);
}

void HttpServer::start() {
    server_thread = std::thread([this]() {
        // Start server
        this->server.start();
    });

    std::cout << "API: Server listening on port " << server.config.port << std::endl << std::endl;
}

void HttpServer::join() {
    server_thread.join();
}

void HttpServer::stop() {
    server.stop();
    join();
}

auto HttpServer::isAuthorized(SimpleWeb::CaseInsensitiveMultimap &headers) -> std::unique_ptr<sAuthContext> {
    try {
        return std::make_unique<sAuthContext>(authenticator->authenticate(getHeader(headers, "Authorization")));
    } catch (std::exception& e) {
        // The client only ever learns that it wasn't authorized, the reason is for the operator
        dumpExceptions(e);
        throw eNotAuthorized();
    }
}
