//
// Catch-all for requests the gateway doesn't know how to translate
//

#include "HttpServer.h"
#include <boost/algorithm/string/predicate.hpp>
#include <iostream>

void FallbackApi(HttpServer *server) {
    for (const auto *method : {"GET", "HEAD", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"}) {
        server->getServer().default_resource[method] = [](
                const std::shared_ptr<HttpServerImpl::Response> &response,
                const std::shared_ptr<HttpServerImpl::Request> &request) {

            // Log enough to add support for the call later
            std::cerr << "API: Unhandled request " << request->method << " " << request->path;
            if (!request->query_string.empty()) {
                std::cerr << "?" << request->query_string;
            }
            std::cerr << std::endl;

            for (const auto &header : request->header) {
                if (!boost::algorithm::iequals(header.first, "Authorization")) {
                    std::cerr << "API:     " << header.first << ": " << header.second << std::endl;
                }
            }

            response->write(SimpleWeb::StatusCode::client_error_unauthorized, "New method identified");
        };
    }
}
