//
// Upload of everything deployed without a staging profile, triggered by hand
//

#include "HttpServer.h"
#include "HttpUtils.h"

void ManualApi(const std::string &path, HttpServer *server, const std::shared_ptr<IRepository>& repository,
               const std::shared_ptr<Publisher>& publisher) {
    // Post     defaultRepository?publishing_type=  -> Publish the caller's no-profile repository
    server->getServer().resource["^" + path + "defaultRepository$"]["POST"] = [server, repository, publisher](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        // Verify that the user is authorized
        std::unique_ptr<sAuthContext> authContext;
        try {
            authContext = server->isAuthorized(request->header);
        } catch (std::exception& e) {
            dumpExceptions(e);

            // Invalid request
            response->write(SimpleWeb::StatusCode::client_error_unauthorized, "Not authorized");
            return;
        }

        try {
            auto query_fields = request->parse_query_string();
            auto publishingType = publishingTypeFromString(getQueryParamAsString(query_fields, "publishing_type"));

            auto repositoryKey = repository->openNoProfileRepository(
                    authContext->username,
                    request->remote_endpoint().address().to_string()
            );

            auto deploymentId = publisher->publish(authContext->credentials, repositoryKey, publishingType);

            response->write(SimpleWeb::StatusCode::success_ok, deploymentId);
        } catch (std::exception& e) {
            respondWithError(response, e);
        }
    };
}
