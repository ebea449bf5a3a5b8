//
// The staging half of the legacy repository manager API
//

#include "../Lib/Exceptions.h"
#include "../Settings.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <iostream>

namespace {
    // Profiles are synthesised from the namespace, the publishing service has no equivalent
    auto stagingProfile(const std::string &baseUrl, const std::string &namespaceId, const std::string &resourceUri)
            -> nlohmann::ordered_json {
        return {
                {"resourceURI", resourceUri},
                {"id", namespaceId},
                {"name", namespaceId},
                {"repositoryType", "maven2"},
                {"repositoryTemplateId", "default_hosted_release"},
                {"repositoryTargetId", "repository_target_id"},
                {"inProgress", false},
                {"order", 12345}, // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
                {"deployURI", baseUrl + "/service/local/staging/deploy/maven2"},
                {"targetGroups", nlohmann::ordered_json::array({"staging"})},
                {"finishNotifyRoles", nlohmann::ordered_json::array({namespaceId + "-deployer"})},
                {"promotionNotifyRoles", nlohmann::ordered_json::array()},
                {"dropNotifyRoles", nlohmann::ordered_json::array()},
                {"closeRuleSets", nlohmann::ordered_json::array({"close_rule_set"})},
                {"promoteRuleSets", nlohmann::ordered_json::array()},
                {"promotionTargetRepository", "releases"},
                {"mode", "BOTH"},
                {"finishNotifyCreator", true},
                {"promotionNotifyCreator", true},
                {"dropNotifyCreator", true},
                {"autoStagingDisabled", false},
                {"repositoriesSearchable", false},
                {"properties", {{"@class", "linked-hash-map"}}}
        };
    }

    auto stagingProfiles(const std::string &baseUrl, const std::vector<std::string> &namespaces)
            -> nlohmann::ordered_json {
        auto profiles = nlohmann::ordered_json::array();
        for (const auto &namespaceId : namespaces) {
            profiles.push_back(stagingProfile(
                    baseUrl,
                    namespaceId,
                    baseUrl + "/service/local/staging/profile_evaluate/" + namespaceId
            ));
        }

        return {{"data", profiles}};
    }

    auto stagingRepository(const std::string &baseUrl, const std::string &repositoryId, RepositoryState state)
            -> nlohmann::ordered_json {
        return {
                {"profileId", "profile_id"},
                {"profileName", "profile_name"},
                {"profileType", "repository"},
                {"repositoryId", repositoryId},
                {"type", repositoryStateToString(state)},
                {"policy", "release"},
                {"userId", "user_id"},
                {"userAgent", "user_agent"},
                {"ipAddress", "ip_address"},
                {"repositoryURI", baseUrl + "/content/repositories/" + repositoryId},
                {"created", "1970-01-01T00:00:00.000Z"},
                {"createdDate", "Thu Jan 1 00:00:00 UTC 1970"},
                {"createdTimestamp", 0},
                {"updated", "1970-01-01T00:00:00.000Z"},
                {"updatedDate", "Thu Jan 1 00:00:00 UTC 1970"},
                {"updatedTimestamp", 0},
                {"description", "description"},
                {"provider", "maven2"},
                {"releaseRepositoryId", "releases"},
                {"releaseRepositoryName", "Releases"},
                {"notifications", 0},
                {"transitioning", false}
        };
    }

    auto clientAddress(const std::shared_ptr<HttpServerImpl::Request> &request) -> std::string {
        return request->remote_endpoint().address().to_string();
    }

    // Authenticate the request, answering 401 and returning null if it isn't authorized
    auto authorize(HttpServer *server, const std::shared_ptr<HttpServerImpl::Response> &response,
                   const std::shared_ptr<HttpServerImpl::Request> &request) -> std::unique_ptr<sAuthContext> {
        try {
            return server->isAuthorized(request->header);
        } catch (std::exception &e) {
            dumpExceptions(e);

            // Invalid request
            response->write(SimpleWeb::StatusCode::client_error_unauthorized, "Not authorized");
            return nullptr;
        }
    }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void StagingApi(const std::string &path, HttpServer *server, const std::shared_ptr<IRepository>& repository,
                const std::shared_ptr<Publisher>& publisher) {
    // Get      profile_evaluate                    -> Profile matching the requested group
    // Get      profiles                            -> A profile for each namespace the caller may publish to
    // Get      profiles/{namespace}                -> A single profile
    // Post     profiles/{namespace}/start          -> Open a new staging repository
    // Post     profiles/{namespace}/finish         -> Close a staging repository and publish it
    // Put      deployByRepositoryId/{id}/{path}    -> Upload a file into a staging repository
    // Get      repository/{id}                     -> State of a staging repository
    // Post     bulk/close                          -> Close and publish several staging repositories
    // Post     bulk/promote                        -> Release several staging repositories
    // Put      deploy/maven2/{path}                -> Upload a file into the caller's no-profile repository

    server->getServer().resource["^" + path + "profile_evaluate$"]["GET"] = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto query_fields = request->parse_query_string();
            if (!hasQueryParam(query_fields, "g")) {
                throw eValidationError("The 'g' query parameter is required");
            }

            respondWithDocument(
                    response,
                    request,
                    "stagingProfiles",
                    stagingProfiles(getHeader(request->header, "Host"), {getQueryParamAsString(query_fields, "g")}),
                    "stagingProfile"
            );
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "profiles$"]["GET"] = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            respondWithDocument(
                    response,
                    request,
                    "stagingProfiles",
                    stagingProfiles(getHeader(request->header, "Host"), authContext->namespaces),
                    "stagingProfile"
            );
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "profiles/([^/]+)$"]["GET"] = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto profileId = decodePathSegment(request->path_match[1].str());
            auto baseUrl = getHeader(request->header, "Host");

            respondWithDocument(
                    response,
                    request,
                    "profileResponse",
                    {{"data", stagingProfile(
                            baseUrl,
                            profileId,
                            baseUrl + "/service/local/staging/profiles/" + profileId + "/" + profileId
                    )}}
            );
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "profiles/([^/]+)/start$"]["POST"] = [server, repository](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto profileId = decodePathSegment(request->path_match[1].str());

            // Read the description from the promote request
            auto document = parseRequestDocument(request);
            auto description = document.at("data").at("description").get<std::string>();

            auto repositoryKey = repository->start(authContext->username, clientAddress(request), profileId);

            respondWithDocument(
                    response,
                    request,
                    "promoteResponse",
                    {{"data", {
                            {"stagedRepositoryId", repositoryKey.getRepositoryId()},
                            {"description", description}
                    }}}
            );
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "profiles/([^/]+)/finish$"]["POST"] = [server, publisher](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto document = parseRequestDocument(request);
            auto repositoryKey = RepositoryKey::fromRepositoryId(
                    authContext->username,
                    clientAddress(request),
                    document.at("data").at("stagedRepositoryId").get<std::string>()
            );

            publisher->publish(authContext->credentials, repositoryKey, PublishingType::Automatic);

            response->write(SimpleWeb::StatusCode::success_ok);
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "deployByRepositoryId/([^/]+)/(.+)$"]["PUT"] = [server, repository](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto repositoryId = decodePathSegment(request->path_match[1].str());
            auto filePath = decodePathSegment(request->path_match[2].str());

            // The publishing service generates its own metadata
            if (filePath.find("maven-metadata.xml") != std::string::npos) {
                std::cout << "API: Skipping metadata file " << filePath << std::endl;
                response->write(SimpleWeb::StatusCode::success_created);
                return;
            }

            auto repositoryKey = RepositoryKey::fromRepositoryId(
                    authContext->username,
                    clientAddress(request),
                    repositoryId
            );

            repository->addFile(authContext->namespaces, repositoryKey, filePath, request->content);

            response->write(SimpleWeb::StatusCode::success_created);
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    // Staged files can't be read back
    server->getServer().resource["^" + path + "deployByRepositoryId/([^/]+)/(.+)$"]["GET"] = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        response->write(SimpleWeb::StatusCode::client_error_not_found);
    };

    server->getServer().resource["^" + path + "repository/([^/]+)$"]["GET"] = [server, repository](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto repositoryId = decodePathSegment(request->path_match[1].str());
            auto repositoryKey = RepositoryKey::fromRepositoryId(
                    authContext->username,
                    clientAddress(request),
                    repositoryId
            );

            auto state = repository->getState(repositoryKey);

            respondWithDocument(
                    response,
                    request,
                    "stagingProfileRepository",
                    stagingRepository(getHeader(request->header, "Host"), repositoryId, state)
            );
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "bulk/close$"]["POST"] = [server, publisher](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto document = parseRequestDocument(request);
            auto repositoryIds = getStringList(document.at("data").at("stagedRepositoryIds"));

            // Stops at the first failure, repositories published before it stay published
            for (const auto &repositoryId : repositoryIds) {
                auto repositoryKey = RepositoryKey::fromRepositoryId(
                        authContext->username,
                        clientAddress(request),
                        repositoryId
                );

                publisher->publish(authContext->credentials, repositoryKey, PublishingType::Automatic);
            }

            response->write(SimpleWeb::StatusCode::success_ok);
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "bulk/promote$"]["POST"] = [server, repository](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto document = parseRequestDocument(request);
            auto repositoryIds = getStringList(document.at("data").at("stagedRepositoryIds"));

            for (const auto &repositoryId : repositoryIds) {
                auto repositoryKey = RepositoryKey::fromRepositoryId(
                        authContext->username,
                        clientAddress(request),
                        repositoryId
                );

                repository->release(repositoryKey);
            }

            response->write(SimpleWeb::StatusCode::success_ok);
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "deploy/maven2/(.+)$"]["PUT"] = [server, repository](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        try {
            auto filePath = decodePathSegment(request->path_match[1].str());

            auto repositoryKey = repository->openNoProfileRepository(authContext->username, clientAddress(request));
            repository->addFile(authContext->namespaces, repositoryKey, filePath, request->content);

            response->write(SimpleWeb::StatusCode::success_created);
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };

    server->getServer().resource["^" + path + "deploy/maven2/(.+)$"]["GET"] = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authContext = authorize(server, response, request);
        if (!authContext) {
            return;
        }

        response->write(SimpleWeb::StatusCode::client_error_not_found);
    };
}
