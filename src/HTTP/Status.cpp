//
// Static status document, requested by clients before they authenticate
//

#include "HttpServer.h"
#include "HttpUtils.h"

void StatusApi(const std::string &path, HttpServer *server) {
    server->getServer().resource["^" + path + "$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            // Clients check the version before they pick a protocol, so this mimics a 2.x repository manager
            nlohmann::ordered_json status = {
                    {"data", {
                            {"appName", "Nexus Repository Manager"},
                            {"formattedAppName", "Nexus Repository Manager"},
                            {"version", "2.15.1-02"},
                            {"apiVersion", "2.15.1-02"},
                            {"editionLong", "Professional"},
                            {"editionShort", "PRO"},
                            {"attributionsURL", "http://links.sonatype.com/products/nexus/pro/attributions"},
                            {"purchaseURL", "http://links.sonatype.com/products/nexus/pro/store"},
                            {"userLicenseURL", "http://links.sonatype.com/products/nexus/pro/eula"},
                            {"state", "STARTED"},
                            {"initializedAt", "1970-01-01 00:00:00.000 UTC"},
                            {"startedAt", "1970-01-01 00:00:00.000 UTC"},
                            {"lastConfigChange", "1970-01-01 00:00:00.000 UTC"},
                            {"firstStart", false},
                            {"instanceUpgraded", false},
                            {"configurationUpgraded", false},
                            {"baseUrl", getHeader(request->header, "Host")},
                            {"licenseInstalled", true},
                            {"licenseExpired", false},
                            {"trialLicense", false}
                    }}
            };

            SimpleWeb::CaseInsensitiveMultimap headers;
            headers.emplace("Content-Type", "application/xml");

            response->write(
                    SimpleWeb::StatusCode::success_ok,
                    renderDocument(eContentType::Xml, "status", status),
                    headers
            );
        } catch (std::exception &e) {
            respondWithError(response, e);
        }
    };
}
