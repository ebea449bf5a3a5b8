//
// Uploads bundles to the publishing service's publisher API
//

#include "PortalApiClient.h"
#include "../Lib/Exceptions.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <iostream>

PortalApiClient::PortalApiClient(const std::string& baseUrl) : service(parseServiceUrl(baseUrl))
{}

auto PortalApiClient::upload(const Credentials& credentials, const std::string& deploymentName,
                             PublishingType publishingType, const std::vector<uint8_t>& bundle) -> std::string
{
    auto boundary = "------------------------" + generateUUID();

    SimpleWeb::CaseInsensitiveMultimap query;
    query.emplace("name", deploymentName);
    query.emplace("publishingType", publishingTypeToString(publishingType));

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Authorization", bearerAuthHeader(credentials));
    headers.emplace("Content-Type", "multipart/form-data; boundary=" + boundary);

    std::cout << "Publish: Uploading " << bundle.size() << " bytes as \"" << deploymentName << "\" ("
              << publishingType << ")" << std::endl;

    auto response = sendHttpRequest(
            service,
            "POST",
            std::string(PORTAL_UPLOAD_PATH) + "?" + SimpleWeb::QueryString::create(query),
            buildBundleBody(boundary, bundle),
            headers
    );

    if (!response.isSuccess()) {
        throw eUpstreamError(
                "Upload of \"" + deploymentName + "\" failed with status " + std::to_string(response.statusCode) +
                ": " + response.body
        );
    }

    std::cout << "Publish: Created deployment " << response.body << std::endl;

    return response.body;
}

auto buildBundleBody(const std::string& boundary, const std::vector<uint8_t>& bundle) -> std::string
{
    std::string body;
    body.reserve(bundle.size() + boundary.size() * 2 + 256); // NOLINT(readability-magic-numbers)

    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"bundle\"; filename=\"bundle.zip\"\r\n";
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body.append(bundle.begin(), bundle.end());
    body += "\r\n--" + boundary + "--\r\n";

    return body;
}
