//
// Request and response helpers shared by the API handlers
//

#ifndef STAGING_GATEWAY_HTTPUTILS_H
#define STAGING_GATEWAY_HTTPUTILS_H

#include "HttpServer.h"
#include <nlohmann/json.hpp>
#include <boost/property_tree/ptree.hpp>

enum class eContentType {
    Xml,
    Json,
    Unknown
};

auto getHeader(SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string;
auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;
auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> bool;

// Decode %XX escapes in a URL path. Unlike query strings a '+' is kept as is, and malformed escapes are left alone
auto decodePathSegment(const std::string& segment) -> std::string;

// Classify a media type (or a comma separated Accept list, first match wins). Only application/ types count,
// matched on the subtype or a +xml/+json suffix
auto contentTypeFromMediaType(const std::string& mediaType) -> eContentType;

// The format to answer in: Accept when it names XML or JSON, otherwise whatever the request body was sent as
auto responseContentType(SimpleWeb::CaseInsensitiveMultimap& headers) -> eContentType;

// Parse an XML or JSON request body into JSON. XML elements become object members, elements holding only
// <string> children become arrays and leaf values are strings. The root element is dropped. Throws
// eValidationError if the body is in neither format
auto parseRequestDocument(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json;

// Read a list of strings from a parsed document. XML can't tell an empty list from an empty string, so both
// forms are accepted
auto getStringList(const nlohmann::json& value) -> std::vector<std::string>;

// Render a response document in the negotiated format. Arrays of scalars are written to XML as <string>
// elements and arrays of objects as objectItemName elements. Members starting with '@' are XML attributes
auto renderDocument(eContentType contentType, const std::string& rootName, const nlohmann::ordered_json& document,
                    const std::string& objectItemName = "") -> std::string;

void respondWithDocument(const std::shared_ptr<HttpServerImpl::Response>& response,
                         const std::shared_ptr<HttpServerImpl::Request>& request, const std::string& rootName,
                         const nlohmann::ordered_json& document, const std::string& objectItemName = "");

// Log the exception and answer with the status its error family maps to
void respondWithError(const std::shared_ptr<HttpServerImpl::Response>& response, std::exception& exception);

#endif //STAGING_GATEWAY_HTTPUTILS_H
