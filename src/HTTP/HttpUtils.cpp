//
// Request and response helpers shared by the API handlers
//

#include "HttpUtils.h"
#include "../Lib/Exceptions.h"
#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <cctype>
#include <sstream>

namespace {
    const std::string XML_ATTRIBUTES = "<xmlattr>";
    const std::string XML_LIST_ITEM = "string";

    auto classifyMediaType(const std::string& mediaType) -> eContentType
    {
        // Drop any parameters, "application/xml; charset=utf-8"
        auto essence = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(mediaType.substr(0, mediaType.find(';'))));

        auto slash = essence.find('/');
        if (slash == std::string::npos || essence.substr(0, slash) != "application") {
            return eContentType::Unknown;
        }

        auto subtype = essence.substr(slash + 1);
        auto plus = subtype.rfind('+');
        auto suffix = plus == std::string::npos ? std::string() : subtype.substr(plus + 1);

        if (subtype == "xml" || suffix == "xml") {
            return eContentType::Xml;
        }

        if (subtype == "json" || suffix == "json") {
            return eContentType::Json;
        }

        return eContentType::Unknown;
    }

    auto ptreeToJson(const boost::property_tree::ptree& node) -> nlohmann::json
    {
        auto elementCount = std::count_if(node.begin(), node.end(), [](const auto& child) {
            return child.first != XML_ATTRIBUTES;
        });

        if (elementCount == 0) {
            return boost::algorithm::trim_copy(node.data());
        }

        auto bAllListItems = std::all_of(node.begin(), node.end(), [](const auto& child) {
            return child.first == XML_ATTRIBUTES || child.first == XML_LIST_ITEM;
        });

        if (bAllListItems) {
            auto result = nlohmann::json::array();
            for (const auto& [name, child] : node) {
                if (name == XML_LIST_ITEM) {
                    result.push_back(ptreeToJson(child));
                }
            }
            return result;
        }

        auto result = nlohmann::json::object();
        for (const auto& [name, child] : node) {
            if (name != XML_ATTRIBUTES) {
                result[name] = ptreeToJson(child);
            }
        }
        return result;
    }

    auto scalarToString(const nlohmann::ordered_json& value) -> std::string
    {
        if (value.is_string()) {
            return value.get<std::string>();
        }

        if (value.is_null()) {
            return {};
        }

        // Booleans and numbers print the same way in both formats
        return value.dump();
    }

    void jsonToPtree(const nlohmann::ordered_json& value, boost::property_tree::ptree& node,
                     const std::string& objectItemName)
    {
        if (value.is_object()) {
            for (const auto& member : value.items()) {
                const auto& key = member.key();
                if (!key.empty() && key.front() == '@') {
                    node.put(XML_ATTRIBUTES + "." + key.substr(1), scalarToString(member.value()));
                    continue;
                }

                jsonToPtree(member.value(), node.add_child(key, boost::property_tree::ptree()), objectItemName);
            }
            return;
        }

        if (value.is_array()) {
            for (const auto& item : value) {
                auto itemName = item.is_object() ? objectItemName : XML_LIST_ITEM;
                jsonToPtree(item, node.add_child(itemName, boost::property_tree::ptree()), objectItemName);
            }
            return;
        }

        node.put_value(scalarToString(value));
    }
}

auto getHeader(SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string {
    // Header names are matched case insensitively
    auto headerItem = headers.find(header);
    if (headerItem != headers.end()) {
        return headerItem->second;
    }

    // Return an empty string
    return {};
}

auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> std::string {
    auto ptr = query_fields.find(what);
    std::string result;
    if (ptr != query_fields.end()) {
        result = ptr->second;
    }
    return result;
}

auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> bool {
    auto ptr = query_fields.find(what);
    return ptr != query_fields.end();
}

auto decodePathSegment(const std::string& segment) -> std::string
{
    std::string result;
    result.reserve(segment.size());

    for (size_t index = 0; index < segment.size(); index++) {
        const auto character = segment[index];
        if (character == '%' && index + 2 < segment.size() &&
            std::isxdigit(static_cast<unsigned char>(segment[index + 1])) != 0 &&
            std::isxdigit(static_cast<unsigned char>(segment[index + 2])) != 0) {
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            result += static_cast<char>(std::stoi(segment.substr(index + 1, 2), nullptr, 16));
            index += 2;
        } else {
            result += character;
        }
    }

    return result;
}

auto contentTypeFromMediaType(const std::string& mediaType) -> eContentType
{
    std::vector<std::string> mediaTypes;
    boost::split(mediaTypes, mediaType, boost::is_any_of(","));

    for (const auto& candidate : mediaTypes) {
        auto contentType = classifyMediaType(candidate);
        if (contentType != eContentType::Unknown) {
            return contentType;
        }
    }

    return eContentType::Unknown;
}

auto responseContentType(SimpleWeb::CaseInsensitiveMultimap& headers) -> eContentType
{
    auto accept = contentTypeFromMediaType(getHeader(headers, "Accept"));
    if (accept != eContentType::Unknown) {
        return accept;
    }

    return contentTypeFromMediaType(getHeader(headers, "Content-Type"));
}

auto parseRequestDocument(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json
{
    switch (contentTypeFromMediaType(getHeader(request->header, "Content-Type"))) {
        case eContentType::Json: {
            nlohmann::json document;
            request->content >> document;
            return document;
        }
        case eContentType::Xml: {
            boost::property_tree::ptree tree;
            boost::property_tree::read_xml(request->content, tree, boost::property_tree::xml_parser::trim_whitespace);

            // A document has exactly one root element
            auto root = std::find_if(tree.begin(), tree.end(), [](const auto& child) {
                return child.first != "<xmlcomment>";
            });
            if (root == tree.end()) {
                throw eValidationError("Request body has no root element");
            }

            auto document = ptreeToJson(root->second);
            return document.is_object() ? document : nlohmann::json::object();
        }
        case eContentType::Unknown:
        default:
            throw eValidationError("Expected a Content-Type of application/xml or application/json");
    }
}

auto getStringList(const nlohmann::json& value) -> std::vector<std::string>
{
    if (value.is_array()) {
        return value.get<std::vector<std::string>>();
    }

    auto single = value.get<std::string>();
    if (single.empty()) {
        return {};
    }

    return {single};
}

auto renderDocument(eContentType contentType, const std::string& rootName, const nlohmann::ordered_json& document,
                    const std::string& objectItemName) -> std::string
{
    if (contentType == eContentType::Json) {
        return document.dump(2);
    }

    if (contentType == eContentType::Xml) {
        boost::property_tree::ptree tree;
        jsonToPtree(document, tree.add_child(rootName, boost::property_tree::ptree()), objectItemName);

        std::stringstream xml;
        boost::property_tree::write_xml(xml, tree, boost::property_tree::xml_writer_make_settings<std::string>(' ', 2));
        return xml.str();
    }

    throw eValidationError("Could not determine response content type");
}

void respondWithDocument(const std::shared_ptr<HttpServerImpl::Response>& response,
                         const std::shared_ptr<HttpServerImpl::Request>& request, const std::string& rootName,
                         const nlohmann::ordered_json& document, const std::string& objectItemName)
{
    auto contentType = responseContentType(request->header);
    auto body = renderDocument(contentType, rootName, document, objectItemName);

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", contentType == eContentType::Xml ? "application/xml" : "application/json");

    response->write(SimpleWeb::StatusCode::success_ok, body, headers);
}

void respondWithError(const std::shared_ptr<HttpServerImpl::Response>& response, std::exception& exception)
{
    dumpExceptions(exception);

    if (dynamic_cast<eStorageError*>(&exception) != nullptr) {
        response->write(SimpleWeb::StatusCode::server_error_internal_server_error, "Internal server error");
        return;
    }

    if (dynamic_cast<eUpstreamError*>(&exception) != nullptr) {
        response->write(SimpleWeb::StatusCode::server_error_bad_gateway, "Upstream failure");
        return;
    }

    // Validation failures, unreadable request bodies and anything else the client sent
    response->write(
            SimpleWeb::StatusCode::client_error_bad_request,
            std::string("Failed to process request: ") + exception.what()
    );
}
