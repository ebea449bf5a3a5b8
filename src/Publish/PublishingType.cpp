//
// How the publishing service should treat an uploaded bundle
//

#include "PublishingType.h"
#include <boost/algorithm/string/predicate.hpp>

auto publishingTypeToString(PublishingType publishingType) -> std::string
{
    switch (publishingType) {
        case PublishingType::Automatic:
            return "AUTOMATIC";
        case PublishingType::UserManaged:
        default:
            return "USER_MANAGED";
    }
}

auto publishingTypeFromString(const std::string& value) -> PublishingType
{
    return boost::algorithm::iequals(value, "automatic") ? PublishingType::Automatic : PublishingType::UserManaged;
}

auto operator<<(std::ostream& stream, PublishingType publishingType) -> std::ostream&
{
    return stream << publishingTypeToString(publishingType);
}
