//
// How the publishing service should treat an uploaded bundle
//

#ifndef STAGING_GATEWAY_PUBLISHINGTYPE_H
#define STAGING_GATEWAY_PUBLISHINGTYPE_H

#include <ostream>
#include <string>

enum class PublishingType {
    // The bundle is validated and then waits for the owner to publish it
    UserManaged,

    // The bundle is validated and published straight away
    Automatic
};

// The wire token, USER_MANAGED or AUTOMATIC
auto publishingTypeToString(PublishingType publishingType) -> std::string;

// "automatic" in any case selects Automatic. Anything else, including an empty value, is UserManaged
auto publishingTypeFromString(const std::string& value) -> PublishingType;

auto operator<<(std::ostream& stream, PublishingType publishingType) -> std::ostream&;

#endif //STAGING_GATEWAY_PUBLISHINGTYPE_H
