//
// Identifies one staging session: who opened it, from where, for which namespace, and which one of those
//

#include "RepositoryKey.h"
#include "../Lib/Exceptions.h"
#include "../Settings.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

RepositoryKey::RepositoryKey(std::string ownerIdentity, std::optional<std::string> clientAddress,
                             std::optional<std::string> namespaceId, uint32_t sequenceIndex)
    : ownerIdentityValue(std::move(ownerIdentity)), clientAddressValue(std::move(clientAddress)),
      namespaceValue(std::move(namespaceId)), sequenceIndexValue(sequenceIndex)
{
    // An explicit sentinel namespace is the same repository as an undeclared one
    if (namespaceValue && *namespaceValue == NO_PROFILE) {
        namespaceValue.reset();
    }
}

auto RepositoryKey::fromRepositoryId(const std::string& ownerIdentity, const std::optional<std::string>& clientAddress,
                                     const std::string& repositoryId) -> RepositoryKey
{
    auto separator = repositoryId.rfind('-');
    if (separator == std::string::npos || separator == 0) {
        throw eValidationError("Invalid repository id: " + repositoryId);
    }

    auto sNamespace = repositoryId.substr(0, separator);
    auto sIndex = repositoryId.substr(separator + 1);

    // from_chars would accept a trailing suffix, so require digits only
    if (sIndex.empty() || !std::all_of(sIndex.begin(), sIndex.end(), [](unsigned char character) {
            return std::isdigit(character) != 0;
        })) {
        throw eValidationError("Invalid repository index in repository id: " + repositoryId);
    }

    uint32_t index = 0;
    auto [end, errorCode] = std::from_chars(sIndex.data(), sIndex.data() + sIndex.size(), index);
    if (errorCode != std::errc() || end != sIndex.data() + sIndex.size()) {
        throw eValidationError("Repository index out of range in repository id: " + repositoryId);
    }

    return {ownerIdentity, clientAddress, sNamespace, index};
}

auto RepositoryKey::getNamespace() const -> std::string
{
    return namespaceValue.value_or(NO_PROFILE);
}

auto RepositoryKey::getClientAddress() const -> std::string
{
    return clientAddressValue.value_or("unknown-address");
}

auto RepositoryKey::getRepositoryId() const -> std::string
{
    return getNamespace() + "-" + std::to_string(sequenceIndexValue);
}

auto RepositoryKey::toString() const -> std::string
{
    return ownerIdentityValue + "/" + getClientAddress() + "/" + getRepositoryId();
}

auto operator<<(std::ostream& stream, const RepositoryKey& key) -> std::ostream&
{
    return stream << key.toString();
}
