//
// Identifies one staging session: who opened it, from where, for which namespace, and which one of those
//

#ifndef STAGING_GATEWAY_REPOSITORYKEY_H
#define STAGING_GATEWAY_REPOSITORYKEY_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

class RepositoryKey {
public:
    RepositoryKey(std::string ownerIdentity, std::optional<std::string> clientAddress,
                  std::optional<std::string> namespaceId, uint32_t sequenceIndex);

    // Rebuild the key for a public repository identifier ("{namespace}-{index}") on behalf of the caller. Throws
    // eValidationError if the identifier is malformed
    static auto fromRepositoryId(const std::string& ownerIdentity, const std::optional<std::string>& clientAddress,
                                 const std::string& repositoryId) -> RepositoryKey;

    [[nodiscard]] auto ownerIdentity() const -> const std::string& { return ownerIdentityValue; }
    [[nodiscard]] auto clientAddress() const -> const std::optional<std::string>& { return clientAddressValue; }
    [[nodiscard]] auto sequenceIndex() const -> uint32_t { return sequenceIndexValue; }

    // The declared namespace, or the no-profile sentinel
    [[nodiscard]] auto getNamespace() const -> std::string;
    [[nodiscard]] auto hasNamespace() const -> bool { return namespaceValue.has_value(); }

    // "address" segment used for paths and allocator keys
    [[nodiscard]] auto getClientAddress() const -> std::string;

    // The identifier handed to clients, "{namespace}-{index}"
    [[nodiscard]] auto getRepositoryId() const -> std::string;

    // "owner/address/namespace-index"
    [[nodiscard]] auto toString() const -> std::string;

    auto operator==(const RepositoryKey& other) const -> bool = default;

private:
    std::string ownerIdentityValue;
    std::optional<std::string> clientAddressValue;
    std::optional<std::string> namespaceValue;
    uint32_t sequenceIndexValue;
};

auto operator<<(std::ostream& stream, const RepositoryKey& key) -> std::ostream&;

#endif //STAGING_GATEWAY_REPOSITORYKEY_H
