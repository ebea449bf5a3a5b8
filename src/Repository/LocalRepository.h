//
// Filesystem backed staging repositories
//
// Every repository lives in <root>/<owner>/<address>/<namespace>-<index>/ and holds the staged files in
// repository_contents/ next to a repository_state marker. Indexes are handed out per (owner, address, namespace)
// by an in-memory allocator guarded by a reader/writer lock. The lock is never held across file I/O.
//

#ifndef STAGING_GATEWAY_LOCALREPOSITORY_H
#define STAGING_GATEWAY_LOCALREPOSITORY_H

#include "../Interfaces/IRepository.h"
#include "../Lib/TestingMacros.h"
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <folly/SharedMutex.h>
#include <folly/Synchronized.h>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

struct sRepositoryIndex {
    // The most recently allocated index for the triple
    uint32_t highestIndex = 0;

    // Set once the repository at highestIndex has been finished, so a no-profile open moves on to a new one
    bool highestFinished = false;

    // Indexes with a finish in progress, at most one finish runs per repository
    std::set<uint32_t> finishing;
};

using RepositoryIndexMap = std::unordered_map<std::string, sRepositoryIndex>;

class LocalRepository : public IRepository {
public:
    // Stage into a fresh, uniquely named temporary directory that is removed again with the repository
    LocalRepository();

    // Stage into an operator supplied directory, which is created if needed and left in place afterwards
    explicit LocalRepository(const boost::filesystem::path& stagingRoot);

    ~LocalRepository() override;

    LocalRepository(const LocalRepository&) = delete;
    auto operator=(const LocalRepository&) -> LocalRepository& = delete;
    LocalRepository(LocalRepository&&) = delete;
    auto operator=(LocalRepository&&) -> LocalRepository& = delete;

    auto start(const std::string& ownerIdentity, const std::string& clientAddress,
               const std::string& namespaceId) -> RepositoryKey override;
    auto openNoProfileRepository(const std::string& ownerIdentity, const std::string& clientAddress)
            -> RepositoryKey override;
    void addFile(const std::vector<std::string>& authorizedNamespaces, const RepositoryKey& repositoryKey,
                 const std::string& relativePath, std::istream& contents) override;
    auto finish(const RepositoryKey& repositoryKey) -> ZipArchive override;
    void release(const RepositoryKey& repositoryKey) override;
    auto getState(const RepositoryKey& repositoryKey) -> RepositoryState override;

    [[nodiscard]] auto getRoot() const -> const boost::filesystem::path& { return root; }

private:
    auto retrieveNewIndex(const RepositoryKey& templateKey) -> uint32_t;
    auto retrieveCurrentNoProfileIndex(const RepositoryKey& templateKey) -> uint32_t;
    void claimFinish(const RepositoryKey& repositoryKey);
    void releaseFinishClaim(const RepositoryKey& repositoryKey, bool bFinished);
    auto packageRepository(const RepositoryKey& repositoryKey) -> ZipArchive;

    void validateRepository(const RepositoryKey& repositoryKey);
    void validateOpenRepository(const RepositoryKey& repositoryKey);

    auto absolutePathForRepository(const RepositoryKey& repositoryKey) const -> boost::filesystem::path;
    auto absolutePathForContents(const RepositoryKey& repositoryKey) const -> boost::filesystem::path;
    auto absolutePathForState(const RepositoryKey& repositoryKey) const -> boost::filesystem::path;
    auto validatedPathInRepository(const RepositoryKey& repositoryKey, const std::string& relativePath) const
            -> boost::filesystem::path;

    void createRepository(const RepositoryKey& repositoryKey);
    void createNoProfileRepository(const RepositoryKey& repositoryKey);
    void writeRepositoryState(const RepositoryKey& repositoryKey, RepositoryState state);
    auto readRepositoryState(const RepositoryKey& repositoryKey) -> std::optional<RepositoryState>;

    boost::filesystem::path root;
    bool ownsRoot;
    folly::Synchronized<RepositoryIndexMap, folly::SharedMutex> repositoryIndexes;

    // Highest no-profile index whose area this instance has created, per owner and address
    folly::Synchronized<std::unordered_map<std::string, uint32_t>> noProfileAreas;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(repositoryIndexes);
EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(createNoProfileRepository, const RepositoryKey&);
};

// True when the namespace is one of the authorized namespaces or a dotted sub-namespace of one
auto isNamespaceAuthorized(const std::vector<std::string>& authorizedNamespaces, const std::string& namespaceId)
        -> bool;

#endif //STAGING_GATEWAY_LOCALREPOSITORY_H
