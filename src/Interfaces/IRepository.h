//
// Interface for the staging repository engine
// Callers only see this so alternate storage backends can be substituted for the local filesystem one
//

#ifndef STAGING_GATEWAY_I_REPOSITORY_H
#define STAGING_GATEWAY_I_REPOSITORY_H

#include "../Repository/RepositoryKey.h"
#include "../Repository/RepositoryState.h"
#include "../Repository/ZipArchive.h"
#include <istream>
#include <string>
#include <vector>

class IRepository {
public:
    virtual ~IRepository() = default;

    // Open a new repository for the owner and namespace, always allocating a fresh index
    virtual auto start(const std::string& ownerIdentity, const std::string& clientAddress,
                       const std::string& namespaceId) -> RepositoryKey = 0;

    // Open (or rejoin) the repository used by uploads that never declared a namespace. Repositories are told apart
    // only by owner and client address
    virtual auto openNoProfileRepository(const std::string& ownerIdentity, const std::string& clientAddress)
            -> RepositoryKey = 0;

    // Stream the contents into relativePath inside the repository. Assumes the same path of the same repository
    // isn't written by two requests at once, and leaves whatever was written in place if the stream fails
    virtual void addFile(const std::vector<std::string>& authorizedNamespaces, const RepositoryKey& repositoryKey,
                         const std::string& relativePath, std::istream& contents) = 0;

    // Package everything staged so far, remove the staged files and close the repository. Only one finish runs
    // per repository at a time, a concurrent finish of the same key is rejected with a validation error
    virtual auto finish(const RepositoryKey& repositoryKey) -> ZipArchive = 0;

    virtual void release(const RepositoryKey& repositoryKey) = 0;

    // Never throws for an unknown key, that is reported as RepositoryState::NotFound
    virtual auto getState(const RepositoryKey& repositoryKey) -> RepositoryState = 0;
};

#endif //STAGING_GATEWAY_I_REPOSITORY_H
