//
// Packages a staging repository and forwards it to the publishing service
//

#ifndef STAGING_GATEWAY_PUBLISHER_H
#define STAGING_GATEWAY_PUBLISHER_H

#include "../Interfaces/IPortalClient.h"
#include "../Interfaces/IRepository.h"
#include <memory>

class Publisher {
public:
    Publisher(std::shared_ptr<IRepository> repository, std::shared_ptr<IPortalClient> portalClient);

    // Finish the repository and upload its archive, returning the deployment id. The staged files are gone once
    // the repository is finished, so a failed upload can't be retried without staging again
    auto publish(const Credentials& credentials, const RepositoryKey& repositoryKey, PublishingType publishingType)
            -> std::string;

private:
    std::shared_ptr<IRepository> repository;
    std::shared_ptr<IPortalClient> portalClient;
};

#endif //STAGING_GATEWAY_PUBLISHER_H
