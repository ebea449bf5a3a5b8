//
// Packages a staging repository and forwards it to the publishing service
//

#include "Publisher.h"
#include "../Settings.h"
#include <iostream>
#include <utility>

Publisher::Publisher(std::shared_ptr<IRepository> repository, std::shared_ptr<IPortalClient> portalClient)
    : repository(std::move(repository)), portalClient(std::move(portalClient))
{}

auto Publisher::publish(const Credentials& credentials, const RepositoryKey& repositoryKey,
                        PublishingType publishingType) -> std::string
{
    std::cout << "Publish: Publishing " << repositoryKey << " as " << publishingType << std::endl;

    auto bundle = repository->finish(repositoryKey).finish();

    return portalClient->upload(
            credentials,
            repositoryKey.getRepositoryId() + DEPLOYMENT_NAME_SUFFIX,
            publishingType,
            bundle
    );
}
