//
// Lifecycle of a staging repository: Open -> Closed -> Released
//

#ifndef STAGING_GATEWAY_REPOSITORYSTATE_H
#define STAGING_GATEWAY_REPOSITORYSTATE_H

#include <ostream>
#include <string>

enum class RepositoryState {
    Open,
    Closed,
    Released,
    // Never persisted, reported for keys that don't resolve to a repository
    NotFound
};

auto repositoryStateToString(RepositoryState state) -> std::string;

// Throws std::invalid_argument for anything other than one of the four lowercase tokens
auto repositoryStateFromString(const std::string& value) -> RepositoryState;

auto operator<<(std::ostream& stream, RepositoryState state) -> std::ostream&;

#endif //STAGING_GATEWAY_REPOSITORYSTATE_H
