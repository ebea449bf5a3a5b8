//
// Lifecycle of a staging repository: Open -> Closed -> Released
//

#include "RepositoryState.h"
#include <boost/algorithm/string/trim.hpp>
#include <stdexcept>

auto repositoryStateToString(RepositoryState state) -> std::string
{
    switch (state) {
        case RepositoryState::Open:
            return "open";
        case RepositoryState::Closed:
            return "closed";
        case RepositoryState::Released:
            return "released";
        case RepositoryState::NotFound:
            return "not_found";
    }

    throw std::invalid_argument("Unknown repository state");
}

auto repositoryStateFromString(const std::string& value) -> RepositoryState
{
    auto token = boost::algorithm::trim_copy(value);

    if (token == "open") {
        return RepositoryState::Open;
    }
    if (token == "closed") {
        return RepositoryState::Closed;
    }
    if (token == "released") {
        return RepositoryState::Released;
    }
    if (token == "not_found") {
        return RepositoryState::NotFound;
    }

    throw std::invalid_argument("Could not convert " + token + " into a repository state");
}

auto operator<<(std::ostream& stream, RepositoryState state) -> std::ostream&
{
    return stream << repositoryStateToString(state);
}
