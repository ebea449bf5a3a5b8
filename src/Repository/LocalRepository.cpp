//
// Filesystem backed staging repositories
//

#include "LocalRepository.h"
#include "../Lib/Exceptions.h"
#include "../Settings.h"
#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <iostream>
#include <iterator>
#include <sstream>

namespace {
    // Allocator entries are shared by every repository of the same owner, address and namespace
    auto indexKey(const RepositoryKey& repositoryKey) -> std::string
    {
        return repositoryKey.ownerIdentity() + "/" + repositoryKey.getClientAddress() + "/" +
               repositoryKey.getNamespace();
    }

    // Each part of the key becomes exactly one directory below the root
    void checkPathComponent(const std::string& component, const RepositoryKey& repositoryKey)
    {
        if (component.empty() || component == "." || component == ".." ||
            component.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
            throw eValidationError("Invalid repository: " + repositoryKey.toString());
        }
    }

    void throwStorageError(const std::string& what, const boost::system::error_code& errorCode)
    {
        throw eStorageError(what + ": " + errorCode.message());
    }
}

auto isNamespaceAuthorized(const std::vector<std::string>& authorizedNamespaces, const std::string& namespaceId)
        -> bool
{
    return std::any_of(authorizedNamespaces.begin(), authorizedNamespaces.end(), [&](const auto& authorized) {
        return namespaceId == authorized || boost::algorithm::starts_with(namespaceId, authorized + ".");
    });
}

LocalRepository::LocalRepository() : ownsRoot(true)
{
    boost::system::error_code errorCode;

    auto tempDirectory = boost::filesystem::temp_directory_path(errorCode);
    if (errorCode) {
        throwStorageError("Unable to find the temporary directory", errorCode);
    }

    auto candidate = tempDirectory /
                     boost::filesystem::unique_path(std::string(REPOSITORY_ROOT_PREFIX) + "-%%%%-%%%%-%%%%-%%%%");
    boost::filesystem::create_directories(candidate, errorCode);
    if (errorCode) {
        throwStorageError("Unable to create the staging root " + candidate.string(), errorCode);
    }

    root = boost::filesystem::canonical(candidate, errorCode);
    if (errorCode) {
        throwStorageError("Unable to resolve the staging root " + candidate.string(), errorCode);
    }

    std::cout << "Staging: Created new local repository: " << root << std::endl;
}

LocalRepository::LocalRepository(const boost::filesystem::path& stagingRoot) : ownsRoot(false)
{
    boost::system::error_code errorCode;

    boost::filesystem::create_directories(stagingRoot, errorCode);
    if (errorCode) {
        throwStorageError("Unable to create the staging root " + stagingRoot.string(), errorCode);
    }

    root = boost::filesystem::canonical(stagingRoot, errorCode);
    if (errorCode) {
        throwStorageError("Unable to resolve the staging root " + stagingRoot.string(), errorCode);
    }

    std::cout << "Staging: Using local repository: " << root << std::endl;
}

LocalRepository::~LocalRepository()
{
    if (!ownsRoot) {
        return;
    }

    boost::system::error_code errorCode;
    boost::filesystem::remove_all(root, errorCode);
    if (errorCode) {
        std::cerr << "Staging: Failed to clean up " << root << ": " << errorCode.message() << std::endl;
    }
}

auto LocalRepository::start(const std::string& ownerIdentity, const std::string& clientAddress,
                            const std::string& namespaceId) -> RepositoryKey
{
    if (namespaceId.empty()) {
        throw eValidationError("A namespace is required to start a repository");
    }

    // Check the key can be laid out on disk before an index is spent on it
    auto repositoryKey = RepositoryKey(ownerIdentity, clientAddress, namespaceId, 0);
    absolutePathForRepository(repositoryKey);

    repositoryKey = RepositoryKey(ownerIdentity, clientAddress, namespaceId, retrieveNewIndex(repositoryKey));
    std::cout << "Staging: Starting repository " << repositoryKey << std::endl;

    createRepository(repositoryKey);

    return repositoryKey;
}

auto LocalRepository::openNoProfileRepository(const std::string& ownerIdentity, const std::string& clientAddress)
        -> RepositoryKey
{
    auto repositoryKey = RepositoryKey(ownerIdentity, clientAddress, std::nullopt, 0);
    absolutePathForRepository(repositoryKey);

    repositoryKey = RepositoryKey(ownerIdentity, clientAddress, std::nullopt,
                                  retrieveCurrentNoProfileIndex(repositoryKey));

    // A caller rejoining the current repository may overtake the one that allocated it, whichever gets there
    // first creates the area
    createNoProfileRepository(repositoryKey);

    return repositoryKey;
}

void LocalRepository::addFile(const std::vector<std::string>& authorizedNamespaces,
                              const RepositoryKey& repositoryKey, const std::string& relativePath,
                              std::istream& contents)
{
    validateOpenRepository(repositoryKey);

    if (repositoryKey.hasNamespace() && !authorizedNamespaces.empty() &&
        !isNamespaceAuthorized(authorizedNamespaces, repositoryKey.getNamespace())) {
        throw eValidationError("Not authorized to publish to namespace " + repositoryKey.getNamespace());
    }

    auto filePath = validatedPathInRepository(repositoryKey, relativePath);

    boost::system::error_code errorCode;
    boost::filesystem::create_directories(filePath.parent_path(), errorCode);
    if (errorCode) {
        throwStorageError("Failed to create repository folders for " + filePath.string(), errorCode);
    }

    boost::filesystem::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw eStorageError("Failed to create " + filePath.string());
    }

    // Copy the body across in chunks so large artifacts never sit in memory as a whole
    std::vector<char> chunk(UPLOAD_CHUNK_SIZE);
    while (contents) {
        contents.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto count = contents.gcount();
        if (count <= 0) {
            break;
        }

        file.write(chunk.data(), count);
        if (!file) {
            throw eStorageError("Failed to write " + filePath.string());
        }
    }

    file.close();
    if (file.fail()) {
        throw eStorageError("Failed to flush " + filePath.string());
    }

    // Whatever was written so far stays in place
    if (contents.bad()) {
        throw std::runtime_error("Issue with the request body while writing " + relativePath);
    }
}

auto LocalRepository::finish(const RepositoryKey& repositoryKey) -> ZipArchive
{
    std::cout << "Staging: Finishing repository " << repositoryKey << std::endl;
    validateRepository(repositoryKey);
    claimFinish(repositoryKey);

    try {
        auto zipFile = packageRepository(repositoryKey);
        releaseFinishClaim(repositoryKey, true);
        return zipFile;
    } catch (...) {
        releaseFinishClaim(repositoryKey, false);
        throw;
    }
}

auto LocalRepository::packageRepository(const RepositoryKey& repositoryKey) -> ZipArchive
{
    // Checked again under the claim, an earlier finish may have closed it in the meantime
    validateOpenRepository(repositoryKey);

    auto contentsPath = absolutePathForContents(repositoryKey);

    // Create the zip file from all of the staged files, directories are only traversed
    ZipArchive zipFile;

    boost::system::error_code errorCode;
    boost::filesystem::recursive_directory_iterator entry(contentsPath, errorCode);
    const boost::filesystem::recursive_directory_iterator end;
    for (; !errorCode && entry != end; entry.increment(errorCode)) {
        if (!boost::filesystem::is_regular_file(entry->symlink_status())) {
            continue;
        }

        auto relativePath = entry->path().lexically_relative(contentsPath).generic_string();
        zipFile.addFile(relativePath, entry->path());
    }

    if (errorCode) {
        throwStorageError("Failed to walk " + contentsPath.string(), errorCode);
    }

    std::cout << "Staging: Created .zip file with " << zipFile.entryCount() << " entries for " << repositoryKey
              << std::endl;

    // Delete the staged files, the archive is the only copy from here on
    boost::filesystem::remove_all(contentsPath, errorCode);
    if (errorCode) {
        throwStorageError("Failed to clean up " + contentsPath.string(), errorCode);
    }

    writeRepositoryState(repositoryKey, RepositoryState::Closed);

    return zipFile;
}

void LocalRepository::release(const RepositoryKey& repositoryKey)
{
    std::cout << "Staging: Releasing repository " << repositoryKey << std::endl;
    validateRepository(repositoryKey);

    auto state = readRepositoryState(repositoryKey);
    if (!state) {
        throw eValidationError("Repository " + repositoryKey.toString() + " does not exist");
    }

    if (*state == RepositoryState::Open) {
        throw eValidationError("Repository " + repositoryKey.toString() + " must be closed before it is released");
    }

    writeRepositoryState(repositoryKey, RepositoryState::Released);
}

auto LocalRepository::getState(const RepositoryKey& repositoryKey) -> RepositoryState
{
    try {
        validateRepository(repositoryKey);
    } catch (eValidationError& e) {
        std::cout << "Staging: " << e.what() << std::endl;
        return RepositoryState::NotFound;
    }

    return readRepositoryState(repositoryKey).value_or(RepositoryState::NotFound);
}

auto LocalRepository::retrieveNewIndex(const RepositoryKey& templateKey) -> uint32_t
{
    auto indexes = repositoryIndexes.wlock();

    auto [entry, bInserted] = indexes->try_emplace(indexKey(templateKey));
    if (!bInserted) {
        entry->second.highestIndex++;
    }
    entry->second.highestFinished = false;

    return entry->second.highestIndex;
}

auto LocalRepository::retrieveCurrentNoProfileIndex(const RepositoryKey& templateKey) -> uint32_t
{
    auto indexes = repositoryIndexes.wlock();

    auto [entry, bInserted] = indexes->try_emplace(indexKey(templateKey));

    // Never hand out a finished repository again, move on to the next one instead
    if (!bInserted && entry->second.highestFinished) {
        entry->second.highestIndex++;
        entry->second.highestFinished = false;
    }

    return entry->second.highestIndex;
}

void LocalRepository::claimFinish(const RepositoryKey& repositoryKey)
{
    auto indexes = repositoryIndexes.wlock();

    auto entry = indexes->find(indexKey(repositoryKey));
    if (entry == indexes->end()) {
        throw eValidationError("Repository " + repositoryKey.toString() + " does not exist");
    }

    if (!entry->second.finishing.insert(repositoryKey.sequenceIndex()).second) {
        throw eValidationError("Repository " + repositoryKey.toString() + " is already being finished");
    }
}

void LocalRepository::releaseFinishClaim(const RepositoryKey& repositoryKey, bool bFinished)
{
    auto indexes = repositoryIndexes.wlock();

    auto entry = indexes->find(indexKey(repositoryKey));
    if (entry == indexes->end()) {
        return;
    }

    entry->second.finishing.erase(repositoryKey.sequenceIndex());
    if (bFinished && entry->second.highestIndex == repositoryKey.sequenceIndex()) {
        entry->second.highestFinished = true;
    }
}

void LocalRepository::validateRepository(const RepositoryKey& repositoryKey)
{
    absolutePathForRepository(repositoryKey);

    auto indexes = repositoryIndexes.rlock();

    auto entry = indexes->find(indexKey(repositoryKey));
    if (entry == indexes->end()) {
        throw eValidationError("Repository " + repositoryKey.toString() + " does not exist");
    }

    if (entry->second.highestIndex < repositoryKey.sequenceIndex()) {
        throw eValidationError(
                "Repository " + repositoryKey.toString() + " larger than " +
                std::to_string(entry->second.highestIndex)
        );
    }
}

void LocalRepository::validateOpenRepository(const RepositoryKey& repositoryKey)
{
    validateRepository(repositoryKey);

    auto state = readRepositoryState(repositoryKey);
    if (!state) {
        throw eValidationError("Repository " + repositoryKey.toString() + " does not exist");
    }

    if (*state != RepositoryState::Open) {
        throw eValidationError(
                "Repository " + repositoryKey.toString() + " is " + repositoryStateToString(*state) +
                ", not open"
        );
    }
}

auto LocalRepository::absolutePathForRepository(const RepositoryKey& repositoryKey) const -> boost::filesystem::path
{
    checkPathComponent(repositoryKey.ownerIdentity(), repositoryKey);
    checkPathComponent(repositoryKey.getClientAddress(), repositoryKey);
    checkPathComponent(repositoryKey.getRepositoryId(), repositoryKey);

    return root / repositoryKey.ownerIdentity() / repositoryKey.getClientAddress() / repositoryKey.getRepositoryId();
}

auto LocalRepository::absolutePathForContents(const RepositoryKey& repositoryKey) const -> boost::filesystem::path
{
    return absolutePathForRepository(repositoryKey) / REPOSITORY_FOLDER;
}

auto LocalRepository::absolutePathForState(const RepositoryKey& repositoryKey) const -> boost::filesystem::path
{
    return absolutePathForRepository(repositoryKey) / REPOSITORY_STATE_FILE;
}

auto LocalRepository::validatedPathInRepository(const RepositoryKey& repositoryKey,
                                                const std::string& relativePath) const -> boost::filesystem::path
{
    // Both separators are honoured so the result doesn't depend on the platform the client runs on. An absolute
    // path would resolve outside the repository, so it is refused rather than re-rooted
    if (relativePath.empty() || relativePath.front() == '/' || relativePath.front() == '\\' ||
        relativePath.find('\0') != std::string::npos) {
        throw eValidationError("Invalid path to upload: " + relativePath);
    }

    std::vector<std::string> segments;
    boost::split(segments, relativePath, boost::is_any_of("/\\"));

    std::vector<std::string> resolved;
    for (const auto& segment : segments) {
        if (segment.empty() || segment == ".") {
            continue;
        }

        if (segment == "..") {
            if (resolved.empty()) {
                throw eValidationError("Invalid path to upload: " + relativePath);
            }
            resolved.pop_back();
            continue;
        }

        resolved.push_back(segment);
    }

    if (resolved.empty()) {
        throw eValidationError("Invalid path to upload: " + relativePath);
    }

    auto filePath = absolutePathForContents(repositoryKey);
    for (const auto& segment : resolved) {
        filePath /= segment;
    }

    return filePath;
}

void LocalRepository::createRepository(const RepositoryKey& repositoryKey)
{
    auto contentsPath = absolutePathForContents(repositoryKey);

    boost::system::error_code errorCode;
    boost::filesystem::create_directories(contentsPath, errorCode);
    if (errorCode) {
        throwStorageError("Failed to create repository folders " + contentsPath.string(), errorCode);
    }

    writeRepositoryState(repositoryKey, RepositoryState::Open);
}

void LocalRepository::createNoProfileRepository(const RepositoryKey& repositoryKey)
{
    // Held across the creation, so a caller rejoining the repository waits for the one creating it and a slow
    // creator can't reopen a repository that has been finished in the meantime
    auto createdAreas = noProfileAreas.wlock();

    auto entry = createdAreas->find(indexKey(repositoryKey));
    if (entry != createdAreas->end() && entry->second >= repositoryKey.sequenceIndex()) {
        return;
    }

    std::cout << "Staging: Opening repository " << repositoryKey << std::endl;
    createRepository(repositoryKey);
    (*createdAreas)[indexKey(repositoryKey)] = repositoryKey.sequenceIndex();
}

void LocalRepository::writeRepositoryState(const RepositoryKey& repositoryKey, RepositoryState state)
{
    auto statePath = absolutePathForState(repositoryKey);

    boost::filesystem::ofstream stateFile(statePath, std::ios::trunc);
    stateFile << repositoryStateToString(state);
    stateFile.close();

    if (stateFile.fail()) {
        throw eStorageError("Failed to write the repository state to " + statePath.string());
    }
}

auto LocalRepository::readRepositoryState(const RepositoryKey& repositoryKey) -> std::optional<RepositoryState>
{
    auto statePath = absolutePathForState(repositoryKey);

    boost::system::error_code errorCode;
    if (!boost::filesystem::exists(statePath, errorCode)) {
        if (errorCode) {
            throwStorageError("Failed to check " + statePath.string(), errorCode);
        }
        return std::nullopt;
    }

    boost::filesystem::ifstream stateFile(statePath);
    if (!stateFile.is_open()) {
        throw eStorageError("Failed to read the repository state from " + statePath.string());
    }

    std::stringstream stateString;
    stateString << stateFile.rdbuf();

    try {
        return repositoryStateFromString(stateString.str());
    } catch (std::invalid_argument& e) {
        throw eStorageError("Corrupt repository state in " + statePath.string() + ": " + e.what());
    }
}
