//
// Filesystem staging area, index allocation and the repository lifecycle
//

#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>
#include <set>
#include <sstream>
#include <thread>

#include "../../Lib/Exceptions.h"
#include "../../tests/utils.h"
#include "../LocalRepository.h"

namespace {
    const std::string OWNER = "alice";
    const std::string ADDRESS = "10.0.0.1";
    const std::string NAMESPACE = "com.example";

    void addContents(LocalRepository& repository, const RepositoryKey& key, const std::string& path,
                     const std::string& contents, const std::vector<std::string>& namespaces = {}) {
        std::stringstream stream(contents);
        repository.addFile(namespaces, key, path, stream);
    }

    // Hands out its data once and then fails, like a client that drops the connection mid upload
    class FailingStreamBuf : public std::streambuf {
    public:
        explicit FailingStreamBuf(std::string data) : data(std::move(data)) {}

    protected:
        auto underflow() -> int_type override {
            if (bServed) {
                throw std::runtime_error("Connection reset");
            }

            bServed = true;
            setg(data.data(), data.data(), data.data() + data.size());
            return traits_type::to_int_type(data.front());
        }

    private:
        std::string data;
        bool bServed = false;
    };
}

BOOST_AUTO_TEST_SUITE(LocalRepository_test_suite)
/*
 * This test suite is responsible for testing the LocalRepository class
 */

    BOOST_AUTO_TEST_CASE(test_start_allocates_indexes) {
        /*
         * Test that start hands out strictly increasing indexes per owner, address and namespace
         */
        LocalRepository repository;

        BOOST_CHECK_EQUAL(repository.start(OWNER, ADDRESS, NAMESPACE).sequenceIndex(), 0);
        BOOST_CHECK_EQUAL(repository.start(OWNER, ADDRESS, NAMESPACE).sequenceIndex(), 1);
        BOOST_CHECK_EQUAL(repository.start(OWNER, ADDRESS, NAMESPACE).sequenceIndex(), 2);

        // Every other triple counts on its own
        BOOST_CHECK_EQUAL(repository.start(OWNER, ADDRESS, "org.other").sequenceIndex(), 0);
        BOOST_CHECK_EQUAL(repository.start("bob", ADDRESS, NAMESPACE).sequenceIndex(), 0);
        BOOST_CHECK_EQUAL(repository.start(OWNER, "10.0.0.2", NAMESPACE).sequenceIndex(), 0);

        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);
        BOOST_CHECK_EQUAL(key.getRepositoryId(), "com.example-3");
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Open);

        // The staging area is laid out under the root
        auto area = repository.getRoot() / OWNER / ADDRESS / "com.example-3";
        BOOST_CHECK(boost::filesystem::is_directory(area / "repository_contents"));
        BOOST_CHECK(boost::filesystem::is_regular_file(area / "repository_state"));

#ifdef BUILD_TESTS
        auto indexes = repository.getrepositoryIndexes()->rlock();
        BOOST_CHECK_EQUAL(indexes->at("alice/10.0.0.1/com.example").highestIndex, 3);
#endif
    }

    BOOST_AUTO_TEST_CASE(test_repository_id_round_trip) {
        /*
         * Test that the identifier handed to clients resolves back to the same key
         */
        LocalRepository repository;

        for (auto count = 0; count < 3; count++) {
            auto key = repository.start("u1", "1.2.3.4", NAMESPACE);
            BOOST_CHECK(RepositoryKey::fromRepositoryId("u1", "1.2.3.4", key.getRepositoryId()) == key);
        }

        auto noProfileKey = repository.openNoProfileRepository("u1", "1.2.3.4");
        BOOST_CHECK(RepositoryKey::fromRepositoryId("u1", "1.2.3.4", noProfileKey.getRepositoryId()) == noProfileKey);

        // Dashes inside the namespace survive
        auto dashedKey = repository.start("u1", "1.2.3.4", "com.my-company");
        BOOST_CHECK_EQUAL(dashedKey.getRepositoryId(), "com.my-company-0");
        BOOST_CHECK(RepositoryKey::fromRepositoryId("u1", "1.2.3.4", dashedKey.getRepositoryId()) == dashedKey);
    }

    BOOST_AUTO_TEST_CASE(test_start_concurrently) {
        /*
         * Test that concurrent starts for the same triple never share an index
         */
        LocalRepository repository;

        const auto threadCount = 8;
        const auto startsPerThread = 16;

        std::vector<std::vector<uint32_t>> results(threadCount);
        std::vector<std::thread> threads;
        for (auto thread = 0; thread < threadCount; thread++) {
            threads.emplace_back([&, thread]() {
                for (auto count = 0; count < startsPerThread; count++) {
                    results[thread].push_back(repository.start(OWNER, ADDRESS, NAMESPACE).sequenceIndex());
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        std::set<uint32_t> indexes;
        for (const auto& result : results) {
            indexes.insert(result.begin(), result.end());
        }

        BOOST_CHECK_EQUAL(indexes.size(), threadCount * startsPerThread);
        BOOST_CHECK_EQUAL(*indexes.begin(), 0);
        BOOST_CHECK_EQUAL(*indexes.rbegin(), threadCount * startsPerThread - 1);
    }

    BOOST_AUTO_TEST_CASE(test_finish_packages_files) {
        /*
         * Test that finish zips every staged file, removes the staged files and closes the repository
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        addContents(repository, key, "a/b.txt", "hello");
        addContents(repository, key, "c.txt", "world");

        auto bundle = repository.finish(key).finish();

        auto entries = readZipEntries(bundle);
        BOOST_CHECK_EQUAL(entries.size(), 2);
        BOOST_CHECK_EQUAL(entries["a/b.txt"], "hello");
        BOOST_CHECK_EQUAL(entries["c.txt"], "world");

        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Closed);
        BOOST_CHECK(!boost::filesystem::exists(
                repository.getRoot() / OWNER / ADDRESS / key.getRepositoryId() / "repository_contents"
        ));

        // A closed repository can't be finished or written to again
        BOOST_CHECK_THROW(repository.finish(key), eValidationError);
        BOOST_CHECK_THROW(addContents(repository, key, "d.txt", "again"), eValidationError);
    }

    BOOST_AUTO_TEST_CASE(test_finish_large_and_empty) {
        /*
         * Test that files larger than a chunk survive intact, and that an empty repository still produces a zip
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        auto data = generateRandomData(1024 * 1024 + 17);
        addContents(repository, key, "com/example/lib/1.0/lib-1.0.jar", std::string(data->begin(), data->end()));

        auto entries = readZipEntries(repository.finish(key).finish());
        BOOST_CHECK_EQUAL(entries.size(), 1);
        BOOST_CHECK(entries["com/example/lib/1.0/lib-1.0.jar"] == std::string(data->begin(), data->end()));

        auto emptyKey = repository.start(OWNER, ADDRESS, NAMESPACE);
        auto emptyArchive = repository.finish(emptyKey);
        BOOST_CHECK_EQUAL(emptyArchive.entryCount(), 0);
        BOOST_CHECK_EQUAL(readZipEntries(emptyArchive.finish()).size(), 0);
    }

    BOOST_AUTO_TEST_CASE(test_add_file_overwrites) {
        /*
         * Test that writing the same path twice keeps the last contents
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        addContents(repository, key, "a.txt", "first version that is longer");
        addContents(repository, key, "a.txt", "second");

        auto entries = readZipEntries(repository.finish(key).finish());
        BOOST_CHECK_EQUAL(entries["a.txt"], "second");
    }

    BOOST_AUTO_TEST_CASE(test_get_state_not_found) {
        /*
         * Test that keys that were never started are reported as not found rather than raising
         */
        LocalRepository repository;

        BOOST_CHECK_EQUAL(repository.getState(RepositoryKey(OWNER, ADDRESS, NAMESPACE, 0)), RepositoryState::NotFound);

        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Open);

        // Beyond the highest index, or somebody else's
        BOOST_CHECK_EQUAL(repository.getState(RepositoryKey(OWNER, ADDRESS, NAMESPACE, 1)), RepositoryState::NotFound);
        BOOST_CHECK_EQUAL(repository.getState(RepositoryKey("bob", ADDRESS, NAMESPACE, 0)), RepositoryState::NotFound);
        BOOST_CHECK_EQUAL(repository.getState(RepositoryKey(OWNER, "10.0.0.2", NAMESPACE, 0)), RepositoryState::NotFound);

        // Keys that could never be laid out on disk
        BOOST_CHECK_EQUAL(repository.getState(RepositoryKey("..", ADDRESS, NAMESPACE, 0)), RepositoryState::NotFound);
    }

    BOOST_AUTO_TEST_CASE(test_stale_keys_rejected) {
        /*
         * Test that keys beyond the allocated range can't be written to or finished
         */
        LocalRepository repository;
        repository.start(OWNER, ADDRESS, NAMESPACE);

        auto forged = RepositoryKey(OWNER, ADDRESS, NAMESPACE, 5);
        BOOST_CHECK_THROW(addContents(repository, forged, "a.txt", "data"), eValidationError);
        BOOST_CHECK_THROW(repository.finish(forged), eValidationError);
        BOOST_CHECK_THROW(repository.release(forged), eValidationError);

        auto otherOwner = RepositoryKey("bob", ADDRESS, NAMESPACE, 0);
        BOOST_CHECK_THROW(addContents(repository, otherOwner, "a.txt", "data"), eValidationError);
    }

    BOOST_AUTO_TEST_CASE(test_path_traversal) {
        /*
         * Test that relative paths can never leave the repository contents
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        for (const auto *path : {
                "../escape.txt",
                "../../other/secret.txt",
                "a/../../escape.txt",
                "a/b/../../../escape.txt",
                "..\\escape.txt",
                "a\\..\\..\\escape.txt",
                "/etc/passwd",
                "\\windows\\system.ini",
                "",
                ".",
                "a/..",
                "./"
        }) {
            BOOST_CHECK_THROW(addContents(repository, key, path, "data"), eValidationError);
        }

        // Nothing escaped
        BOOST_CHECK(!boost::filesystem::exists(repository.getRoot() / OWNER / ADDRESS / "escape.txt"));
        BOOST_CHECK(!boost::filesystem::exists(repository.getRoot() / OWNER / ADDRESS / key.getRepositoryId() / "escape.txt"));

        // Paths that stay inside are normalised
        addContents(repository, key, "a/./b/../c.txt", "inside");
        addContents(repository, key, "d\\e.txt", "backslash");
        addContents(repository, key, "f//g.txt", "doubled");

        auto entries = readZipEntries(repository.finish(key).finish());
        BOOST_CHECK_EQUAL(entries.size(), 3);
        BOOST_CHECK_EQUAL(entries["a/c.txt"], "inside");
        BOOST_CHECK_EQUAL(entries["d/e.txt"], "backslash");
        BOOST_CHECK_EQUAL(entries["f/g.txt"], "doubled");
    }

    BOOST_AUTO_TEST_CASE(test_key_components_rejected) {
        /*
         * Test that owners, addresses and namespaces that would escape the root are refused
         */
        LocalRepository repository;

        BOOST_CHECK_THROW(repository.start("..", ADDRESS, NAMESPACE), eValidationError);
        BOOST_CHECK_THROW(repository.start("a/b", ADDRESS, NAMESPACE), eValidationError);
        BOOST_CHECK_THROW(repository.start(OWNER, "..", NAMESPACE), eValidationError);
        BOOST_CHECK_THROW(repository.start(OWNER, ADDRESS, "../../x"), eValidationError);
        BOOST_CHECK_THROW(repository.start(OWNER, ADDRESS, "a\\b"), eValidationError);
        BOOST_CHECK_THROW(repository.start(OWNER, ADDRESS, ""), eValidationError);
        BOOST_CHECK_THROW(repository.start("", ADDRESS, NAMESPACE), eValidationError);
        BOOST_CHECK_THROW(repository.openNoProfileRepository("..", ADDRESS), eValidationError);

#ifdef BUILD_TESTS
        // No index was spent on them
        BOOST_CHECK_EQUAL(repository.getrepositoryIndexes()->rlock()->size(), 0);
#endif
    }

    BOOST_AUTO_TEST_CASE(test_namespace_authorization) {
        /*
         * Test that files are only accepted for namespaces the caller may publish to
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        BOOST_CHECK_THROW(addContents(repository, key, "a.txt", "data", {"org.other"}), eValidationError);
        BOOST_CHECK_THROW(addContents(repository, key, "a.txt", "data", {"com.exam"}), eValidationError);
        BOOST_CHECK_THROW(addContents(repository, key, "a.txt", "data", {"com.example.sub"}), eValidationError);

        BOOST_CHECK_NO_THROW(addContents(repository, key, "a.txt", "data", {"org.other", "com.example"}));
        BOOST_CHECK_NO_THROW(addContents(repository, key, "b.txt", "data", {"com"}));

        // Unknown namespaces are left for the publishing service to check
        BOOST_CHECK_NO_THROW(addContents(repository, key, "c.txt", "data", {}));

        // No-profile repositories don't declare a namespace to check
        auto noProfileKey = repository.openNoProfileRepository(OWNER, ADDRESS);
        BOOST_CHECK_NO_THROW(addContents(repository, noProfileKey, "d.txt", "data", {"org.other"}));

        BOOST_CHECK_EQUAL(isNamespaceAuthorized({"com.example"}, "com.example"), true);
        BOOST_CHECK_EQUAL(isNamespaceAuthorized({"com.example"}, "com.example.tools"), true);
        BOOST_CHECK_EQUAL(isNamespaceAuthorized({"com.example"}, "com.examples"), false);
        BOOST_CHECK_EQUAL(isNamespaceAuthorized({}, "com.example"), false);
    }

    BOOST_AUTO_TEST_CASE(test_no_profile_repository) {
        /*
         * Test that no-profile uploads share one repository until it is finished
         */
        LocalRepository repository;

        auto first = repository.openNoProfileRepository(OWNER, ADDRESS);
        auto second = repository.openNoProfileRepository(OWNER, ADDRESS);
        BOOST_CHECK(first == second);
        BOOST_CHECK_EQUAL(first.getRepositoryId(), "no-profile-0");
        BOOST_CHECK_EQUAL(repository.getState(first), RepositoryState::Open);

        addContents(repository, first, "a.txt", "one");
        addContents(repository, second, "b.txt", "two");

        // Rejoining doesn't disturb what was staged
        repository.openNoProfileRepository(OWNER, ADDRESS);
        auto entries = readZipEntries(repository.finish(first).finish());
        BOOST_CHECK_EQUAL(entries.size(), 2);

        // A finished repository is never handed out again
        auto next = repository.openNoProfileRepository(OWNER, ADDRESS);
        BOOST_CHECK_EQUAL(next.sequenceIndex(), 1);
        BOOST_CHECK_EQUAL(repository.getState(next), RepositoryState::Open);
        BOOST_CHECK_EQUAL(repository.getState(first), RepositoryState::Closed);

        // Other callers get their own
        BOOST_CHECK_EQUAL(repository.openNoProfileRepository(OWNER, "10.0.0.2").sequenceIndex(), 0);
        BOOST_CHECK_EQUAL(repository.openNoProfileRepository("bob", ADDRESS).sequenceIndex(), 0);
    }

    BOOST_AUTO_TEST_CASE(test_no_profile_late_creation) {
        /*
         * Test that a caller that allocated the no-profile repository but created its area late can't reopen it
         * after another caller already finished it
         */
        LocalRepository repository;

        auto key = repository.openNoProfileRepository(OWNER, ADDRESS);
        addContents(repository, key, "a.txt", "one");
        repository.finish(key);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Closed);

#ifdef BUILD_TESTS
        repository.callcreateNoProfileRepository(key);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Closed);
        BOOST_CHECK(!boost::filesystem::exists(repository.getRoot() / OWNER / ADDRESS / "no-profile-0" /
                                               "repository_contents"));
#endif

        BOOST_CHECK_EQUAL(repository.openNoProfileRepository(OWNER, ADDRESS).sequenceIndex(), 1);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Closed);
    }

    BOOST_AUTO_TEST_CASE(test_no_profile_concurrently) {
        /*
         * Test that concurrent no-profile uploads and finishes never reopen a finished repository
         */
        LocalRepository repository;

        const auto threadCount = 8;
        const auto roundsPerThread = 16;

        std::vector<std::vector<RepositoryKey>> finished(threadCount);
        std::vector<std::thread> threads;
        for (auto thread = 0; thread < threadCount; thread++) {
            threads.emplace_back([&, thread]() {
                for (auto round = 0; round < roundsPerThread; round++) {
                    auto key = repository.openNoProfileRepository(OWNER, ADDRESS);
                    try {
                        addContents(repository, key, "file-" + std::to_string(thread) + ".txt", "data");
                        repository.finish(key);
                        finished[thread].push_back(key);
                    } catch (std::runtime_error&) {
                        // Another thread closed the repository first, or removed the staged files under this upload
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        for (const auto& keys : finished) {
            for (const auto& key : keys) {
                BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Closed);
            }
        }
    }

    BOOST_AUTO_TEST_CASE(test_finish_concurrently) {
        /*
         * Test that concurrent finishes of one repository produce exactly one archive
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);
        addContents(repository, key, "a.txt", "hello");

        const auto threadCount = 8;

        std::vector<std::vector<uint8_t>> archives(threadCount);
        std::vector<bool> rejected(threadCount, false);
        std::vector<std::thread> threads;
        for (auto thread = 0; thread < threadCount; thread++) {
            threads.emplace_back([&, thread]() {
                try {
                    archives[thread] = repository.finish(key).finish();
                } catch (eValidationError&) {
                    rejected[thread] = true;
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        BOOST_CHECK_EQUAL(std::count(rejected.begin(), rejected.end(), true), threadCount - 1);
        for (auto thread = 0; thread < threadCount; thread++) {
            if (!rejected[thread]) {
                BOOST_CHECK_EQUAL(readZipEntries(archives[thread])["a.txt"], "hello");
            }
        }
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Closed);

        // A failed finish gives up its claim, so the repository can still be finished afterwards
        auto other = repository.start(OWNER, ADDRESS, NAMESPACE);
        auto statePath = repository.getRoot() / OWNER / ADDRESS / other.getRepositoryId() / "repository_state";
        boost::filesystem::remove(statePath);
        BOOST_CHECK_THROW(repository.finish(other), eValidationError);

        {
            boost::filesystem::ofstream stateFile(statePath);
            stateFile << "open";
        }
        BOOST_CHECK_NO_THROW(repository.finish(other));
        BOOST_CHECK_EQUAL(repository.getState(other), RepositoryState::Closed);
    }

    BOOST_AUTO_TEST_CASE(test_release) {
        /*
         * Test the Closed -> Released transition
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        // Must be closed first
        BOOST_CHECK_THROW(repository.release(key), eValidationError);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Open);

        repository.finish(key);
        repository.release(key);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Released);

        // Releasing again changes nothing
        BOOST_CHECK_NO_THROW(repository.release(key));
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::Released);

        // Never back to open
        BOOST_CHECK_THROW(addContents(repository, key, "a.txt", "data"), eValidationError);
        BOOST_CHECK_THROW(repository.finish(key), eValidationError);
    }

    BOOST_AUTO_TEST_CASE(test_corrupt_state_marker) {
        /*
         * Test that an unreadable state marker is a storage failure rather than a missing repository
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        auto statePath = repository.getRoot() / OWNER / ADDRESS / key.getRepositoryId() / "repository_state";
        {
            boost::filesystem::ofstream stateFile(statePath, std::ios::trunc);
            stateFile << "garbage";
        }
        BOOST_CHECK_THROW(repository.getState(key), eStorageError);

        // A missing marker means there is no repository
        boost::filesystem::remove(statePath);
        BOOST_CHECK_EQUAL(repository.getState(key), RepositoryState::NotFound);
    }

    BOOST_AUTO_TEST_CASE(test_partial_write_visible) {
        /*
         * Test that a failing upload stream raises and leaves what was already written in place
         */
        LocalRepository repository;
        auto key = repository.start(OWNER, ADDRESS, NAMESPACE);

        FailingStreamBuf streamBuf("partial");
        std::istream stream(&streamBuf);
        BOOST_CHECK_THROW(repository.addFile({}, key, "a.txt", stream), std::runtime_error);

        auto entries = readZipEntries(repository.finish(key).finish());
        BOOST_CHECK_EQUAL(entries["a.txt"], "partial");
    }

    BOOST_AUTO_TEST_CASE(test_root_ownership) {
        /*
         * Test that a temporary root is removed with the repository and a configured one is kept
         */
        boost::filesystem::path temporaryRoot;
        {
            LocalRepository repository;
            temporaryRoot = repository.getRoot();
            repository.start(OWNER, ADDRESS, NAMESPACE);
            BOOST_CHECK(boost::filesystem::is_directory(temporaryRoot));
            BOOST_CHECK(temporaryRoot.filename().string().rfind("local-repository-", 0) == 0);
        }
        BOOST_CHECK(!boost::filesystem::exists(temporaryRoot));

        auto configuredRoot = boost::filesystem::temp_directory_path() /
                              boost::filesystem::unique_path("staging-root-%%%%-%%%%");
        {
            LocalRepository repository(configuredRoot);
            repository.start(OWNER, ADDRESS, NAMESPACE);
        }
        BOOST_CHECK(boost::filesystem::is_directory(configuredRoot / OWNER));
        boost::filesystem::remove_all(configuredRoot);
    }

BOOST_AUTO_TEST_SUITE_END()
