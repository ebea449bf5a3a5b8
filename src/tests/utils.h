#ifndef STAGING_GATEWAY_UTILS_H
#define STAGING_GATEWAY_UTILS_H

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/ptree.hpp>
#include <client_http.hpp>
#include <server_http.hpp>

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>;

// Read every entry of a zip file into a map of entry name to contents
auto readZipEntries(const std::vector<uint8_t>& zipData) -> std::map<std::string, std::string>;

// Read the entry names of a zip file in the order they were written
auto readZipEntryNames(const std::vector<uint8_t>& zipData) -> std::vector<std::string>;

// Parse an XML response body
auto parseXml(const std::string& xml) -> boost::property_tree::ptree;

/**
 * RAII class for creating a temporary file that is automatically cleaned up
 * Uses portable std::filesystem for temporary directory and random filenames
 */
class TemporaryFile
{
public:
    explicit TemporaryFile(const std::string& content, const std::string& extension = ".pem")
    {
        // Generate a random filename in the temp directory
        filepath = generateTempFilePath(extension);

        // Write the content to the file
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to create temporary file: " + filepath.string());
        }
        file << content;
        file.close();
    }

    ~TemporaryFile()
    {
        // Clean up the temporary file
        std::error_code ec;
        std::filesystem::remove(filepath, ec);
        // Ignore errors during cleanup (file might already be deleted)
    }

    // Delete copy constructor and assignment operator
    TemporaryFile(const TemporaryFile&)            = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;
    TemporaryFile(TemporaryFile&&)                 = delete;
    TemporaryFile& operator=(TemporaryFile&&)      = delete;

    [[nodiscard]] auto path() const -> std::string
    {
        return filepath.string();
    }

private:
    std::filesystem::path filepath;

    static auto generateTempFilePath(const std::string& extension) -> std::filesystem::path
    {
        // Get system temp directory
        auto tempDir = std::filesystem::temp_directory_path();

        // Generate random filename
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<uint64_t> dis(0, std::numeric_limits<uint64_t>::max());

        std::stringstream ss;
        ss << "test_file_" << std::hex << std::setfill('0') << std::setw(16) << dis(gen) << extension;

        return tempDir / ss.str();
    }
};

/**
 * RAII helper that sets an environment variable, or clears it when no value is given, and restores the
 * previous value when it goes out of scope
 */
class ScopedEnvironment
{
public:
    ScopedEnvironment(std::string name, const std::optional<std::string>& value) : name(std::move(name))
    {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        if (const auto* current = std::getenv(this->name.c_str()); current != nullptr)
        {
            previous = current;
        }

        apply(value);
    }

    ~ScopedEnvironment()
    {
        apply(previous);
    }

    ScopedEnvironment(const ScopedEnvironment&)            = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;
    ScopedEnvironment(ScopedEnvironment&&)                 = delete;
    ScopedEnvironment& operator=(ScopedEnvironment&&)      = delete;

private:
    void apply(const std::optional<std::string>& value)
    {
        // NOLINTBEGIN(concurrency-mt-unsafe)
        if (value)
        {
            setenv(name.c_str(), value->c_str(), 1);
        }
        else
        {
            unsetenv(name.c_str());
        }
        // NOLINTEND(concurrency-mt-unsafe)
    }

    std::string name;
    std::optional<std::string> previous;
};

using TestHttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;
using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // STAGING_GATEWAY_UTILS_H
